#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "../cli/Options.hpp"
#include "../cli/RenamePrompt.hpp"

using namespace lan_watch::cli;
using lan_watch::core::MatchPolicy;
using lan_watch::core::ProbeMethod;

namespace {

// Owns the strings backing an argv array.
class Argv
{
public:
    Argv(std::initializer_list<std::string> args) : m_args(args)
    {
        m_args.insert(m_args.begin(), "lanwatch");
        for (auto &arg : m_args)
            m_ptrs.push_back(&arg[0]);
        m_ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(m_args.size()); }
    char **argv() { return m_ptrs.data(); }

private:
    std::vector<std::string> m_args;
    std::vector<char *> m_ptrs;
};

Options Parse(std::initializer_list<std::string> args)
{
    Argv argv(args);
    return ParseOptions(argv.argc(), argv.argv());
}

} // namespace

TEST(OptionsTest, DefaultsWithoutArguments)
{
    Options options = Parse({});
    const auto &config = options.config;

    EXPECT_FALSE(options.show_help);
    EXPECT_FALSE(config.list_only);
    EXPECT_FALSE(config.interactive_rename);
    EXPECT_TRUE(config.watched_ids.empty());
    EXPECT_EQ(config.interval, std::chrono::seconds(5));
    EXPECT_EQ(config.discovery.timeout, std::chrono::milliseconds(600));
    EXPECT_EQ(config.monitor.timeout, std::chrono::milliseconds(1000));
    EXPECT_EQ(config.discovery.miss_limit, 3);
    EXPECT_EQ(config.match_policy, MatchPolicy::HardwareAddress);
    EXPECT_EQ(config.probe_method, ProbeMethod::PingCommand);
    EXPECT_EQ(config.db_path, "clients.db");
    EXPECT_EQ(config.arp_table, "/proc/net/arp");
    EXPECT_TRUE(config.vendor_enabled);
}

TEST(OptionsTest, ModeFlags)
{
    EXPECT_TRUE(Parse({"-c"}).config.list_only);
    EXPECT_TRUE(Parse({"--connections"}).config.list_only);
    EXPECT_TRUE(Parse({"-r"}).config.interactive_rename);
    EXPECT_TRUE(Parse({"--help"}).show_help);
    EXPECT_TRUE(Parse({"-h"}).show_help);
}

TEST(OptionsTest, MonitorCollectsDeviceIds)
{
    Options options = Parse({"-m", "3", "12"});
    EXPECT_EQ(options.config.watched_ids, (std::set<int>{3, 12}));

    options = Parse({"7", "--monitor"});
    EXPECT_EQ(options.config.watched_ids, (std::set<int>{7}));

    options = Parse({"3", "12"});
    EXPECT_TRUE(options.config.watched_ids.empty());
}

TEST(OptionsTest, TuningValues)
{
    Options options = Parse({"--interval", "10", "--discovery-timeout", "250", "--monitor-timeout", "800",
                             "--miss-limit", "0", "--parallel", "4", "--probe", "icmp", "--match", "ip"});
    const auto &config = options.config;

    EXPECT_EQ(config.interval, std::chrono::seconds(10));
    EXPECT_EQ(config.discovery.timeout, std::chrono::milliseconds(250));
    EXPECT_EQ(config.monitor.timeout, std::chrono::milliseconds(800));
    EXPECT_EQ(config.discovery.miss_limit, 0);
    EXPECT_EQ(config.monitor.miss_limit, 0);
    EXPECT_EQ(config.parallelism, 4u);
    EXPECT_EQ(config.probe_method, ProbeMethod::Icmp);
    EXPECT_EQ(config.match_policy, MatchPolicy::NetworkAddress);
}

TEST(OptionsTest, PathsAndServices)
{
    Options options = Parse({"--db", "/var/lib/lanwatch.db", "--arp-table", "/tmp/arp", "--vendor-host",
                             "vendors.example", "--no-vendor", "--alert-command", "logger"});
    const auto &config = options.config;

    EXPECT_EQ(config.db_path, "/var/lib/lanwatch.db");
    EXPECT_EQ(config.arp_table, "/tmp/arp");
    EXPECT_EQ(config.vendor_host, "vendors.example");
    EXPECT_FALSE(config.vendor_enabled);
    EXPECT_EQ(config.alert_command, "logger");
}

TEST(OptionsTest, MalformedInputIsUsageError)
{
    EXPECT_THROW(Parse({"--bogus"}), UsageError);
    EXPECT_THROW(Parse({"--interval"}), UsageError);
    EXPECT_THROW(Parse({"--interval", "0"}), UsageError);
    EXPECT_THROW(Parse({"--interval", "5s"}), UsageError);
    EXPECT_THROW(Parse({"--parallel", "-2"}), UsageError);
    EXPECT_THROW(Parse({"--miss-limit", "-1"}), UsageError);
    EXPECT_THROW(Parse({"--probe", "arp"}), UsageError);
    EXPECT_THROW(Parse({"--match", "name"}), UsageError);
}

TEST(OptionsTest, HelpListsOptions)
{
    std::ostringstream out;
    PrintHelp(out, "lanwatch");
    EXPECT_NE(out.str().find("Usage: lanwatch"), std::string::npos);
    EXPECT_NE(out.str().find("--match ip|mac"), std::string::npos);
    EXPECT_NE(out.str().find("up to n-1 addresses past the last miss"), std::string::npos);
}

TEST(RenameLineTest, ParsesIdAndName)
{
    auto request = ParseRenameLine("4 Living Room TV\r");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->device_id, 4);
    EXPECT_EQ(request->name, "Living Room TV");
    EXPECT_FALSE(request->from_vendor);
}

TEST(RenameLineTest, ApiKeywordAsksVendorService)
{
    auto request = ParseRenameLine("12 api");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->device_id, 12);
    EXPECT_TRUE(request->from_vendor);
}

TEST(RenameLineTest, RejectsMalformedLines)
{
    EXPECT_FALSE(ParseRenameLine("").has_value());
    EXPECT_FALSE(ParseRenameLine("n").has_value());
    EXPECT_FALSE(ParseRenameLine("4").has_value());
    EXPECT_FALSE(ParseRenameLine("four Kitchen").has_value());
    EXPECT_FALSE(ParseRenameLine("-1 Kitchen").has_value());
    EXPECT_FALSE(ParseRenameLine("99999999999999 Kitchen").has_value());
}
