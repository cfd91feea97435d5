#include <memory>
#include <sstream>

#include <gtest/gtest.h>

#include "../core/Notifier.hpp"
#include "TestSupport.hpp"

using namespace lan_watch::core;
using lan_watch::common::Device;
using lan_watch::common::MakeDevice;
using lan_watch::testing::FakeCommandRunner;

namespace {

DeviceEvent EventFor(EventKind kind, int id, const std::string &name)
{
    Device device = MakeDevice("192.168.1.20");
    device.id = id;
    device.display_name = name;
    device.connected = kind == EventKind::Connected;
    return {kind, device, std::chrono::system_clock::now()};
}

} // namespace

TEST(NotifierTest, PrintsOneLinePerEvent)
{
    std::ostringstream out;
    FakeCommandRunner runner;
    Notifier notifier(out, runner, "notify-send");

    DeviceEvent joined = EventFor(EventKind::Connected, 3, "Kitchen TV");
    DeviceEvent left = EventFor(EventKind::Disconnected, 3, "Kitchen TV");
    notifier.Dispatch(left);
    notifier.Dispatch(joined);

    std::string expected = "Kitchen TV has disconnected at " + FormatClock(left.at) + "\n" +
                           "Kitchen TV has connected at " + FormatClock(joined.at) + "\n";
    EXPECT_EQ(out.str(), expected);
    EXPECT_TRUE(runner.commands.empty());
}

TEST(NotifierTest, UnnamedDevicePrintsSentinel)
{
    Device device = MakeDevice("192.168.1.20");
    DeviceEvent event{EventKind::Connected, device, std::chrono::system_clock::now()};

    EXPECT_EQ(FormatEventLine(event).rfind("unknown has connected at ", 0), 0u);
}

TEST(NotifierTest, WatchedDeviceRunsAlertCommand)
{
    std::ostringstream out;
    FakeCommandRunner runner;
    Notifier notifier(out, runner, "notify-send");
    notifier.AddAlertFilter(std::make_shared<WatchListFilter>(std::set<int>{3, 8}));

    notifier.Dispatch(EventFor(EventKind::Connected, 3, "Kitchen TV"));
    notifier.Dispatch(EventFor(EventKind::Disconnected, 4, "Printer"));

    ASSERT_EQ(runner.commands.size(), 1u);
    EXPECT_EQ(runner.commands[0],
              "notify-send 'Device #3 named Kitchen TV connected.' 'Watched device named Kitchen TV connected.'");
}

TEST(NotifierTest, QuotesNamesForTheShell)
{
    std::ostringstream out;
    FakeCommandRunner runner;
    Notifier notifier(out, runner, "notify-send");
    notifier.AddAlertFilter(std::make_shared<WatchListFilter>(std::set<int>{5}));

    notifier.Dispatch(EventFor(EventKind::Disconnected, 5, "Bob's phone"));

    ASSERT_EQ(runner.commands.size(), 1u);
    EXPECT_EQ(runner.commands[0],
              "notify-send 'Device #5 named Bob'\\''s phone disconnected.' "
              "'Watched device named Bob'\\''s phone disconnected.'");
}

TEST(NotifierTest, EmptyAlertCommandDisablesAlerts)
{
    std::ostringstream out;
    FakeCommandRunner runner;
    Notifier notifier(out, runner, "");
    notifier.AddAlertFilter(std::make_shared<WatchListFilter>(std::set<int>{3}));

    notifier.Dispatch(EventFor(EventKind::Connected, 3, "Kitchen TV"));

    EXPECT_TRUE(runner.commands.empty());
    EXPECT_FALSE(out.str().empty());
}

TEST(NotifierTest, PrintsDeviceList)
{
    std::ostringstream out;
    FakeCommandRunner runner;
    Notifier notifier(out, runner, "notify-send");

    Device named = MakeDevice("192.168.1.20");
    named.id = 1;
    named.hardware_address = "aa:bb:cc:dd:ee:ff";
    named.display_name = "Kitchen TV";
    Device bare = MakeDevice("192.168.1.40");

    notifier.PrintDeviceList({named, bare});

    const std::string text = out.str();
    EXPECT_NE(text.find("The connected client list on your LAN:"), std::string::npos);
    EXPECT_NE(text.find("Device 1: 192.168.1.20 aa:bb:cc:dd:ee:ff Kitchen TV\n"), std::string::npos);
    EXPECT_NE(text.find("Device -1: 192.168.1.40 unknown unknown\n"), std::string::npos);
}
