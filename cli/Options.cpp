#include "Options.hpp"
#include <iostream>
#include <vector>

namespace lan_watch::cli
{
    namespace
    {
        int ParseInt(const std::string &opt, const std::string &value, int min_value)
        {
            std::size_t used = 0;
            int parsed = 0;
            try
            {
                parsed = std::stoi(value, &used);
            }
            catch (const std::exception &)
            {
                throw UsageError("Invalid value for " + opt + ": \"" + value + "\"");
            }
            if (used != value.size() || parsed < min_value)
                throw UsageError("Invalid value for " + opt + ": \"" + value + "\"");
            return parsed;
        }

        bool IsNumber(const std::string &s)
        {
            return !s.empty() && s.find_first_not_of("0123456789") == std::string::npos;
        }
    }

    void PrintHelp(std::ostream &out, const std::string &program_name)
    {
        out << "Usage: " << program_name << " [options] [device-id ...]\n"
            << "Alerts when devices connect to or disconnect from the local network.\n"
            << "Device names are stored in the registry file (clients.db by default).\n"
            << "Options: \n"
            << "    -c, --connections               Print list of connected devices and exit\n"
            << "    -r, --rename                    Ask for device renames between cycles\n"
            << "    -m, --monitor                   Alert for the listed device ids\n"
            << "    --interval <s>                  Seconds between monitoring cycles (5)\n"
            << "    --discovery-timeout <ms>        Probe timeout for the initial sweep (600)\n"
            << "    --monitor-timeout <ms>          Probe timeout for monitoring cycles (1000)\n"
            << "    --miss-limit <n>                Consecutive misses before a sweep stops (3, 0 = full sweep)\n"
            << "    --parallel <n>                  Probe workers (16); a sweep stopping early may\n"
            << "                                    still probe up to n-1 addresses past the last miss\n"
            << "    --probe ping|icmp               Probe backend (ping)\n"
            << "    --match ip|mac                  Match live devices by network or hardware address (mac)\n"
            << "    --db <path>                     Registry file (clients.db)\n"
            << "    --arp-table <path>              Neighbor cache (/proc/net/arp)\n"
            << "    --vendor-host <host>            Vendor lookup host (api.macvendors.com)\n"
            << "    --no-vendor                     Disable vendor lookups\n"
            << "    --alert-command <cmd>           Command run for watched devices (notify-send)\n"
            << "    --help, -h                      Print help\n"
            << std::flush;
    }

    Options ParseOptions(int argc, char **argv)
    {
        Options options;
        core::MonitorConfig &config = options.config;

        bool monitor_ids = false;
        std::vector<int> ids;

        std::vector<std::string> args(argv + 1, argv + argc);
        for (std::size_t i = 0; i < args.size(); ++i)
        {
            const std::string &opt = args[i];
            auto next_value = [&]() -> std::string
            {
                if (i + 1 >= args.size())
                    throw UsageError("Missing value for " + opt);
                return args[++i];
            };

            if (opt == "--help" || opt == "-h")
            {
                options.show_help = true;
            }
            else if (opt == "--connections" || opt == "-c")
            {
                config.list_only = true;
            }
            else if (opt == "--rename" || opt == "-r")
            {
                config.interactive_rename = true;
            }
            else if (opt == "--monitor" || opt == "-m")
            {
                monitor_ids = true;
            }
            else if (opt == "--interval")
            {
                config.interval = std::chrono::seconds(ParseInt(opt, next_value(), 1));
            }
            else if (opt == "--discovery-timeout")
            {
                config.discovery.timeout = std::chrono::milliseconds(ParseInt(opt, next_value(), 1));
            }
            else if (opt == "--monitor-timeout")
            {
                config.monitor.timeout = std::chrono::milliseconds(ParseInt(opt, next_value(), 1));
            }
            else if (opt == "--miss-limit")
            {
                int limit = ParseInt(opt, next_value(), 0);
                config.discovery.miss_limit = limit;
                config.monitor.miss_limit = limit;
            }
            else if (opt == "--parallel")
            {
                config.parallelism = static_cast<std::size_t>(ParseInt(opt, next_value(), 1));
            }
            else if (opt == "--probe")
            {
                std::string value = next_value();
                if (value == "ping")
                    config.probe_method = core::ProbeMethod::PingCommand;
                else if (value == "icmp")
                    config.probe_method = core::ProbeMethod::Icmp;
                else
                    throw UsageError("Unknown probe backend: \"" + value + "\"");
            }
            else if (opt == "--match")
            {
                std::string value = next_value();
                if (value == "ip")
                    config.match_policy = core::MatchPolicy::NetworkAddress;
                else if (value == "mac")
                    config.match_policy = core::MatchPolicy::HardwareAddress;
                else
                    throw UsageError("Unknown match policy: \"" + value + "\"");
            }
            else if (opt == "--db")
            {
                config.db_path = next_value();
            }
            else if (opt == "--arp-table")
            {
                config.arp_table = next_value();
            }
            else if (opt == "--vendor-host")
            {
                config.vendor_host = next_value();
            }
            else if (opt == "--no-vendor")
            {
                config.vendor_enabled = false;
            }
            else if (opt == "--alert-command")
            {
                config.alert_command = next_value();
            }
            else if (IsNumber(opt))
            {
                ids.push_back(ParseInt("device id", opt, 0));
            }
            else
            {
                throw UsageError("Invalid option: \"" + opt + "\"");
            }
        }

        if (monitor_ids)
            config.watched_ids.insert(ids.begin(), ids.end());
        else if (!ids.empty())
            std::cerr << "[Options] Device ids given without --monitor are ignored\n";

        return options;
    }
}
