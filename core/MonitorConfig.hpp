#pragma once

#include <chrono>
#include <set>
#include <string>
#include "ArpResolver.hpp"
#include "Sweeper.hpp"
#include "VendorClient.hpp"

namespace lan_watch::core
{
    // How a previous live device is recognised in the current sweep.
    enum class MatchPolicy
    {
        NetworkAddress,
        HardwareAddress
    };

    enum class ProbeMethod
    {
        PingCommand,
        Icmp
    };

    inline constexpr std::chrono::seconds DEFAULT_INTERVAL{5};
    inline constexpr std::chrono::milliseconds DEFAULT_DISCOVERY_TIMEOUT{600};
    inline constexpr std::chrono::milliseconds DEFAULT_MONITOR_TIMEOUT{1000};
    inline constexpr std::chrono::milliseconds DEFAULT_VENDOR_SPACING{1000};
    inline constexpr std::size_t DEFAULT_PARALLELISM = 16;
    inline constexpr const char *DEFAULT_DB_PATH = "clients.db";
    inline constexpr const char *DEFAULT_ALERT_COMMAND = "notify-send";

    // Built once at startup and handed to every component by const reference.
    struct MonitorConfig
    {
        std::chrono::seconds interval = DEFAULT_INTERVAL;
        SweepOptions discovery{DEFAULT_DISCOVERY_TIMEOUT, DEFAULT_MISS_LIMIT};
        SweepOptions monitor{DEFAULT_MONITOR_TIMEOUT, DEFAULT_MISS_LIMIT};
        std::size_t parallelism = DEFAULT_PARALLELISM;

        ProbeMethod probe_method = ProbeMethod::PingCommand;
        MatchPolicy match_policy = MatchPolicy::HardwareAddress;

        bool list_only = false;
        bool interactive_rename = false;
        std::set<int> watched_ids;

        std::string db_path = DEFAULT_DB_PATH;
        std::string arp_table = DEFAULT_ARP_TABLE;

        bool vendor_enabled = true;
        std::string vendor_host = DEFAULT_VENDOR_HOST;
        std::chrono::milliseconds vendor_spacing = DEFAULT_VENDOR_SPACING;

        std::string alert_command = DEFAULT_ALERT_COMMAND;
    };
}
