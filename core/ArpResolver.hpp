#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "../common/Device.hpp"

namespace lan_watch::core
{
    inline constexpr const char *DEFAULT_ARP_TABLE = "/proc/net/arp";

    class ArpResolver
    {
    public:
        explicit ArpResolver(std::string table_path = DEFAULT_ARP_TABLE);

        // Takes one snapshot of the neighbor cache and fills in hardware addresses
        // for devices that have none. Returns the number of devices resolved.
        int Resolve(std::vector<common::Device> &devices) const;

        // ip -> canonical hardware address. Accepts /proc/net/arp, `ip neigh` and `arp -a` layouts.
        static std::map<std::string, std::string> ParseNeighborTable(const std::string &text);

        static int Annotate(std::vector<common::Device> &devices, const std::map<std::string, std::string> &table);

    private:
        std::optional<std::string> Snapshot() const;

        std::string m_table_path;
    };
}
