#include "ArpResolver.hpp"
#include "../common/AddressText.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

namespace lan_watch::core
{
    namespace
    {
        const char *INCOMPLETE_ENTRY = "00:00:00:00:00:00";
    }

    ArpResolver::ArpResolver(std::string table_path) : m_table_path(std::move(table_path))
    {
    }

    std::optional<std::string> ArpResolver::Snapshot() const
    {
        std::ifstream arpFile(m_table_path);
        if (!arpFile.is_open())
        {
            std::cerr << "[ArpResolver] Cannot open neighbor cache " << m_table_path << "\n";
            return std::nullopt;
        }

        std::stringstream ss;
        ss << arpFile.rdbuf();
        return ss.str();
    }

    std::map<std::string, std::string> ArpResolver::ParseNeighborTable(const std::string &text)
    {
        std::map<std::string, std::string> table;
        std::stringstream ss(text);
        std::string line;

        while (std::getline(ss, line))
        {
            auto ip = common::FindIpv4Token(line);
            if (!ip)
                continue;

            auto mac = common::FindHardwareAddressToken(line);
            if (!mac || *mac == INCOMPLETE_ENTRY)
                continue;

            table.emplace(*ip, *mac);
        }
        return table;
    }

    int ArpResolver::Annotate(std::vector<common::Device> &devices, const std::map<std::string, std::string> &table)
    {
        int resolved = 0;
        for (auto &device : devices)
        {
            if (device.hardware_address)
                continue;

            auto it = table.find(device.network_address);
            if (it == table.end())
            {
                std::cout << "[ArpResolver] No cache entry for " << device.network_address << "\n";
                continue;
            }

            device.hardware_address = it->second;
            resolved++;
        }
        return resolved;
    }

    int ArpResolver::Resolve(std::vector<common::Device> &devices) const
    {
        auto snapshot = Snapshot();
        if (!snapshot)
            return 0;
        return Annotate(devices, ParseNeighborTable(*snapshot));
    }
}
