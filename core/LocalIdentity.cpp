#include "LocalIdentity.hpp"
#include "../common/AddressText.hpp"
#include <tins/tins.h>
#include <cctype>
#include <iostream>
#include <sstream>
#include <vector>

namespace lan_watch::core
{
    namespace
    {
        struct InterfaceBlock
        {
            std::optional<std::string> ip;
            std::optional<std::string> mac;
        };

        bool IsLoopback(const std::string &ip)
        {
            return ip.rfind("127.", 0) == 0;
        }
    }

    LocalIdentityResolver::LocalIdentityResolver(common::CommandRunner &runner) : m_runner(runner)
    {
    }

    std::optional<common::LocalIdentity> LocalIdentityResolver::ParseInterfaceReport(const std::string &report)
    {
        std::vector<InterfaceBlock> blocks;
        std::stringstream ss(report);
        std::string line;

        while (std::getline(ss, line))
        {
            if (line.empty())
                continue;

            // Interface headers start in column 0, attributes are indented.
            if (!std::isspace(static_cast<unsigned char>(line[0])) || blocks.empty())
                blocks.emplace_back();

            InterfaceBlock &block = blocks.back();
            if (line.find("inet ") != std::string::npos && !block.ip)
            {
                auto ip = common::FindIpv4Token(line.substr(line.find("inet ")));
                if (ip && !IsLoopback(*ip))
                    block.ip = ip;
            }
            else if ((line.find("link/ether") != std::string::npos || line.find("ether ") != std::string::npos) && !block.mac)
            {
                block.mac = common::FindHardwareAddressToken(line);
            }
        }

        std::optional<std::string> orphan_mac;
        for (const auto &block : blocks)
        {
            if (block.ip)
                return common::LocalIdentity{*block.ip, block.mac};
            if (block.mac && !orphan_mac)
                orphan_mac = block.mac;
        }

        if (orphan_mac)
            return common::LocalIdentity{"", orphan_mac};
        return std::nullopt;
    }

    std::optional<common::LocalIdentity> LocalIdentityResolver::FromDefaultInterface()
    {
        try
        {
            Tins::NetworkInterface iface = Tins::NetworkInterface::default_interface();
            Tins::NetworkInterface::Info info = iface.info();

            std::string ip = info.ip_addr.to_string();
            if (ip == "0.0.0.0")
                return std::nullopt;

            common::LocalIdentity identity;
            identity.network_address = ip;
            identity.hardware_address = common::CanonicalHardwareAddress(info.hw_addr.to_string());
            std::cout << "[Identity] Default interface " << iface.name() << "\n";
            return identity;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Identity] Default interface lookup failed: " << e.what() << "\n";
        }
        return std::nullopt;
    }

    common::LocalIdentity LocalIdentityResolver::Resolve()
    {
        if (auto identity = FromDefaultInterface())
            return *identity;

        auto report = m_runner.Run("ip addr show");
        if (report)
        {
            if (auto identity = ParseInterfaceReport(*report))
                return *identity;
        }

        throw common::IdentityUnavailable("Unable to determine local network or hardware address");
    }
}
