#pragma once

#include <optional>
#include <string>
#include "../common/CommandRunner.hpp"
#include "../common/Device.hpp"

namespace lan_watch::core
{
    class LocalIdentityResolver
    {
    public:
        explicit LocalIdentityResolver(common::CommandRunner &runner);

        // Default interface through libtins, then `ip addr show` as a fallback.
        // Throws common::IdentityUnavailable when neither yields an address.
        common::LocalIdentity Resolve();

        // Parses `ip addr show` output. Picks the first non-loopback block with an
        // IPv4 address; the hardware address comes from the same block.
        static std::optional<common::LocalIdentity> ParseInterfaceReport(const std::string &report);

    private:
        std::optional<common::LocalIdentity> FromDefaultInterface();

        common::CommandRunner &m_runner;
    };
}
