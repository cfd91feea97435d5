#pragma once

#include <optional>
#include <string>

namespace lan_watch::common
{
    // Token scanners for unstructured command output.
    std::optional<std::string> FindIpv4Token(const std::string &line);
    std::optional<std::string> FindHardwareAddressToken(const std::string &line);

    // Lower-case, ':' delimited. Accepts '-' or ':' and any case.
    std::optional<std::string> CanonicalHardwareAddress(const std::string &text);

    bool IsIpv4Address(const std::string &text);

    // "192.168.1.10" -> "192.168.1."
    std::optional<std::string> AddressPrefix(const std::string &address);
}
