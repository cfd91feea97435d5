#include "AddressText.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace lan_watch::common
{
    namespace
    {
        const std::regex &Ipv4Pattern()
        {
            static const std::regex pattern(R"((?:^|[^\d.])(\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3})(?![\d]|\.\d))");
            return pattern;
        }

        const std::regex &HardwareAddressPattern()
        {
            static const std::regex pattern(
                R"((?:^|[^0-9A-Fa-f:\-])([0-9A-Fa-f]{2}([:\-])[0-9A-Fa-f]{2}(?:\2[0-9A-Fa-f]{2}){4})(?![0-9A-Fa-f:\-]))");
            return pattern;
        }
    }

    bool IsIpv4Address(const std::string &text)
    {
        std::stringstream ss(text);
        std::string part;
        int parts = 0;
        while (std::getline(ss, part, '.'))
        {
            if (part.empty() || part.size() > 3)
                return false;
            if (!std::all_of(part.begin(), part.end(), [](unsigned char c) { return std::isdigit(c); }))
                return false;
            if (std::stoi(part) > 255)
                return false;
            parts++;
        }
        return parts == 4 && text.back() != '.';
    }

    std::optional<std::string> FindIpv4Token(const std::string &line)
    {
        for (auto it = std::sregex_iterator(line.begin(), line.end(), Ipv4Pattern()); it != std::sregex_iterator(); ++it)
        {
            std::string candidate = (*it)[1].str();
            if (IsIpv4Address(candidate))
                return candidate;
        }
        return std::nullopt;
    }

    std::optional<std::string> FindHardwareAddressToken(const std::string &line)
    {
        std::smatch match;
        if (std::regex_search(line, match, HardwareAddressPattern()))
            return CanonicalHardwareAddress(match[1].str());
        return std::nullopt;
    }

    std::optional<std::string> CanonicalHardwareAddress(const std::string &text)
    {
        std::smatch match;
        if (!std::regex_search(text, match, HardwareAddressPattern()) || static_cast<std::size_t>(match[1].length()) != text.size())
            return std::nullopt;

        std::string mac = text;
        std::transform(mac.begin(), mac.end(), mac.begin(), [](unsigned char c) { return std::tolower(c); });
        std::replace(mac.begin(), mac.end(), '-', ':');
        return mac;
    }

    std::optional<std::string> AddressPrefix(const std::string &address)
    {
        if (!IsIpv4Address(address))
            return std::nullopt;
        return address.substr(0, address.find_last_of('.') + 1);
    }
}
