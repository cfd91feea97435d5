#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace lan_watch::common
{
    inline constexpr const char *UNKNOWN_NAME = "unknown";
    inline constexpr int UNSET_ID = -1;

    struct Device
    {
        std::optional<int> id;
        std::optional<std::string> hardware_address;
        std::string network_address;
        std::optional<std::string> display_name;
        bool connected = false;
    };

    struct LocalIdentity
    {
        std::string network_address;
        std::optional<std::string> hardware_address;
    };

    // Fatal: aborts startup.
    class ConfigurationError : public std::runtime_error
    {
    public:
        explicit ConfigurationError(const std::string &what) : std::runtime_error(what) {}
    };

    class IdentityUnavailable : public ConfigurationError
    {
    public:
        explicit IdentityUnavailable(const std::string &what) : ConfigurationError(what) {}
    };

    Device MakeDevice(const std::string &network_address);

    int DisplayId(const Device &device);
    std::string DisplayName(const Device &device);
    std::string DisplayHardwareAddress(const Device &device);

    // "Device 3: 192.168.1.20 aa:bb:cc:dd:ee:ff Kitchen TV"
    std::string FormatDeviceLine(const Device &device);

    bool IsComplete(const Device &device);
}
