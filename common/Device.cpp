#include "Device.hpp"
#include <sstream>

namespace lan_watch::common
{
    Device MakeDevice(const std::string &network_address)
    {
        Device device;
        device.network_address = network_address;
        device.connected = true;
        return device;
    }

    int DisplayId(const Device &device)
    {
        return device.id.value_or(UNSET_ID);
    }

    std::string DisplayName(const Device &device)
    {
        return device.display_name.value_or(UNKNOWN_NAME);
    }

    std::string DisplayHardwareAddress(const Device &device)
    {
        return device.hardware_address.value_or(UNKNOWN_NAME);
    }

    std::string FormatDeviceLine(const Device &device)
    {
        std::stringstream ss;
        ss << "Device " << DisplayId(device) << ": " << device.network_address << " "
           << DisplayHardwareAddress(device) << " " << DisplayName(device);
        return ss.str();
    }

    bool IsComplete(const Device &device)
    {
        return device.hardware_address.has_value() && device.id.has_value() && device.display_name.has_value();
    }
}
