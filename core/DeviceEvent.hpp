#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include "../common/Device.hpp"

namespace lan_watch::core
{
    enum class EventKind
    {
        Connected,
        Disconnected
    };

    struct DeviceEvent
    {
        EventKind kind;
        common::Device device;
        std::chrono::system_clock::time_point at;
    };

    using EventCallback = std::function<void(const DeviceEvent &event)>;
    using LiveSetCallback = std::function<void(const std::vector<common::Device> &live)>;

    // Polled between units of work; true abandons the pass.
    using CancelCheck = std::function<bool()>;

    struct RenameRequest
    {
        int device_id;
        std::string name;
        // Ask the vendor service instead of using `name`.
        bool from_vendor = false;
    };
}
