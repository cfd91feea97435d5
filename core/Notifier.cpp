#include "Notifier.hpp"
#include <ctime>
#include <iostream>
#include <sstream>

namespace lan_watch::core
{
    std::string FormatClock(std::chrono::system_clock::time_point at)
    {
        std::time_t tt = std::chrono::system_clock::to_time_t(at);
        std::tm local{};
        localtime_r(&tt, &local);

        char buffer[16];
        strftime(buffer, sizeof(buffer), "%H:%M:%S", &local);
        return buffer;
    }

    std::string FormatEventLine(const DeviceEvent &event)
    {
        std::stringstream ss;
        ss << common::DisplayName(event.device)
           << (event.kind == EventKind::Connected ? " has connected at " : " has disconnected at ")
           << FormatClock(event.at);
        return ss.str();
    }

    Notifier::Notifier(std::ostream &out, common::CommandRunner &runner, std::string alert_command)
        : m_out(out), m_runner(runner), m_alert_command(std::move(alert_command))
    {
    }

    void Notifier::AddAlertFilter(std::shared_ptr<EventFilter> filter)
    {
        if (filter)
            m_alert_filters.push_back(std::move(filter));
    }

    void Notifier::Dispatch(const DeviceEvent &event)
    {
        m_out << FormatEventLine(event) << std::endl;

        if (m_alert_filters.empty() || m_alert_command.empty())
            return;

        for (auto &filter : m_alert_filters)
        {
            if (!filter->IsMatch(event))
                return;
        }
        Alert(event);
    }

    void Notifier::Alert(const DeviceEvent &event)
    {
        const std::string name = common::DisplayName(event.device);
        const std::string verb = event.kind == EventKind::Connected ? "connected." : "disconnected.";

        std::stringstream title;
        title << "Device #" << common::DisplayId(event.device) << " named " << name << " " << verb;
        std::string body = "Watched device named " + name + " " + verb;

        std::string command = m_alert_command + " " + common::ShellQuote(title.str()) + " " + common::ShellQuote(body);
        if (!m_runner.Run(command))
            std::cerr << "[Notifier] Alert command failed: " << m_alert_command << "\n";
    }

    void Notifier::PrintDeviceList(const std::vector<common::Device> &devices)
    {
        m_out << "\nThe connected client list on your LAN: \n\n";
        for (const auto &device : devices)
        {
            m_out << common::FormatDeviceLine(device) << "\n";
        }
        m_out << std::endl;
    }
}
