#pragma once

#include <memory>
#include <ostream>
#include <set>
#include <string>
#include <vector>
#include "DeviceEvent.hpp"
#include "../common/CommandRunner.hpp"

namespace lan_watch::core
{
    class EventFilter
    {
    public:
        virtual ~EventFilter() = default;
        virtual bool IsMatch(const DeviceEvent &event) = 0;
    };

    class WatchListFilter : public EventFilter
    {
    public:
        explicit WatchListFilter(std::set<int> ids) : m_ids(std::move(ids)) {}
        bool IsMatch(const DeviceEvent &event) override
        {
            return event.device.id && m_ids.count(*event.device.id) > 0;
        }

    private:
        std::set<int> m_ids;
    };

    std::string FormatClock(std::chrono::system_clock::time_point at);
    std::string FormatEventLine(const DeviceEvent &event);

    /*
     * Writes one console line per event. Events passing every alert filter also
     * run the alert command with a title and a message argument.
     */
    class Notifier
    {
    public:
        Notifier(std::ostream &out, common::CommandRunner &runner, std::string alert_command);

        void AddAlertFilter(std::shared_ptr<EventFilter> filter);
        void Dispatch(const DeviceEvent &event);
        void PrintDeviceList(const std::vector<common::Device> &devices);

    private:
        void Alert(const DeviceEvent &event);

        std::ostream &m_out;
        common::CommandRunner &m_runner;
        std::string m_alert_command;
        std::vector<std::shared_ptr<EventFilter>> m_alert_filters;
    };
}
