#include "ChangeDetector.hpp"
#include <algorithm>
#include <iostream>

namespace lan_watch::core
{
    namespace
    {
        bool SameHardware(const common::Device &a, const common::Device &b)
        {
            return a.hardware_address && b.hardware_address && *a.hardware_address == *b.hardware_address;
        }

        bool NetworkMatch(const common::Device &previous, const common::Device &current, MatchPolicy policy)
        {
            // Two known, different hardware addresses are different devices.
            if (policy == MatchPolicy::HardwareAddress && previous.hardware_address && current.hardware_address)
                return false;
            return previous.network_address == current.network_address;
        }
    }

    DiffResult ComputeDiff(const std::vector<common::Device> &previous,
                           const std::vector<common::Device> &current,
                           MatchPolicy policy)
    {
        const std::size_t unmatched = current.size();
        std::vector<std::size_t> match(previous.size(), unmatched);
        std::vector<bool> consumed(current.size(), false);

        if (policy == MatchPolicy::HardwareAddress)
        {
            for (std::size_t p = 0; p < previous.size(); ++p)
            {
                if (!previous[p].hardware_address)
                    continue;
                for (std::size_t i = 0; i < current.size(); ++i)
                {
                    if (consumed[i] || !SameHardware(previous[p], current[i]))
                        continue;
                    match[p] = i;
                    consumed[i] = true;
                    break;
                }
            }
        }

        for (std::size_t p = 0; p < previous.size(); ++p)
        {
            if (match[p] != unmatched)
                continue;

            if (policy == MatchPolicy::HardwareAddress && previous[p].hardware_address)
            {
                bool seen = std::any_of(current.begin(), current.end(), [&](const common::Device &c)
                                        { return SameHardware(previous[p], c); });
                if (seen)
                    continue;
            }

            for (std::size_t i = 0; i < current.size(); ++i)
            {
                if (consumed[i] || !NetworkMatch(previous[p], current[i], policy))
                    continue;
                match[p] = i;
                consumed[i] = true;
                break;
            }
        }

        DiffResult diff;
        for (std::size_t p = 0; p < previous.size(); ++p)
        {
            if (match[p] == unmatched)
            {
                common::Device gone = previous[p];
                gone.connected = false;
                diff.disconnected.push_back(gone);
                continue;
            }

            const common::Device &now = current[match[p]];
            common::Device kept = previous[p];
            kept.network_address = now.network_address;
            if (!kept.hardware_address)
                kept.hardware_address = now.hardware_address;
            kept.connected = true;
            diff.kept.push_back(kept);
        }

        for (std::size_t i = 0; i < current.size(); ++i)
        {
            if (!consumed[i])
                diff.arrived.push_back(current[i]);
        }
        return diff;
    }

    ChangeDetector::ChangeDetector(const MonitorConfig &config, Sweeper &sweeper, DeviceEnricher &enricher,
                                   DeviceRegistry &registry, std::string anchor,
                                   const std::atomic<bool> *shutdown)
        : m_config(config), m_sweeper(sweeper), m_enricher(enricher), m_registry(registry),
          m_anchor(std::move(anchor)), m_shutdown(shutdown), m_cancel(false), m_running(false),
          m_state(CycleState::Idle)
    {
    }

    bool ChangeDetector::Cancelled() const
    {
        return m_cancel || (m_shutdown && *m_shutdown);
    }

    ChangeDetector::~ChangeDetector()
    {
        Stop();
    }

    std::vector<common::Device> ChangeDetector::DevicesFrom(const std::vector<std::string> &addresses) const
    {
        std::vector<common::Device> devices;
        devices.reserve(addresses.size());
        for (const auto &ip : addresses)
        {
            devices.push_back(common::MakeDevice(ip));
        }
        return devices;
    }

    std::vector<common::Device> ChangeDetector::Discover()
    {
        const CancelCheck cancelled = [this]
        { return Cancelled(); };

        m_state = CycleState::Sweeping;
        SweepResult sweep = m_sweeper.Sweep(m_anchor, m_config.discovery, cancelled);

        std::vector<common::Device> devices = DevicesFrom(sweep.reachable);
        if (!sweep.cancelled)
            m_enricher.Enrich(devices, cancelled);

        if (Cancelled())
        {
            std::cout << "[ChangeDetector] Discovery cancelled\n";
            m_state = CycleState::Idle;
            return {};
        }

        {
            std::lock_guard<std::mutex> lock(m_live_mutex);
            m_live = devices;
        }
        m_state = CycleState::Idle;
        return devices;
    }

    std::vector<DeviceEvent> ChangeDetector::RunCycle()
    {
        const CancelCheck cancelled = [this]
        { return Cancelled(); };
        auto abandon = [this]()
        {
            std::cout << "[ChangeDetector] Cycle cancelled\n";
            m_state = CycleState::Idle;
            return std::vector<DeviceEvent>{};
        };

        m_state = CycleState::Idle;
        ApplyPendingRenames();

        m_state = CycleState::Sweeping;
        SweepResult sweep = m_sweeper.Sweep(m_anchor, m_config.monitor, cancelled);
        if (sweep.cancelled || Cancelled())
            return abandon();

        std::vector<common::Device> current = DevicesFrom(sweep.reachable);
        m_enricher.ResolveHardware(current);

        m_state = CycleState::Diffing;
        DiffResult diff = ComputeDiff(LiveSet(), current, m_config.match_policy);

        // New devices are fully enriched before their event is built.
        m_enricher.EnrichResolved(diff.arrived, cancelled);

        std::vector<common::Device> incomplete;
        for (const auto &device : diff.kept)
        {
            if (!common::IsComplete(device))
                incomplete.push_back(device);
        }
        if (!incomplete.empty())
        {
            m_enricher.EnrichResolved(incomplete, cancelled);
            std::size_t next = 0;
            for (auto &device : diff.kept)
            {
                if (!common::IsComplete(device) && next < incomplete.size())
                    device = incomplete[next++];
            }
        }

        if (Cancelled())
            return abandon();

        const auto now = std::chrono::system_clock::now();
        std::vector<DeviceEvent> events;
        events.reserve(diff.disconnected.size() + diff.arrived.size());
        for (const auto &device : diff.disconnected)
        {
            events.push_back({EventKind::Disconnected, device, now});
        }
        for (const auto &device : diff.arrived)
        {
            events.push_back({EventKind::Connected, device, now});
        }

        std::vector<common::Device> next_live = diff.kept;
        next_live.insert(next_live.end(), diff.arrived.begin(), diff.arrived.end());
        {
            std::lock_guard<std::mutex> lock(m_live_mutex);
            m_live = std::move(next_live);
        }
        m_state = CycleState::Dispatching;
        return events;
    }

    void ChangeDetector::QueueRename(RenameRequest request)
    {
        m_renames.Push(std::move(request));
    }

    void ChangeDetector::ApplyPendingRenames()
    {
        while (auto request = m_renames.TryPop())
        {
            std::optional<common::Device> target;
            {
                std::lock_guard<std::mutex> lock(m_live_mutex);
                for (const auto &device : m_live)
                {
                    if (device.id && *device.id == request->device_id)
                    {
                        target = device;
                        break;
                    }
                }
            }

            if (!target)
            {
                auto record = m_registry.FindById(request->device_id);
                if (!record)
                {
                    std::cerr << "[ChangeDetector] No device #" << request->device_id << ", rename ignored\n";
                    continue;
                }
                common::Device stored;
                stored.id = record->id;
                stored.hardware_address = record->hardware_address;
                target = stored;
            }

            std::optional<std::string> name = request->name;
            if (request->from_vendor)
                name = m_enricher.LookupVendorName(*target);
            if (!name || !target->hardware_address)
                continue;

            if (!m_registry.SetName(*target->hardware_address, *name))
                continue;

            std::cout << *name << " is the new name of device #" << request->device_id << ".\n";
            std::lock_guard<std::mutex> lock(m_live_mutex);
            for (auto &device : m_live)
            {
                if (device.id && *device.id == request->device_id)
                    device.display_name = *name;
            }
        }
    }

    std::vector<common::Device> ChangeDetector::LiveSet() const
    {
        std::lock_guard<std::mutex> lock(m_live_mutex);
        return m_live;
    }

    void ChangeDetector::Start(EventCallback on_event, LiveSetCallback on_change)
    {
        if (m_running)
            return;
        m_cancel = false;
        m_running = true;
        m_on_event = std::move(on_event);
        m_on_change = std::move(on_change);
        m_thread = std::thread(&ChangeDetector::MonitorLoop, this);
    }

    void ChangeDetector::Stop()
    {
        m_cancel = true;
        m_running = false;
        if (m_thread.joinable())
            m_thread.join();
        m_cancel = false;
    }

    void ChangeDetector::MonitorLoop()
    {
        while (m_running)
        {
            std::vector<DeviceEvent> events;
            try
            {
                events = RunCycle();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[ChangeDetector] Cycle abandoned: " << e.what() << "\n";
            }

            if (!m_running)
                break;

            m_state = CycleState::Dispatching;
            for (const auto &event : events)
            {
                if (m_on_event)
                    m_on_event(event);
            }
            if (!events.empty() && m_on_change)
                m_on_change(LiveSet());
            m_state = CycleState::Idle;

            const auto slices = std::chrono::duration_cast<std::chrono::milliseconds>(m_config.interval).count() / 100;
            for (long long i = 0; i < slices; ++i)
            {
                if (!m_running)
                    break;
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }
        m_state = CycleState::Idle;
    }
}
