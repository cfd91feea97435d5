#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "DeviceEnricher.hpp"
#include "DeviceEvent.hpp"
#include "MonitorConfig.hpp"
#include "Sweeper.hpp"
#include "../common/ThreadSafeQueue.hpp"

namespace lan_watch::core
{
    enum class CycleState
    {
        Idle,
        Sweeping,
        Diffing,
        Dispatching
    };

    struct DiffResult
    {
        std::vector<common::Device> kept;
        std::vector<common::Device> disconnected;
        std::vector<common::Device> arrived;
    };

    /*
     * Reconciles the previous live set with the devices of the current sweep.
     *
     * Every current device is consumed by at most one previous device. Under
     * MatchPolicy::NetworkAddress a device that changed address shows up as one
     * disconnect plus one arrival. MatchPolicy::HardwareAddress keeps it: all
     * hardware-address pairs are matched first, then the leftovers fall back to
     * the network address when either side has no hardware address. A previous
     * device whose hardware address is present in `current` never takes a
     * network-address match. Kept devices carry the current network address.
     */
    DiffResult ComputeDiff(const std::vector<common::Device> &previous,
                           const std::vector<common::Device> &current,
                           MatchPolicy policy);

    class ChangeDetector
    {
    public:
        // `shutdown`, when given, cancels sweeps and enrichment in addition to Stop().
        ChangeDetector(const MonitorConfig &config, Sweeper &sweeper, DeviceEnricher &enricher,
                       DeviceRegistry &registry, std::string anchor,
                       const std::atomic<bool> *shutdown = nullptr);
        ~ChangeDetector();

        ChangeDetector(const ChangeDetector &) = delete;
        ChangeDetector &operator=(const ChangeDetector &) = delete;

        // Initial sweep with the discovery options; becomes the baseline.
        // Returns nothing and leaves the live set alone when cancelled.
        std::vector<common::Device> Discover();

        // One Sweeping -> Diffing pass; leaves the detector in Dispatching.
        // Returns the events in dispatch order. A cancelled cycle is abandoned:
        // no events, live set unchanged.
        std::vector<DeviceEvent> RunCycle();

        void Start(EventCallback on_event, LiveSetCallback on_change = nullptr);
        // Cancels the cycle in flight and joins the monitor thread.
        void Stop();
        bool IsRunning() const { return m_running; }

        // Applied at the start of the next cycle.
        void QueueRename(RenameRequest request);

        std::vector<common::Device> LiveSet() const;
        CycleState State() const { return m_state; }

    private:
        bool Cancelled() const;
        void MonitorLoop();
        void ApplyPendingRenames();
        std::vector<common::Device> DevicesFrom(const std::vector<std::string> &addresses) const;

        const MonitorConfig &m_config;
        Sweeper &m_sweeper;
        DeviceEnricher &m_enricher;
        DeviceRegistry &m_registry;
        std::string m_anchor;

        std::vector<common::Device> m_live;
        mutable std::mutex m_live_mutex;

        common::ThreadSafeQueue<RenameRequest> m_renames;

        EventCallback m_on_event;
        LiveSetCallback m_on_change;
        const std::atomic<bool> *m_shutdown;
        std::atomic<bool> m_cancel;
        std::atomic<bool> m_running;
        std::atomic<CycleState> m_state;
        std::thread m_thread;
    };
}
