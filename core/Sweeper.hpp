#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "DeviceEvent.hpp"
#include "ProbePool.hpp"

namespace lan_watch::core
{
    inline constexpr int DEFAULT_MISS_LIMIT = 3;
    inline constexpr int FIRST_HOST = 1;
    inline constexpr int LAST_HOST = 254;

    struct SweepOptions
    {
        std::chrono::milliseconds timeout{600};
        // Sweep stops once this many consecutive misses is exceeded. 0 sweeps the full range.
        int miss_limit = DEFAULT_MISS_LIMIT;
    };

    struct SweepResult
    {
        std::vector<std::string> reachable;
        int probes = 0;
        std::chrono::milliseconds elapsed{0};
        bool stopped_early = false;
        bool cancelled = false;
    };

    /*
     * Probes the /24 around an anchor address.
     *
     * With a miss limit the sweep is not complete by construction: once the limit
     * is exceeded the rest of the range is assumed empty and never probed. Probes
     * run in windows of pool-size addresses, so with a single worker the stop
     * is exact and with N workers at most N-1 further addresses of the current
     * window have already been probed.
     *
     * `cancelled` is polled before every window. A cancelled sweep returns what
     * it found so far with SweepResult::cancelled set.
     */
    class Sweeper
    {
    public:
        explicit Sweeper(ProbePool &pool);

        // Throws common::ConfigurationError when the anchor is not a dotted quad.
        SweepResult Sweep(const std::string &anchor, const SweepOptions &options,
                          const CancelCheck &cancelled = nullptr);

        static std::vector<std::string> Candidates(const std::string &anchor);

    private:
        ProbePool &m_pool;
    };
}
