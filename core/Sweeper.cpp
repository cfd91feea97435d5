#include "Sweeper.hpp"
#include "../common/AddressText.hpp"
#include "../common/Device.hpp"
#include <algorithm>
#include <iostream>

namespace lan_watch::core
{
    Sweeper::Sweeper(ProbePool &pool) : m_pool(pool)
    {
    }

    std::vector<std::string> Sweeper::Candidates(const std::string &anchor)
    {
        auto prefix = common::AddressPrefix(anchor);
        if (!prefix)
            throw common::ConfigurationError("Malformed anchor address: \"" + anchor + "\"");

        std::vector<std::string> candidates;
        candidates.reserve(LAST_HOST - FIRST_HOST + 1);
        for (int host = FIRST_HOST; host <= LAST_HOST; ++host)
        {
            std::string ip = *prefix + std::to_string(host);
            if (ip == anchor)
                continue;
            candidates.push_back(ip);
        }
        return candidates;
    }

    SweepResult Sweeper::Sweep(const std::string &anchor, const SweepOptions &options, const CancelCheck &cancelled)
    {
        const auto start = std::chrono::steady_clock::now();
        const std::vector<std::string> candidates = Candidates(anchor);

        SweepResult result;
        const bool early_exit = options.miss_limit > 0;
        const std::size_t window = m_pool.Size();

        int misses = 0;
        std::size_t next = 0;
        while (next < candidates.size() && !result.stopped_early)
        {
            if (cancelled && cancelled())
            {
                result.cancelled = true;
                break;
            }

            std::size_t end = std::min(candidates.size(), next + window);
            std::vector<std::string> batch(candidates.begin() + next, candidates.begin() + end);
            std::vector<ProbeOutcome> outcomes = m_pool.RunBatch(batch, options.timeout);
            result.probes += static_cast<int>(batch.size());

            for (std::size_t i = 0; i < batch.size(); ++i)
            {
                if (outcomes[i] == ProbeOutcome::Reachable)
                {
                    result.reachable.push_back(batch[i]);
                    misses = 0;
                    continue;
                }

                misses++;
                if (early_exit && misses > options.miss_limit)
                {
                    result.stopped_early = true;
                    // Later entries of this window were already probed; keep what answered.
                    for (std::size_t j = i + 1; j < batch.size(); ++j)
                    {
                        if (outcomes[j] == ProbeOutcome::Reachable)
                            result.reachable.push_back(batch[j]);
                    }
                    break;
                }
            }
            next = end;
        }

        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

        std::cout << "[Sweeper] Probed " << result.probes << " addresses in " << result.elapsed.count() << " ms, "
                  << result.reachable.size() << " reachable" << (result.stopped_early ? " (stopped early)" : "")
                  << (result.cancelled ? " (cancelled)" : "") << "\n";
        return result;
    }
}
