#include "ProbePool.hpp"
#include <iostream>

namespace lan_watch::core
{
    ProbePool::ProbePool(Prober &prober, std::size_t workers) : m_prober(prober)
    {
        if (workers == 0)
            workers = 1;

        m_threads.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i)
        {
            m_threads.emplace_back(&ProbePool::ProcessLoop, this);
        }
    }

    ProbePool::~ProbePool()
    {
        m_jobs.Shutdown();
        for (auto &t : m_threads)
        {
            if (t.joinable())
                t.join();
        }
    }

    std::vector<ProbeOutcome> ProbePool::RunBatch(const std::vector<std::string> &ips, std::chrono::milliseconds timeout)
    {
        auto batch = std::make_shared<Batch>();
        batch->outcomes.assign(ips.size(), ProbeOutcome::Lost);
        batch->pending = ips.size();

        for (std::size_t i = 0; i < ips.size(); ++i)
        {
            m_jobs.Push({i, ips[i], timeout, batch});
        }

        std::unique_lock<std::mutex> lock(batch->mutex);
        batch->done_cv.wait(lock, [&batch]
                            { return batch->pending == 0; });
        return batch->outcomes;
    }

    void ProbePool::ProcessLoop()
    {
        while (true)
        {
            auto job = m_jobs.Pop();
            if (!job)
                break;

            ProbeOutcome outcome = ProbeOutcome::Lost;
            try
            {
                outcome = m_prober.Probe(job->ip, job->timeout);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[ProbePool] Probe of " << job->ip << " threw: " << e.what() << "\n";
            }

            std::lock_guard<std::mutex> lock(job->batch->mutex);
            job->batch->outcomes[job->index] = outcome;
            if (--job->batch->pending == 0)
                job->batch->done_cv.notify_all();
        }
    }
}
