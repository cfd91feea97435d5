#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "Prober.hpp"
#include "../common/ThreadSafeQueue.hpp"

namespace lan_watch::core
{
    // Fixed set of probe workers fed from a shared job queue.
    class ProbePool
    {
    public:
        ProbePool(Prober &prober, std::size_t workers);
        ~ProbePool();

        ProbePool(const ProbePool &) = delete;
        ProbePool &operator=(const ProbePool &) = delete;

        // Blocks until every address has been probed. outcomes[i] belongs to ips[i].
        std::vector<ProbeOutcome> RunBatch(const std::vector<std::string> &ips, std::chrono::milliseconds timeout);

        std::size_t Size() const { return m_threads.size(); }

    private:
        struct Batch
        {
            std::mutex mutex;
            std::condition_variable done_cv;
            std::vector<ProbeOutcome> outcomes;
            std::size_t pending = 0;
        };

        struct Job
        {
            std::size_t index;
            std::string ip;
            std::chrono::milliseconds timeout;
            std::shared_ptr<Batch> batch;
        };

        void ProcessLoop();

        Prober &m_prober;
        common::ThreadSafeQueue<Job> m_jobs;
        std::vector<std::thread> m_threads;
    };
}
