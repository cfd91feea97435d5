#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include "../core/ChangeDetector.hpp"

namespace lan_watch::cli
{
    // "<id> <new name>" or "<id> api". Anything else yields nullopt.
    std::optional<core::RenameRequest> ParseRenameLine(const std::string &line);

    /*
     * Reads rename lines from a file descriptor on its own thread and queues
     * them on the detector. Never blocks a monitoring cycle.
     */
    class RenamePrompt
    {
    public:
        RenamePrompt(core::ChangeDetector &detector, int fd);
        ~RenamePrompt();

        void Start();
        void Stop();

    private:
        void ReadLoop();
        void HandleLine(const std::string &line);

        core::ChangeDetector &m_detector;
        int m_fd;
        std::atomic<bool> m_running;
        std::thread m_thread;
    };
}
