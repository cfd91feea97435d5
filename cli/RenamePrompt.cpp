#include "RenamePrompt.hpp"
#include <poll.h>
#include <unistd.h>
#include <iostream>
#include <sstream>

namespace lan_watch::cli
{
    std::optional<core::RenameRequest> ParseRenameLine(const std::string &line)
    {
        std::stringstream ss(line);
        std::string id_text;
        if (!(ss >> id_text) || id_text.find_first_not_of("0123456789") != std::string::npos)
            return std::nullopt;

        std::string name;
        std::getline(ss >> std::ws, name);
        while (!name.empty() && (name.back() == '\r' || name.back() == ' '))
            name.pop_back();
        if (name.empty())
            return std::nullopt;

        core::RenameRequest request;
        try
        {
            request.device_id = std::stoi(id_text);
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
        request.from_vendor = (name == "api");
        if (!request.from_vendor)
            request.name = name;
        return request;
    }

    RenamePrompt::RenamePrompt(core::ChangeDetector &detector, int fd)
        : m_detector(detector), m_fd(fd), m_running(false)
    {
    }

    RenamePrompt::~RenamePrompt()
    {
        Stop();
    }

    void RenamePrompt::Start()
    {
        if (m_running)
            return;
        m_running = true;
        std::cout << "To change the name of a device, enter \"<device #> <new name>\", "
                  << "or \"<device #> api\" to download a name.\n";
        m_thread = std::thread(&RenamePrompt::ReadLoop, this);
    }

    void RenamePrompt::Stop()
    {
        m_running = false;
        if (m_thread.joinable())
            m_thread.join();
    }

    void RenamePrompt::HandleLine(const std::string &line)
    {
        if (line.empty() || line == "n")
            return;

        auto request = ParseRenameLine(line);
        if (!request)
        {
            std::cout << "invalid input\n";
            return;
        }
        m_detector.QueueRename(*request);
        std::cout << "Rename of device #" << request->device_id << " queued for the next cycle.\n";
    }

    void RenamePrompt::ReadLoop()
    {
        std::string pending;
        char buffer[512];

        while (m_running)
        {
            pollfd pfd{};
            pfd.fd = m_fd;
            pfd.events = POLLIN;

            int ret = poll(&pfd, 1, 200);
            if (ret <= 0 || !(pfd.revents & (POLLIN | POLLHUP)))
                continue;

            ssize_t n = read(m_fd, buffer, sizeof(buffer));
            if (n <= 0)
                break;

            pending.append(buffer, static_cast<size_t>(n));
            size_t pos;
            while ((pos = pending.find('\n')) != std::string::npos)
            {
                HandleLine(pending.substr(0, pos));
                pending.erase(0, pos + 1);
            }
        }
    }
}
