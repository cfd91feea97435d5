#pragma once

#include <chrono>
#include <string>
#include "../common/CommandRunner.hpp"

namespace lan_watch::core
{
    enum class ProbeOutcome
    {
        Reachable,
        Unreachable,
        TimedOut,
        Lost
    };

    class Prober
    {
    public:
        virtual ~Prober() = default;

        // Must be safe to call from several probe workers at once.
        virtual ProbeOutcome Probe(const std::string &ip, std::chrono::milliseconds timeout) = 0;
    };

    // One `ping` per address: count 1, payload 1 byte.
    class PingCommandProber : public Prober
    {
    public:
        explicit PingCommandProber(common::CommandRunner &runner);

        ProbeOutcome Probe(const std::string &ip, std::chrono::milliseconds timeout) override;

        static std::string BuildCommand(const std::string &ip, std::chrono::milliseconds timeout);

        // Substring classification; any unmatched non-empty output is Reachable.
        static ProbeOutcome ClassifyOutput(const std::string &output);

    private:
        common::CommandRunner &m_runner;
    };

    // ICMP echo through libtins. Needs raw socket privileges.
    class IcmpProber : public Prober
    {
    public:
        ProbeOutcome Probe(const std::string &ip, std::chrono::milliseconds timeout) override;
    };
}
