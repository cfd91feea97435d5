#include "Prober.hpp"
#include <tins/tins.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <memory>
#include <sstream>

namespace lan_watch::core
{
    PingCommandProber::PingCommandProber(common::CommandRunner &runner) : m_runner(runner)
    {
    }

    std::string PingCommandProber::BuildCommand(const std::string &ip, std::chrono::milliseconds timeout)
    {
        // ping -W takes whole seconds.
        long long seconds = std::max<long long>(1, (timeout.count() + 999) / 1000);

        std::stringstream ss;
        ss << "ping -n -c 1 -s 1 -W " << seconds << " " << common::ShellQuote(ip);
        return ss.str();
    }

    ProbeOutcome PingCommandProber::ClassifyOutput(const std::string &output)
    {
        if (output.find_first_not_of(" \t\r\n") == std::string::npos)
            return ProbeOutcome::Lost;

        std::string lowered = output;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);

        if (lowered.find("unreachable") != std::string::npos)
            return ProbeOutcome::Unreachable;
        if (lowered.find("timed out") != std::string::npos)
            return ProbeOutcome::TimedOut;

        static const std::array<const char *, 3> loss_markers = {"100% packet loss", "100% loss", "100% lost"};
        for (const char *marker : loss_markers)
        {
            if (lowered.find(marker) != std::string::npos)
                return ProbeOutcome::Lost;
        }
        return ProbeOutcome::Reachable;
    }

    ProbeOutcome PingCommandProber::Probe(const std::string &ip, std::chrono::milliseconds timeout)
    {
        auto output = m_runner.Run(BuildCommand(ip, timeout));
        if (!output)
            return ProbeOutcome::Lost;
        return ClassifyOutput(*output);
    }

    ProbeOutcome IcmpProber::Probe(const std::string &ip, std::chrono::milliseconds timeout)
    {
        try
        {
            Tins::NetworkInterface iface = Tins::NetworkInterface::default_interface();

            uint32_t seconds = static_cast<uint32_t>(timeout.count() / 1000);
            uint32_t usec = static_cast<uint32_t>((timeout.count() % 1000) * 1000);
            Tins::PacketSender sender(iface, seconds, usec);

            Tins::IP packet = Tins::IP(ip) / Tins::ICMP();
            Tins::ICMP &icmp = packet.rfind_pdu<Tins::ICMP>();
            icmp.type(Tins::ICMP::ECHO_REQUEST);
            icmp.id(0x1337);
            icmp.sequence(1);

            std::unique_ptr<Tins::PDU> reply(sender.send_recv(packet, iface));
            if (!reply)
                return ProbeOutcome::TimedOut;

            const Tins::ICMP *answer = reply->find_pdu<Tins::ICMP>();
            if (answer && answer->type() == Tins::ICMP::ECHO_REPLY)
                return ProbeOutcome::Reachable;
            return ProbeOutcome::Unreachable;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Prober] ICMP probe to " << ip << " failed: " << e.what() << "\n";
        }
        return ProbeOutcome::Lost;
    }
}
