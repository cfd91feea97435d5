#pragma once

#include <optional>
#include <string>

namespace lan_watch::common
{
    class CommandRunner
    {
    public:
        virtual ~CommandRunner() = default;

        // Captured stdout, or nullopt when the command could not be started.
        virtual std::optional<std::string> Run(const std::string &command) = 0;
    };

    class ShellCommandRunner : public CommandRunner
    {
    public:
        std::optional<std::string> Run(const std::string &command) override;
    };

    // Single-quotes an argument for /bin/sh.
    std::string ShellQuote(const std::string &arg);
}
