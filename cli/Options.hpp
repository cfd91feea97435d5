#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include "../core/MonitorConfig.hpp"

namespace lan_watch::cli
{
    inline constexpr int EXIT_OK = 0;
    inline constexpr int EXIT_USAGE = 1;
    inline constexpr int EXIT_CONFIGURATION = 2;
    inline constexpr int EXIT_RUNTIME = 3;

    class UsageError : public std::invalid_argument
    {
    public:
        explicit UsageError(const std::string &what) : std::invalid_argument(what) {}
    };

    struct Options
    {
        core::MonitorConfig config;
        bool show_help = false;
    };

    // Throws UsageError on unknown options or malformed values.
    Options ParseOptions(int argc, char **argv);

    void PrintHelp(std::ostream &out, const std::string &program_name);
}
