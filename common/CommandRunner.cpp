#include "CommandRunner.hpp"
#include <cstdio>
#include <iostream>

namespace lan_watch::common
{
    std::optional<std::string> ShellCommandRunner::Run(const std::string &command)
    {
        std::string full = command + " 2>&1";
        FILE *stream = popen(full.c_str(), "r");
        if (!stream)
        {
            std::cerr << "[Command] Unable to execute: " << command << "\n";
            return std::nullopt;
        }

        std::string result;
        char buffer[256];
        while (fgets(buffer, sizeof(buffer), stream) != nullptr)
        {
            result += buffer;
        }
        pclose(stream);
        return result;
    }

    std::string ShellQuote(const std::string &arg)
    {
        std::string quoted = "'";
        for (char c : arg)
        {
            if (c == '\'')
                quoted += "'\\''";
            else
                quoted += c;
        }
        quoted += "'";
        return quoted;
    }
}
