module;

#include <iostream>
#include <mutex>
#include <string_view>

module Core:Logging.Impl;

import :Logging;

namespace Core::Log
{
    namespace
    {
        std::mutex s_LogMutex;

        struct Style
        {
            const char* Color;
            const char* Label;
        };

        constexpr Style StyleFor(Level level)
        {
            switch (level)
            {
            case Level::Info:    return {"\033[32m", "[INFO] "};
            case Level::Warning: return {"\033[33m", "[WARN] "};
            case Level::Error:   return {"\033[31m", "[ERR]  "};
            case Level::Debug:   return {"\033[36m", "[DBG]  "};
            }
            return {"\033[0m", "[INFO] "};
        }
    }

    void Write(Level level, std::string_view msg)
    {
        const Style style = StyleFor(level);

        std::lock_guard lock(s_LogMutex);
        // Errors go to stderr so test runners keep them apart from progress output.
        std::ostream& out = (level == Level::Error) ? std::cerr : std::cout;
        out << style.Color << style.Label << msg << "\033[0m" << std::endl;
    }
}
