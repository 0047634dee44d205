module;

#include <iostream>
#include <mutex>
#include <string_view>

module Core;

namespace Core::Log
{
    namespace
    {
        std::mutex s_LogMutex;
    }

    void PrintColored(Level level, std::string_view msg)
    {
        std::lock_guard lock(s_LogMutex);

        const char* color = "\033[0m";
        const char* label = "[INFO] ";

        switch (level)
        {
        case Level::Info:    color = "\033[32m"; label = "[INFO] "; break;
        case Level::Warning: color = "\033[33m"; label = "[WARN] "; break;
        case Level::Error:   color = "\033[31m"; label = "[ERR]  "; break;
        case Level::Debug:   color = "\033[36m"; label = "[DBG]  "; break;
        }

        // Errors go to stderr so test output keeps them apart from progress lines.
        std::ostream& out = (level == Level::Error) ? std::cerr : std::cout;
        out << color << label << msg << "\033[0m" << '\n';
        if (level == Level::Error) out.flush();
    }
}
