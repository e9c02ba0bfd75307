module;

#include <atomic>
#include <iostream>
#include <mutex>
#include <string_view>

module Core:Logging.Impl;
import :Logging;

namespace Core::Log
{
    namespace
    {
        // Global lock to prevent scrambled output from multiple threads
        std::mutex s_LogMutex;

        std::atomic<SinkFn> s_Sink{nullptr};
        std::atomic<Level> s_MinLevel{Level::Debug};

        void PrintColored(Level level, std::string_view msg)
        {
            // ANSI Color Codes
            const char* color = "\033[0m";
            const char* label = "[INFO] ";

            switch (level)
            {
            case Level::Info:    color = "\033[32m"; label = "[INFO] "; break; // Green
            case Level::Warning: color = "\033[33m"; label = "[WARN] "; break; // Yellow
            case Level::Error:   color = "\033[31m"; label = "[ERR]  "; break; // Red
            case Level::Debug:   color = "\033[36m"; label = "[DBG]  "; break; // Cyan
            }

            std::cout << color << label << msg << "\033[0m" << std::endl;
        }
    }

    void SetSink(SinkFn sink)
    {
        s_Sink.store(sink, std::memory_order_release);
    }

    void SetMinLevel(Level level)
    {
        s_MinLevel.store(level, std::memory_order_relaxed);
    }

    Level GetMinLevel()
    {
        return s_MinLevel.load(std::memory_order_relaxed);
    }

    void Write(Level level, std::string_view message)
    {
        if (level < GetMinLevel()) return;

        // Custom sinks run unlocked so they may log themselves.
        if (SinkFn sink = s_Sink.load(std::memory_order_acquire))
        {
            sink(level, message);
            return;
        }

        std::lock_guard lock(s_LogMutex);
        PrintColored(level, message);
    }
}
