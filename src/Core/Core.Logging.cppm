module;
#include <format>
#include <string_view>
#include <utility>

export module Core:Logging;

export namespace Core::Log
{
    enum class Level
    {
        Debug = 0,
        Info,
        Warning,
        Error
    };

    // Receives every message that passes the level filter.
    // Default sink writes colored lines to stdout.
    using SinkFn = void (*)(Level level, std::string_view message);

    // Replace the output sink. Passing nullptr restores the console sink.
    // The sink is called without the console lock held and must do its own
    // synchronisation if it is shared between threads.
    void SetSink(SinkFn sink);

    // Messages below this level are dropped before formatting reaches the sink.
    void SetMinLevel(Level level);
    [[nodiscard]] Level GetMinLevel();

    void Write(Level level, std::string_view message);

    // -------------------------------------------------------------------------
    // Public API
    // -------------------------------------------------------------------------

    template <typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        if (GetMinLevel() > Level::Info) return;
        Write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        if (GetMinLevel() > Level::Warning) return;
        Write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        Write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template <typename... Args>
    void Debug(std::format_string<Args...> fmt, Args&&... args)
    {
#ifndef NDEBUG
        if (GetMinLevel() > Level::Debug) return;
        Write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#else
        (void)fmt;
        ((void)args, ...);
#endif
    }
}
