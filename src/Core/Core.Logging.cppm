module;
#include <format>
#include <string_view>
#include <utility>

export module Core:Logging;

export namespace Core::Log
{
    enum class Level
    {
        Info,
        Warning,
        Error,
        Debug
    };

    // Defined in Core.Logging.cpp; serialized by a global lock so lines from the
    // tick thread and physics workers never interleave.
    void PrintColored(Level level, std::string_view msg);

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        PrintColored(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        PrintColored(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        PrintColored(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template<typename... Args>
    void Debug([[maybe_unused]] std::format_string<Args...> fmt, [[maybe_unused]] Args&&... args)
    {
#ifndef NDEBUG
        PrintColored(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }
}
