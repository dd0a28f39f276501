#pragma once

#include "pch.hpp"

namespace syscompat::logging
{
    enum class Level
    {
        Off,
        Error,
        Warn,
        Info,
        Debug,
        Trace,
    };

    /** @brief Sets the most verbose level that is still written. Records above it are dropped. */
    void initialize_logger(Level level) noexcept;

    Level level() noexcept;
    bool enabled(Level level) noexcept;

    /** @brief Parses `off`, `error`, `warn`, `info`, `debug` or `trace`. */
    std::optional<Level> parse_level(std::string_view name);

    const char *format_level(Level level) noexcept;

    void write(Level level, const std::string &message);

    template <typename... Args>
    void log(Level level, std::format_string<Args...> fmt, Args &&...args)
    {
        if (enabled(level))
        {
            write(level, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args &&...args)
    {
        log(Level::Error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::format_string<Args...> fmt, Args &&...args)
    {
        log(Level::Warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args &&...args)
    {
        log(Level::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args &&...args)
    {
        log(Level::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void trace(std::format_string<Args...> fmt, Args &&...args)
    {
        log(Level::Trace, fmt, std::forward<Args>(args)...);
    }
}
