#include "logging.hpp"

namespace
{
    std::atomic<int> _level = static_cast<int>(syscompat::logging::Level::Warn);
}

namespace syscompat::logging
{
    void initialize_logger(Level level) noexcept
    {
        _level.store(static_cast<int>(level));
    }

    Level level() noexcept
    {
        return static_cast<Level>(_level.load());
    }

    bool enabled(Level level) noexcept
    {
        return level != Level::Off && static_cast<int>(level) <= _level.load();
    }

    std::optional<Level> parse_level(std::string_view name)
    {
        for (auto level : {Level::Off, Level::Error, Level::Warn, Level::Info, Level::Debug, Level::Trace})
        {
            if (name == format_level(level))
            {
                return level;
            }
        }

        return std::nullopt;
    }

    const char *format_level(Level level) noexcept
    {
        switch (level)
        {
        case Level::Off:
            return "off";
        case Level::Error:
            return "error";
        case Level::Warn:
            return "warn";
        case Level::Info:
            return "info";
        case Level::Debug:
            return "debug";
        case Level::Trace:
            return "trace";
        default:
            return "unknown";
        }
    }

    void write(Level level, const std::string &message)
    {
        std::cerr << "[" << format_level(level) << "] " << message << std::endl;
    }
}
