#include <atomic>
#include <ctime>
#include <mutex>
#include <stdexcept>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include "log.hpp"

static std::atomic<LogLevel> current_level{LogLevel::info};
static std::mutex output_mutex;

static const char *level_name(LogLevel level)
{
    switch (level)
    {
    case LogLevel::debug:
        return "debug";
    case LogLevel::info:
        return "info";
    case LogLevel::warning:
        return "warning";
    case LogLevel::error:
        return "error";
    }
    return "?";
}

void set_log_level(LogLevel level) { current_level = level; }

LogLevel log_level() { return current_level.load(); }

LogLevel parse_log_level(std::string_view name)
{
    for (auto level : {LogLevel::debug, LogLevel::info, LogLevel::warning,
                       LogLevel::error})
    {
        if (name == level_name(level))
        {
            return level;
        }
    }
    throw std::invalid_argument(fmt::format("unknown log level '{}'", name));
}

void log_message(LogLevel level, std::string_view message)
{
    auto now = std::time(nullptr);
    std::lock_guard _lock{output_mutex};
    fmt::print(stderr, "{:%Y-%m-%d %H:%M:%S} [{}] {}\n", fmt::localtime(now),
               level_name(level), message);
}
