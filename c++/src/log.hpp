#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

enum class LogLevel
{
    debug,
    info,
    warning,
    error
};

void set_log_level(LogLevel level);
LogLevel log_level();

/**
 * Parses "debug", "info", "warning" or "error".
 *
 * @throws std::invalid_argument on any other value
 */
LogLevel parse_log_level(std::string_view name);

void log_message(LogLevel level, std::string_view message);

template <typename... Args>
void log_debug(fmt::format_string<Args...> format, Args &&...args)
{
    if (log_level() <= LogLevel::debug)
        log_message(LogLevel::debug,
                    fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void log_info(fmt::format_string<Args...> format, Args &&...args)
{
    if (log_level() <= LogLevel::info)
        log_message(LogLevel::info,
                    fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void log_warning(fmt::format_string<Args...> format, Args &&...args)
{
    if (log_level() <= LogLevel::warning)
        log_message(LogLevel::warning,
                    fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void log_error(fmt::format_string<Args...> format, Args &&...args)
{
    log_message(LogLevel::error,
                fmt::format(format, std::forward<Args>(args)...));
}
