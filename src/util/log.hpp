#pragma once

/// @file log.hpp
/// @brief Leveled stderr logging with fmt-formatted messages

#include <fmt/format.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace logicsim {

enum class LogLevel { DEBUG, INFO, WARNING, ERROR };

/// Returns the upper-case name of a log level ("WARNING", ...)
[[nodiscard]] std::string_view log_level_name(LogLevel level);

/// Parses "debug", "info", "warning" or "error" (case-insensitive)
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

/// Receives every message at or above the current level
using LogSink = std::function<void(LogLevel, std::string_view)>;

void set_log_level(LogLevel level);
[[nodiscard]] LogLevel log_level();

/// Replaces the sink. Passing an empty function restores the stderr sink.
void set_log_sink(LogSink sink);

/// Emits an already formatted message
void log_message(LogLevel level, std::string_view message);

template <typename... Args>
void log_debug(fmt::format_string<Args...> format, Args&&... args) {
    if (log_level() <= LogLevel::DEBUG) {
        log_message(LogLevel::DEBUG, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void log_info(fmt::format_string<Args...> format, Args&&... args) {
    if (log_level() <= LogLevel::INFO) {
        log_message(LogLevel::INFO, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void log_warning(fmt::format_string<Args...> format, Args&&... args) {
    if (log_level() <= LogLevel::WARNING) {
        log_message(LogLevel::WARNING, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void log_error(fmt::format_string<Args...> format, Args&&... args) {
    log_message(LogLevel::ERROR, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace logicsim
