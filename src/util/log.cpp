/// @file log.cpp
/// @brief Log level state and the default stderr sink

#include "util/log.hpp"

#include <cctype>
#include <cstdio>

namespace logicsim {

namespace {

LogLevel g_level = LogLevel::INFO;
LogSink g_sink;

void stderr_sink(LogLevel level, std::string_view message) {
    fmt::print(stderr, "[logicsim] {}: {}\n", log_level_name(level), message);
}

} // namespace

std::string_view log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERROR:
        return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "debug") {
        return LogLevel::DEBUG;
    }
    if (lower == "info") {
        return LogLevel::INFO;
    }
    if (lower == "warning" || lower == "warn") {
        return LogLevel::WARNING;
    }
    if (lower == "error") {
        return LogLevel::ERROR;
    }
    return std::nullopt;
}

void set_log_level(LogLevel level) {
    g_level = level;
}

LogLevel log_level() {
    return g_level;
}

void set_log_sink(LogSink sink) {
    g_sink = std::move(sink);
}

void log_message(LogLevel level, std::string_view message) {
    if (level < g_level) {
        return;
    }
    if (g_sink) {
        g_sink(level, message);
    } else {
        stderr_sink(level, message);
    }
}

} // namespace logicsim
