/// @file config.cpp
/// @brief Environment overrides for SimulationConfig

#include "simulation/config.hpp"

#include <cctype>
#include <cstdlib>
#include <exception>
#include <string>

namespace logicsim {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

void report_ignored(const char* name, const char* value) {
    log_warning("ignoring {}={}: unrecognized value", name, value);
}

} // namespace

std::optional<SettleMode> parse_settle_mode(std::string_view text) {
    std::string lower;
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "fixed") {
        return SettleMode::FIXED_STEPS;
    }
    if (lower == "stable") {
        return SettleMode::UNTIL_STABLE;
    }
    return std::nullopt;
}

SimulationConfig load_config_from_env() {
    SimulationConfig config;

    if (const char* value = env("LOGICSIM_LOG_LEVEL")) {
        if (auto level = parse_log_level(value)) {
            config.log_level = *level;
        } else {
            report_ignored("LOGICSIM_LOG_LEVEL", value);
        }
    }

    if (const char* value = env("LOGICSIM_STEP_INTERVAL")) {
        try {
            float interval = std::stof(value);
            if (interval > 0.0f) {
                config.step_interval = interval;
            } else {
                report_ignored("LOGICSIM_STEP_INTERVAL", value);
            }
        } catch (const std::exception&) {
            report_ignored("LOGICSIM_STEP_INTERVAL", value);
        }
    }

    if (const char* value = env("LOGICSIM_SETTLE_MODE")) {
        if (auto mode = parse_settle_mode(value)) {
            config.settle_mode = *mode;
        } else {
            report_ignored("LOGICSIM_SETTLE_MODE", value);
        }
    }

    if (const char* value = env("LOGICSIM_SETTLE_STEPS")) {
        try {
            int steps = std::stoi(value);
            if (steps > 0) {
                config.truth_table_settle_steps = steps;
            } else {
                report_ignored("LOGICSIM_SETTLE_STEPS", value);
            }
        } catch (const std::exception&) {
            report_ignored("LOGICSIM_SETTLE_STEPS", value);
        }
    }

    return config;
}

} // namespace logicsim
