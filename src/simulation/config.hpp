#pragma once

/// @file config.hpp
/// @brief Simulation tunables and their environment overrides

#include "simulation/simulation_context.hpp"
#include "util/log.hpp"

#include <optional>
#include <string_view>

namespace logicsim {

struct SimulationConfig {
    float step_interval = 0.1f;        ///< Seconds between scheduled steps while running
    SettleMode settle_mode = SettleMode::FIXED_STEPS;
    int truth_table_settle_steps = 5;  ///< Steps per row in FIXED_STEPS mode
    int max_settle_steps = 64;         ///< Cap per row in UNTIL_STABLE mode
    LogLevel log_level = LogLevel::INFO;
};

/// Starts from the defaults and applies, when set:
///   LOGICSIM_LOG_LEVEL      debug | info | warning | error
///   LOGICSIM_STEP_INTERVAL  seconds, > 0
///   LOGICSIM_SETTLE_MODE    fixed | stable
///   LOGICSIM_SETTLE_STEPS   steps per row, > 0
/// Unparseable values are reported and ignored.
[[nodiscard]] SimulationConfig load_config_from_env();

/// Parses "fixed" or "stable" (case-insensitive)
[[nodiscard]] std::optional<SettleMode> parse_settle_mode(std::string_view text);

} // namespace logicsim
