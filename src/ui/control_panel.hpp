/// @file control_panel.hpp
/// @brief UI panel for simulation controls: run/pause, step, reset, speed, circuit selection.
///
/// All UI is drawn using Raylib primitives (no raygui/ImGui). The panel
/// reports actions back to the caller so the main loop can drive the
/// scheduler and switch circuits accordingly.

#pragma once

#include <raylib.h>

#include <string>

namespace logicsim {

/// Actions the control panel can request from the main loop
struct UIAction {
    bool run_toggled = false;     ///< Start or stop the running simulation
    bool step_pressed = false;    ///< Run exactly one step
    bool reset_pressed = false;   ///< Reset the circuit to all-low
    bool speed_changed = false;   ///< Speed slider was dragged
    int circuit_delta = 0;        ///< -1 / +1 to select the previous / next circuit
    bool settle_toggled = false;  ///< Switch truth tables between fixed and until-stable
    bool table_requested = false; ///< Regenerate the truth table
};

struct ControlPanelResult {
    UIAction action;
    float panel_height = 0.0f;
};

/// Persistent UI state: Kept across frames
struct UIState {
    float speed = 1.0f;
    bool is_running = false;
    bool until_stable = false;
    std::string circuit_name;

    // Slider drag state
    bool dragging_speed = false;
};

/// Draws the control panel and handles mouse interaction.
/// @param state  Mutable UI state (persists across frames)
/// @param panel_x Left edge of the panel in screen coordinates
/// @param panel_y Top edge of the panel in screen coordinates
/// @param panel_w Width of the panel
/// @return Actions and rendered panel height for dynamic panel stacking
ControlPanelResult draw_control_panel(UIState& state, float panel_x, float panel_y, float panel_w);

} // namespace logicsim
