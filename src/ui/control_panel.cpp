/// @file control_panel.cpp
/// @brief Implements the control panel with custom-drawn Raylib UI elements

#include "ui/control_panel.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace logicsim {

namespace {

// --- Layout constants ---
constexpr float ROW_HEIGHT = 32.0f;
constexpr float ROW_GAP = 8.0f;
constexpr float BUTTON_HEIGHT = 30.0f;
constexpr float BUTTON_SPACING = 4.0f;
constexpr float ARROW_WIDTH = 28.0f;
constexpr float SLIDER_HEIGHT = 20.0f;
constexpr float SLIDER_READOUT_WIDTH = 48.0f;
constexpr float PADDING = 10.0f;
constexpr int FONT_SIZE = 16;
constexpr int FONT_SIZE_SMALL = 13;
constexpr float SPEED_MIN = 0.25f;
constexpr float SPEED_MAX = 10.0f;
constexpr unsigned char HOVER_LIFT = 20;

// --- Colors ---
const Color BG_COLOR = {35, 35, 42, 230};
const Color BORDER_COLOR = {70, 70, 85, 255};
const Color TEXT_COLOR = {220, 220, 230, 255};
const Color LABEL_COLOR = {160, 160, 180, 255};
const Color BUTTON_FILL = {50, 50, 65, 255};
const Color RUN_FILL = {40, 120, 60, 255};
const Color TOGGLE_ON = {40, 160, 70, 255};
const Color SLIDER_TRACK = {50, 50, 60, 255};
const Color SLIDER_FILL = {60, 140, 200, 255};
const Color SLIDER_HANDLE = {180, 180, 200, 255};

Color lighten(Color c) {
    auto lift = [](unsigned char v) {
        return static_cast<unsigned char>(std::min(255, v + HOVER_LIFT));
    };
    return {lift(c.r), lift(c.g), lift(c.b), c.a};
}

void draw_label_centered(const char* text, Rectangle box, Color color) {
    int tw = MeasureText(text, FONT_SIZE_SMALL);
    DrawText(text, static_cast<int>(box.x + (box.width - static_cast<float>(tw)) / 2.0f),
             static_cast<int>(box.y + (box.height - static_cast<float>(FONT_SIZE_SMALL)) / 2.0f),
             FONT_SIZE_SMALL, color);
}

/// Filled, outlined, labeled box. Returns true if clicked this frame.
bool draw_button(const char* text, Rectangle box, Color fill) {
    const bool hovered = CheckCollisionPointRec(GetMousePosition(), box);
    DrawRectangleRec(box, hovered ? lighten(fill) : fill);
    DrawRectangleLinesEx(box, 1.0f, BORDER_COLOR);
    draw_label_centered(text, box, TEXT_COLOR);
    return hovered && IsMouseButtonPressed(MOUSE_BUTTON_LEFT);
}

/// Horizontal slider over [lo, hi] with a numeric readout to its right.
/// Returns true if the value changed.
bool draw_slider(const char* label, float& value, float lo, float hi, bool& dragging,
                 Rectangle track) {
    DrawText(label, static_cast<int>(track.x),
             static_cast<int>(track.y - static_cast<float>(FONT_SIZE_SMALL) - 4.0f),
             FONT_SIZE_SMALL, LABEL_COLOR);

    const Vector2 mouse = GetMousePosition();
    if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT) && CheckCollisionPointRec(mouse, track)) {
        dragging = true;
    } else if (!IsMouseButtonDown(MOUSE_BUTTON_LEFT)) {
        dragging = false;
    }

    const float before = value;
    if (dragging) {
        float t = std::clamp((mouse.x - track.x) / track.width, 0.0f, 1.0f);
        value = lo + t * (hi - lo);
    }
    const float t = std::clamp((value - lo) / (hi - lo), 0.0f, 1.0f);

    DrawRectangleRec(track, SLIDER_TRACK);
    DrawRectangleRec({track.x, track.y, track.width * t, track.height}, SLIDER_FILL);
    DrawRectangleRec({track.x + track.width * t - 4.0f, track.y - 2.0f, 8.0f, track.height + 4.0f},
                     SLIDER_HANDLE);

    char readout[16];
    std::snprintf(readout, sizeof(readout), "%.2fx", static_cast<double>(value));
    DrawText(readout, static_cast<int>(track.x + track.width + 8.0f),
             static_cast<int>(track.y + 2.0f), FONT_SIZE_SMALL, TEXT_COLOR);

    return std::fabs(value - before) > 0.001f;
}

} // namespace

ControlPanelResult draw_control_panel(UIState& state, float panel_x, float panel_y,
                                      float panel_w) {
    ControlPanelResult result;
    UIAction& action = result.action;

    // Title, selector, transport row, slider block, settle toggle, table button
    result.panel_height = PADDING + ROW_HEIGHT + (BUTTON_HEIGHT + ROW_GAP) * 4.0f +
                          ROW_HEIGHT + SLIDER_HEIGHT + PADDING + 4.0f;

    const float content_w = panel_w - 2.0f * PADDING;
    const float cx = panel_x + PADDING;
    float cy = panel_y + PADDING;

    Rectangle panel = {panel_x, panel_y, panel_w, result.panel_height};
    DrawRectangleRec(panel, BG_COLOR);
    DrawRectangleLinesEx(panel, 1.0f, BORDER_COLOR);

    DrawText("SIMULATION", static_cast<int>(cx), static_cast<int>(cy), FONT_SIZE, TEXT_COLOR);
    cy += ROW_HEIGHT;

    // Circuit selector: < name >
    if (draw_button("<", {cx, cy, ARROW_WIDTH, BUTTON_HEIGHT}, BUTTON_FILL)) {
        action.circuit_delta = -1;
    }
    if (draw_button(">", {cx + content_w - ARROW_WIDTH, cy, ARROW_WIDTH, BUTTON_HEIGHT},
                    BUTTON_FILL)) {
        action.circuit_delta = 1;
    }
    draw_label_centered(state.circuit_name.c_str(),
                        {cx + ARROW_WIDTH, cy, content_w - 2.0f * ARROW_WIDTH, BUTTON_HEIGHT},
                        TEXT_COLOR);
    cy += BUTTON_HEIGHT + ROW_GAP;

    // Transport: Run/Pause | Step | Reset
    const float third = (content_w - 2.0f * BUTTON_SPACING) / 3.0f;
    if (draw_button(state.is_running ? "Pause" : "Run", {cx, cy, third, BUTTON_HEIGHT},
                    state.is_running ? BUTTON_FILL : RUN_FILL)) {
        action.run_toggled = true;
    }
    if (draw_button("Step", {cx + third + BUTTON_SPACING, cy, third, BUTTON_HEIGHT},
                    BUTTON_FILL)) {
        action.step_pressed = true;
    }
    if (draw_button("Reset", {cx + 2.0f * (third + BUTTON_SPACING), cy, third, BUTTON_HEIGHT},
                    BUTTON_FILL)) {
        action.reset_pressed = true;
    }
    cy += BUTTON_HEIGHT + ROW_GAP + 4.0f;

    cy += static_cast<float>(FONT_SIZE_SMALL) + 4.0f;
    if (draw_slider("Speed", state.speed, SPEED_MIN, SPEED_MAX, state.dragging_speed,
                    {cx, cy, content_w - SLIDER_READOUT_WIDTH, SLIDER_HEIGHT})) {
        action.speed_changed = true;
    }
    cy += SLIDER_HEIGHT + ROW_HEIGHT - static_cast<float>(FONT_SIZE_SMALL) - 4.0f + ROW_GAP;

    if (draw_button(state.until_stable ? "Settle: until stable" : "Settle: fixed steps",
                    {cx, cy, content_w, BUTTON_HEIGHT},
                    state.until_stable ? TOGGLE_ON : BORDER_COLOR)) {
        state.until_stable = !state.until_stable;
        action.settle_toggled = true;
    }
    cy += BUTTON_HEIGHT + ROW_GAP;

    if (draw_button("Truth Table", {cx, cy, content_w, BUTTON_HEIGHT}, BUTTON_FILL)) {
        action.table_requested = true;
    }

    return result;
}

} // namespace logicsim
