/// @file main.cpp
/// @brief Logicsim entry point, an interactive digital logic circuit viewer
///
/// Loads a small project of example circuits (gates, adders, and adders built
/// from nested sub-circuits), steps the selected one on a timer, lets the
/// user flip input switches with the mouse, and shows its truth table.
/// Supports both native desktop and Emscripten/WASM builds.

#include "rendering/circuit_renderer.hpp"
#include "service/truth_table.hpp"
#include "simulation/circuit.hpp"
#include "simulation/circuit_builder.hpp"
#include "simulation/config.hpp"
#include "simulation/project.hpp"
#include "simulation/simulation_context.hpp"
#include "timing/step_scheduler.hpp"
#include "ui/control_panel.hpp"
#include "ui/truth_table_panel.hpp"
#include "util/log.hpp"

#include <raylib.h>

#ifdef __EMSCRIPTEN__
#include <emscripten/emscripten.h>
#endif

#include <memory>
#include <optional>
#include <string>

namespace {

constexpr int INITIAL_WIDTH = 1280;
constexpr int INITIAL_HEIGHT = 720;
constexpr int MIN_WIDTH = 900;
constexpr int MIN_HEIGHT = 500;
constexpr int TARGET_FPS = 60;
constexpr float MAX_PIXELS_PER_UNIT = 2.5f; // Upper bound for scale
constexpr float UI_PANEL_WIDTH = 260.0f;
constexpr float UI_MARGIN = 10.0f;
constexpr float CIRCUIT_PADDING = 40.0f; // Pixels of padding around the circuit
constexpr float TITLE_HEIGHT = 40.0f;

constexpr int EXAMPLE_ADDER_BITS = 2;

/// All mutable state needed by the frame loop, bundled so it can be passed
/// through Emscripten's void* callback.
struct FrameState {
    logicsim::SimulationConfig config;
    logicsim::Project project{"Examples"};
    logicsim::SimulationContext context;
    logicsim::StepScheduler scheduler{nullptr};
    logicsim::TruthTableService service;
    std::optional<logicsim::TruthTableView> table_view;
    logicsim::UIState ui;
    logicsim::Viewport view;
};

void populate_project(logicsim::Project& project) {
    project.add_circuit(logicsim::build_and_circuit());
    project.add_circuit(logicsim::build_xor_circuit());
    project.add_circuit(logicsim::build_half_adder());
    project.add_circuit(logicsim::build_full_adder(project));
    project.add_circuit(logicsim::build_ripple_carry_adder(project, EXAMPLE_ADDER_BITS));
}

logicsim::TruthTableOptions table_options(const FrameState& state) {
    logicsim::TruthTableOptions options;
    options.mode = state.ui.until_stable ? logicsim::SettleMode::UNTIL_STABLE
                                         : logicsim::SettleMode::FIXED_STEPS;
    options.settle_steps = state.config.truth_table_settle_steps;
    options.max_settle_steps = state.config.max_settle_steps;
    return options;
}

/// Recomputes scale and offset to fit the circuit in the current window.
/// Called on circuit change and on window resize.
void refit_circuit(FrameState& state) {
    const logicsim::Circuit* circuit = state.project.current_circuit();
    if (circuit == nullptr) {
        return;
    }
    float screen_w = static_cast<float>(GetScreenWidth());
    float screen_h = static_cast<float>(GetScreenHeight());
    Rectangle area = {0.0f, TITLE_HEIGHT, screen_w - UI_PANEL_WIDTH - 2.0f * UI_MARGIN,
                      screen_h - TITLE_HEIGHT};
    state.view = logicsim::fit_viewport(*circuit, area, CIRCUIT_PADDING, MAX_PIXELS_PER_UNIT);
}

/// Points the context at the project's current circuit and starts it from all-low
void activate_current_circuit(FrameState& state) {
    logicsim::Circuit* circuit = state.project.current_circuit();
    state.context.stop();
    state.context.set_circuit(circuit);
    state.scheduler.set_context(&state.context);
    state.context.reset();
    state.table_view.reset();
    state.ui.is_running = false;
    state.ui.circuit_name = circuit != nullptr ? circuit->get_name() : std::string();
    refit_circuit(state);
    logicsim::log_info("showing circuit '{}'", state.ui.circuit_name);
}

/// Moves the current circuit @p delta places through the project, wrapping
void select_circuit(FrameState& state, int delta) {
    const auto& circuits = state.project.circuits();
    if (circuits.empty()) {
        return;
    }
    const int count = static_cast<int>(circuits.size());
    int index = 0;
    for (int i = 0; i < count; i++) {
        if (circuits[static_cast<size_t>(i)].get() == state.project.current_circuit()) {
            index = i;
        }
    }
    index = ((index + delta) % count + count) % count;
    state.project.set_current_circuit(circuits[static_cast<size_t>(index)].get());
    activate_current_circuit(state);
}

/// Tables are generated on a copy so the displayed switch settings survive
void regenerate_truth_table(FrameState& state) {
    const logicsim::Circuit* circuit = state.project.current_circuit();
    if (circuit == nullptr) {
        return;
    }
    state.service.set_options(table_options(state));
    std::unique_ptr<logicsim::Circuit> copy = circuit->clone();
    state.table_view = logicsim::build_truth_table_view(state.service, *copy);
}

void toggle_switch_under_mouse(FrameState& state, float circuit_area_w) {
    logicsim::Circuit* circuit = state.project.current_circuit();
    Vector2 mouse = GetMousePosition();
    if (circuit == nullptr || mouse.x >= circuit_area_w) {
        return;
    }
    logicsim::Component* component = circuit->find_component_at(state.view.to_canvas(mouse));
    if (component != nullptr && component->get_type() == logicsim::ComponentType::INPUT_SWITCH) {
        component->toggle();
        logicsim::log_debug("switch '{}' -> {}", component->get_name(),
                            component->get_state() ? 1 : 0);
    }
}

/// One frame of the application, called each tick by the native loop or by
/// emscripten_set_main_loop_arg.
void frame_tick(FrameState& state) {
    auto& ui = state.ui;
    float dt = GetFrameTime();

    // --- Detect window resize and refit circuit ---
    if (IsWindowResized()) {
        refit_circuit(state);
    }

    int screen_w = GetScreenWidth();
    int screen_h = GetScreenHeight();
    float circuit_area_w = static_cast<float>(screen_w) - UI_PANEL_WIDTH - UI_MARGIN;

    // --- Handle keyboard shortcuts ---
    if (IsKeyPressed(KEY_SPACE)) {
        state.scheduler.toggle_running();
    }
    if (IsKeyPressed(KEY_RIGHT)) {
        state.scheduler.request_step();
    }
    if (IsKeyPressed(KEY_R)) {
        state.scheduler.reset();
    }
    if (IsKeyPressed(KEY_TAB)) {
        select_circuit(state, 1);
    }
    if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
        toggle_switch_under_mouse(state, circuit_area_w);
    }

    // --- Update simulation ---
    state.scheduler.tick(dt);
    ui.is_running = state.scheduler.is_running();

    // --- Draw ---
    BeginDrawing();
    ClearBackground({25, 25, 30, 255});
    DrawRectangle(0, static_cast<int>(TITLE_HEIGHT), static_cast<int>(circuit_area_w),
                  screen_h - static_cast<int>(TITLE_HEIGHT), {236, 236, 240, 255});

    if (const logicsim::Circuit* circuit = state.project.current_circuit(); circuit != nullptr) {
        logicsim::draw_connectors(*circuit, state.view);
        logicsim::draw_components(*circuit, state.view);

        int title_width = MeasureText(circuit->get_name().c_str(), 24);
        DrawText(circuit->get_name().c_str(),
                 static_cast<int>((circuit_area_w - static_cast<float>(title_width)) / 2.0f), 10,
                 24, {240, 240, 240, 255});
    }

    // --- Right-side UI panels ---
    float panel_x = static_cast<float>(screen_w) - UI_PANEL_WIDTH - UI_MARGIN;

    logicsim::ControlPanelResult control =
        logicsim::draw_control_panel(ui, panel_x, UI_MARGIN, UI_PANEL_WIDTH);

    if (state.table_view.has_value()) {
        float table_y = UI_MARGIN + control.panel_height + UI_MARGIN;
        logicsim::draw_truth_table_panel(*state.table_view, panel_x, table_y, UI_PANEL_WIDTH,
                                         static_cast<float>(screen_h) - table_y - UI_MARGIN);
    }

    // --- HUD: run state and step count ---
    DrawText(ui.is_running ? "RUNNING" : "PAUSED", 10, screen_h - 50, 14,
             ui.is_running ? Color{80, 220, 100, 255} : Color{255, 200, 80, 255});
    std::string steps_str = "Steps: " + std::to_string(state.context.step_count());
    DrawText(steps_str.c_str(), 10, screen_h - 32, 13, {90, 90, 100, 255});

    EndDrawing();

    // --- Process UI actions (take effect next frame) ---
    const logicsim::UIAction& action = control.action;
    if (action.circuit_delta != 0) {
        select_circuit(state, action.circuit_delta);
    }
    if (action.run_toggled) {
        state.scheduler.toggle_running();
    }
    if (action.step_pressed) {
        state.scheduler.request_step();
    }
    if (action.reset_pressed) {
        state.scheduler.reset();
    }
    if (action.speed_changed) {
        state.scheduler.set_speed(ui.speed);
    }
    if (action.settle_toggled && state.table_view.has_value()) {
        regenerate_truth_table(state);
    }
    if (action.table_requested) {
        regenerate_truth_table(state);
    }
}

#ifdef __EMSCRIPTEN__
/// Emscripten main loop callback, unwraps the void* to FrameState.
void emscripten_frame(void* arg) {
    auto* state = static_cast<FrameState*>(arg);
    frame_tick(*state);
}
#endif

} // namespace

int main() {
    // --- Create all mutable state ---
    FrameState state;
    state.config = logicsim::load_config_from_env();
    logicsim::set_log_level(state.config.log_level);
    state.scheduler.set_interval(state.config.step_interval);
    state.ui.until_stable = state.config.settle_mode == logicsim::SettleMode::UNTIL_STABLE;
    populate_project(state.project);

    // --- Initialize Raylib window ---
    SetTraceLogLevel(LOG_WARNING);
    SetConfigFlags(FLAG_WINDOW_RESIZABLE);
    InitWindow(INITIAL_WIDTH, INITIAL_HEIGHT, "Logicsim - Digital Logic Simulator");
    SetWindowMinSize(MIN_WIDTH, MIN_HEIGHT);
    SetTargetFPS(TARGET_FPS);

    activate_current_circuit(state);

#ifdef __EMSCRIPTEN__
    // Emscripten owns the main loop; state is passed via void*.
    emscripten_set_main_loop_arg(emscripten_frame, &state, 0, 1);
#else
    while (!WindowShouldClose()) {
        frame_tick(state);
    }
#endif

    CloseWindow();
    return 0;
}
