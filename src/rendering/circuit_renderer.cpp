/// @file circuit_renderer.cpp
/// @brief Draws components and connectors with value-driven coloring

#include "rendering/circuit_renderer.hpp"

#include "simulation/sub_circuit.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

namespace logicsim {

namespace {

// --- Color palette ---
const Color COMPONENT_FILL = {245, 245, 250, 255};
const Color COMPONENT_OUTLINE = {60, 60, 70, 255};
const Color SWITCH_ON_FILL = {30, 180, 60, 255};
const Color SWITCH_OFF_FILL = {200, 200, 205, 255};
const Color LED_LIT = {240, 60, 40, 255};
const Color LED_DARK = {90, 40, 40, 255};
const Color SUB_FILL = {225, 230, 250, 255};
const Color FAILED_OUTLINE = {220, 50, 50, 255};
const Color LABEL_COLOR = {30, 30, 35, 255};
const Color PORT_HIGH = {50, 220, 80, 255};
const Color PORT_LOW = {40, 40, 40, 255};
const Color DETACHED_COLOR = {200, 120, 40, 255};
const Color TOOLTIP_BG = {24, 24, 32, 245};
const Color TOOLTIP_BORDER = {95, 95, 120, 255};
const Color TOOLTIP_TITLE = {226, 226, 236, 255};
const Color TOOLTIP_BODY = {190, 208, 228, 255};

constexpr float CORNER_ROUNDNESS = 0.3f;
constexpr int CORNER_SEGMENTS = 4;
constexpr float OUTLINE_THICKNESS = 2.0f;
constexpr int FONT_SIZE_LABEL = 14;
constexpr float PORT_RADIUS = 3.5f;
constexpr float WIRE_LOW_THICKNESS = 1.5f;
constexpr float WIRE_HIGH_THICKNESS = 3.0f;

Color to_color(Rgb rgb) {
    return {rgb.r, rgb.g, rgb.b, 255};
}

Rectangle footprint(const Component& component, const Viewport& view) {
    Vector2 p = view.to_screen(component.get_position());
    return {p.x, p.y, COMPONENT_WIDTH * view.scale, COMPONENT_HEIGHT * view.scale};
}

Color component_fill(const Component& component) {
    switch (component.get_type()) {
    case ComponentType::INPUT_SWITCH:
        return component.get_state() ? SWITCH_ON_FILL : SWITCH_OFF_FILL;
    case ComponentType::SUB_CIRCUIT:
        return SUB_FILL;
    case ComponentType::AND:
    case ComponentType::OR:
    case ComponentType::NOT:
    case ComponentType::LED_OUTPUT:
        break;
    }
    return COMPONENT_FILL;
}

/// Box label: gate kind for gates, the component name otherwise
std::string component_label(const Component& component) {
    switch (component.get_type()) {
    case ComponentType::AND:
    case ComponentType::OR:
    case ComponentType::NOT:
        return std::string(component_type_name(component.get_type()));
    case ComponentType::INPUT_SWITCH:
    case ComponentType::LED_OUTPUT:
    case ComponentType::SUB_CIRCUIT:
        break;
    }
    return component.get_name();
}

void draw_ports(const std::vector<Port>& ports, const Viewport& view) {
    for (const Port& port : ports) {
        DrawCircleV(view.to_screen(port.get_position()), PORT_RADIUS * std::max(view.scale, 1.0f),
                    port.get_value() ? PORT_HIGH : PORT_LOW);
    }
}

void draw_tooltip(const Component& component, Rectangle anchor) {
    std::vector<std::string> lines;
    std::string title = component.get_name() + " (" +
                        std::string(component_type_name(component.get_type())) + ")";

    std::string io = "in: ";
    for (size_t i = 0; i < component.input_count(); i++) {
        io += component.input_ports()[i].get_value() ? '1' : '0';
        if (i + 1 < component.input_count()) {
            io += ", ";
        }
    }
    io += "   out: ";
    for (size_t i = 0; i < component.output_count(); i++) {
        io += component.output_ports()[i].get_value() ? '1' : '0';
        if (i + 1 < component.output_count()) {
            io += ", ";
        }
    }
    lines.push_back(io);

    if (const SubCircuit* sub = component.sub_circuit(); sub != nullptr) {
        lines.push_back("circuit: " + sub->reference().circuit_name);
        switch (sub->state()) {
        case LoadState::UNLOADED:
            lines.emplace_back("not loaded yet");
            break;
        case LoadState::LOADED:
            lines.push_back(std::to_string(sub->input_count()) + " inputs, " +
                            std::to_string(sub->output_count()) + " outputs");
            break;
        case LoadState::FAILED:
            lines.push_back("failed: " + sub->load_error());
            break;
        }
    }

    int width = MeasureText(title.c_str(), 14);
    for (const std::string& line : lines) {
        width = std::max(width, MeasureText(line.c_str(), 13));
    }
    const float tip_width = static_cast<float>(width) + 20.0f;
    const float tip_height = 30.0f + static_cast<float>(lines.size()) * 17.0f;
    Rectangle tip = {anchor.x + anchor.width + 10.0f, anchor.y - 6.0f, tip_width, tip_height};

    if (tip.x + tip.width > static_cast<float>(GetScreenWidth()) - 6.0f) {
        tip.x = anchor.x - tip.width - 10.0f;
    }
    tip.x = std::clamp(tip.x, 6.0f, std::max(6.0f, static_cast<float>(GetScreenWidth()) - tip.width - 6.0f));
    tip.y = std::clamp(tip.y, 6.0f, std::max(6.0f, static_cast<float>(GetScreenHeight()) - tip.height - 6.0f));

    DrawRectangleRounded({tip.x + 2.0f, tip.y + 3.0f, tip.width, tip.height}, 0.16f, 4,
                         {0, 0, 0, 100});
    DrawRectangleRounded(tip, 0.16f, 4, TOOLTIP_BG);
    DrawRectangleRoundedLines(tip, 0.16f, 4, 1.0f, TOOLTIP_BORDER);

    DrawText(title.c_str(), static_cast<int>(tip.x + 10), static_cast<int>(tip.y + 8), 14,
             TOOLTIP_TITLE);
    int y = static_cast<int>(tip.y + 28);
    for (const std::string& line : lines) {
        DrawText(line.c_str(), static_cast<int>(tip.x + 10), y, 13, TOOLTIP_BODY);
        y += 17;
    }
}

} // namespace

Viewport fit_viewport(const Circuit& circuit, Rectangle area, float padding, float max_scale) {
    Viewport view;
    if (circuit.num_components() == 0) {
        view.offset = {area.x + padding, area.y + padding};
        return view;
    }

    float min_x = std::numeric_limits<float>::max();
    float min_y = std::numeric_limits<float>::max();
    float max_x = std::numeric_limits<float>::lowest();
    float max_y = std::numeric_limits<float>::lowest();
    for (const auto& component : circuit.components()) {
        Vec2 p = component->get_position();
        min_x = std::min(min_x, p.x);
        min_y = std::min(min_y, p.y);
        max_x = std::max(max_x, p.x + COMPONENT_WIDTH);
        max_y = std::max(max_y, p.y + COMPONENT_HEIGHT);
    }

    float bbox_w = max_x - min_x;
    float bbox_h = max_y - min_y;
    float available_w = area.width - 2.0f * padding;
    float available_h = area.height - 2.0f * padding;

    view.scale = std::min({available_w / bbox_w, available_h / bbox_h, max_scale});
    if (view.scale < 0.25f) view.scale = 0.25f; // Floor to keep things visible

    view.offset = {area.x + (area.width - bbox_w * view.scale) / 2.0f - min_x * view.scale,
                   area.y + (area.height - bbox_h * view.scale) / 2.0f - min_y * view.scale};
    return view;
}

void draw_connectors(const Circuit& circuit, const Viewport& view) {
    for (const auto& connector : circuit.connectors()) {
        Vector2 from = view.to_screen(connector->start_position());
        Vector2 to = view.to_screen(connector->end_position());

        Color color = to_color(connector->color());
        float thickness = connector->get_value() ? WIRE_HIGH_THICKNESS : WIRE_LOW_THICKNESS;
        if (!connector->is_attached()) {
            color = DETACHED_COLOR;
            thickness = WIRE_LOW_THICKNESS;
        }

        // Right-angle route through the horizontal midpoint
        float mid_x = (from.x + to.x) / 2.0f;
        if (to.x < from.x) {
            mid_x = from.x + 10.0f * view.scale;
        }
        Vector2 bend_a = {mid_x, from.y};
        Vector2 bend_b = {mid_x, to.y};
        DrawLineEx(from, bend_a, thickness, color);
        DrawLineEx(bend_a, bend_b, thickness, color);
        DrawLineEx(bend_b, to, thickness, color);
    }
}

void draw_components(const Circuit& circuit, const Viewport& view) {
    const Component* hovered = nullptr;
    Rectangle hovered_rect = {0, 0, 0, 0};

    for (const auto& component_ptr : circuit.components()) {
        const Component& component = *component_ptr;
        Rectangle rect = footprint(component, view);

        Color outline = COMPONENT_OUTLINE;
        if (const SubCircuit* sub = component.sub_circuit();
            sub != nullptr && sub->state() == LoadState::FAILED) {
            outline = FAILED_OUTLINE;
        }

        DrawRectangleRounded(rect, CORNER_ROUNDNESS, CORNER_SEGMENTS, component_fill(component));
        DrawRectangleRoundedLines(rect, CORNER_ROUNDNESS, CORNER_SEGMENTS, OUTLINE_THICKNESS,
                                  outline);

        if (component.get_type() == ComponentType::LED_OUTPUT) {
            Vector2 centre = {rect.x + rect.width * 0.75f, rect.y + rect.height / 2.0f};
            DrawCircleV(centre, rect.height * 0.25f, component.is_lit() ? LED_LIT : LED_DARK);
        }

        std::string label = component_label(component);
        int font = std::max(10, static_cast<int>(static_cast<float>(FONT_SIZE_LABEL) * view.scale));
        int text_width = MeasureText(label.c_str(), font);
        float text_x = rect.x + (rect.width - static_cast<float>(text_width)) / 2.0f;
        if (component.get_type() == ComponentType::LED_OUTPUT) {
            text_x = rect.x + 6.0f;
        }
        DrawText(label.c_str(), static_cast<int>(text_x),
                 static_cast<int>(rect.y + (rect.height - static_cast<float>(font)) / 2.0f), font,
                 LABEL_COLOR);

        draw_ports(component.input_ports(), view);
        draw_ports(component.output_ports(), view);

        if (CheckCollisionPointRec(GetMousePosition(), rect)) {
            hovered = &component;
            hovered_rect = rect;
        }
    }

    if (hovered != nullptr) {
        draw_tooltip(*hovered, hovered_rect);
    }
}

} // namespace logicsim
