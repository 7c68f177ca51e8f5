/// @file circuit_renderer.hpp
/// @brief Draws a circuit: components as labeled boxes, connectors as routed wires

#pragma once

#include "simulation/circuit.hpp"

#include <raylib.h>

namespace logicsim {

/// Maps canvas units to screen pixels
struct Viewport {
    float scale = 1.0f;
    Vector2 offset = {0.0f, 0.0f};

    [[nodiscard]] Vector2 to_screen(Vec2 v) const {
        return {v.x * scale + offset.x, v.y * scale + offset.y};
    }

    [[nodiscard]] Vec2 to_canvas(Vector2 p) const {
        return {(p.x - offset.x) / scale, (p.y - offset.y) / scale};
    }
};

/// Fits the circuit's component bounds into @p area, centred, with @p padding
/// pixels on each side. Scale never exceeds @p max_scale.
[[nodiscard]] Viewport fit_viewport(const Circuit& circuit, Rectangle area, float padding,
                                    float max_scale);

/// Draws every connector with right-angle routing, colored by its cached value.
void draw_connectors(const Circuit& circuit, const Viewport& view);

/// Draws every component with its ports, plus a tooltip for the hovered one.
void draw_components(const Circuit& circuit, const Viewport& view);

} // namespace logicsim
