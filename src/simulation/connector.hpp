#pragma once

/// @file connector.hpp
/// @brief Connector model: a directed wire from one output port to one input port

#include "simulation/port.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace logicsim {

class Component; // Forward declaration

/// 8-bit RGB color used by presentation layers
struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

constexpr Rgb CONNECTOR_HIGH_COLOR = {0, 255, 0};
constexpr Rgb CONNECTOR_LOW_COLOR = {0, 0, 0};

/// A directed wire copying one component output into another component input.
///
/// Endpoints are non-owning handles: a component pointer (owned by the same
/// Circuit) plus a port index. Index handles survive a sub-circuit rebuilding
/// its ports; a handle whose index no longer exists is "detached" and the
/// connector stops propagating until the port reappears.
class Connector {
  public:
    /// @throws std::invalid_argument if either endpoint component is null
    Connector(std::string id, Component* source, size_t output_index, Component* sink,
              size_t input_index);

    [[nodiscard]] const std::string& get_id() const { return id_; }
    [[nodiscard]] Component* get_source() const { return source_; }
    [[nodiscard]] Component* get_sink() const { return sink_; }
    [[nodiscard]] size_t get_output_index() const { return output_index_; }
    [[nodiscard]] size_t get_input_index() const { return input_index_; }
    [[nodiscard]] bool get_value() const { return value_; }

    void set_value(bool value) { value_ = value; }

    /// The source output port
    /// @throws std::out_of_range if the connector is detached
    [[nodiscard]] const Port& source_port() const;

    /// The sink input port
    /// @throws std::out_of_range if the connector is detached
    [[nodiscard]] const Port& sink_port() const;

    /// True when both port indices exist on their components
    [[nodiscard]] bool is_attached() const;

    /// Wire color derived from the cached value: green when high, black when low
    [[nodiscard]] Rgb color() const { return value_ ? CONNECTOR_HIGH_COLOR : CONNECTOR_LOW_COLOR; }

    /// Explicit start point, falling back to the source port position
    [[nodiscard]] Vec2 start_position() const;

    /// Explicit end point, falling back to the sink port position
    [[nodiscard]] Vec2 end_position() const;

    void set_start_position(Vec2 position) { start_position_ = position; }
    void set_end_position(Vec2 position) { end_position_ = position; }

    /// Reads the source port, caches the value, and writes it into the sink port.
    /// A detached connector does nothing.
    void propagate();

  private:
    std::string id_;
    Component* source_;
    size_t output_index_;
    Component* sink_;
    size_t input_index_;
    bool value_ = false;
    std::optional<Vec2> start_position_;
    std::optional<Vec2> end_position_;
};

} // namespace logicsim
