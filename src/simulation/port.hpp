#pragma once

/// @file port.hpp
/// @brief Port model: a directional boolean connection point on a component

#include <string>
#include <string_view>
#include <utility>

namespace logicsim {

/// A 2D point in canvas units. Presentation only; simulation never reads it.
struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;
};

enum class PortDirection { INPUT, OUTPUT };

[[nodiscard]] constexpr std::string_view port_direction_name(PortDirection direction) {
    switch (direction) {
    case PortDirection::INPUT:
        return "INPUT";
    case PortDirection::OUTPUT:
        return "OUTPUT";
    }
    return "UNKNOWN";
}

/// A single connection point owned by exactly one component.
/// A port stores whatever value it is given; it never rejects a write.
class Port {
  public:
    Port(std::string id, PortDirection direction) : id_(std::move(id)), direction_(direction) {}

    [[nodiscard]] const std::string& get_id() const { return id_; }
    [[nodiscard]] PortDirection get_direction() const { return direction_; }
    [[nodiscard]] bool get_value() const { return value_; }
    [[nodiscard]] Vec2 get_position() const { return position_; }

    void set_value(bool value) { value_ = value; }
    void set_position(Vec2 position) { position_ = position; }

  private:
    std::string id_;
    PortDirection direction_;
    Vec2 position_;
    bool value_ = false;
};

} // namespace logicsim
