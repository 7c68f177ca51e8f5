#pragma once

/// @file component.hpp
/// @brief Component model: variant kinds, gate evaluation, and the Component class

#include "simulation/port.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace logicsim {

class Circuit;
class CircuitLoader;
class SubCircuit;
struct CircuitReference;

/// The closed set of component kinds a circuit can contain
enum class ComponentType { AND, OR, NOT, INPUT_SWITCH, LED_OUTPUT, SUB_CIRCUIT };

/// Canvas footprint of every component, in canvas units
constexpr float COMPONENT_WIDTH = 60.0f;
constexpr float COMPONENT_HEIGHT = 40.0f;

/// Returns the human-readable name of a component type
[[nodiscard]] constexpr std::string_view component_type_name(ComponentType type) {
    switch (type) {
    case ComponentType::AND:
        return "AND";
    case ComponentType::OR:
        return "OR";
    case ComponentType::NOT:
        return "NOT";
    case ComponentType::INPUT_SWITCH:
        return "INPUT";
    case ComponentType::LED_OUTPUT:
        return "LED";
    case ComponentType::SUB_CIRCUIT:
        return "SUBCIRCUIT";
    }
    return "UNKNOWN";
}

/// Parses a palette type name. Accepts "AND", "OR", "NOT", "INPUT"/"SWITCH"
/// and "LED"/"OUTPUT", case-insensitively. Sub-circuits are created from a
/// circuit reference instead, so they have no palette name.
[[nodiscard]] std::optional<ComponentType> parse_component_type(std::string_view name);

/// Evaluates a combinational gate given its type and input values.
/// This is a pure function with no side effects.
/// @throws std::invalid_argument if the type is not AND/OR/NOT or the input
///         count is wrong for the gate type
[[nodiscard]] bool evaluate(ComponentType type, const std::vector<bool>& inputs);

/// A unit of circuit behavior with ordered input and output ports.
///
/// The port layout is fixed by the type, except for sub-circuits whose ports
/// are synthesized from the body circuit once it is loaded. Port order is
/// significant: it fixes truth-table column order and wiring conventions.
class Component {
  public:
    /// Construct a gate, switch or LED. Sub-circuits use make_sub_circuit().
    /// @throws std::invalid_argument for ComponentType::SUB_CIRCUIT
    Component(std::string id, ComponentType type, std::string name = {}, Vec2 position = {});

    /// Creates a sub-circuit that loads its body lazily through @p loader.
    /// The loader is not owned and must outlive the component.
    [[nodiscard]] static std::unique_ptr<Component> make_sub_circuit(std::string id,
                                                                     std::string name,
                                                                     CircuitReference reference,
                                                                     CircuitLoader* loader,
                                                                     Vec2 position = {});

    /// Creates a sub-circuit around an in-memory body, already loaded.
    /// @throws std::invalid_argument if @p body is null
    [[nodiscard]] static std::unique_ptr<Component> make_sub_circuit(std::string id,
                                                                     std::string name,
                                                                     std::unique_ptr<Circuit> body,
                                                                     Vec2 position = {});

    ~Component();

    // Non-copyable; use clone()
    Component(const Component&) = delete;
    Component& operator=(const Component&) = delete;

    [[nodiscard]] const std::string& get_id() const { return id_; }
    [[nodiscard]] ComponentType get_type() const { return type_; }
    [[nodiscard]] const std::string& get_name() const { return name_; }
    [[nodiscard]] Vec2 get_position() const { return position_; }
    [[nodiscard]] const std::vector<Port>& input_ports() const { return inputs_; }
    [[nodiscard]] const std::vector<Port>& output_ports() const { return outputs_; }
    [[nodiscard]] std::vector<Port>& input_ports() { return inputs_; }
    [[nodiscard]] std::vector<Port>& output_ports() { return outputs_; }
    [[nodiscard]] size_t input_count() const { return inputs_.size(); }
    [[nodiscard]] size_t output_count() const { return outputs_.size(); }

    /// @throws std::out_of_range if the index is past the last port
    [[nodiscard]] Port& input_port(size_t index);
    [[nodiscard]] const Port& input_port(size_t index) const;
    [[nodiscard]] Port& output_port(size_t index);
    [[nodiscard]] const Port& output_port(size_t index) const;

    void set_name(std::string name) { name_ = std::move(name); }

    /// Moves the component and re-lays its ports along the left/right edges
    void set_position(Vec2 position);

    /// Recomputes outputs from the current input port values.
    /// Idempotent while the inputs are unchanged.
    void execute();

    /// Forces every port value to false
    void clear_ports();

    // --- INPUT_SWITCH ---

    /// @throws std::runtime_error unless this is an INPUT_SWITCH
    [[nodiscard]] bool get_state() const;

    /// Sets the switch state and immediately executes the switch
    /// @throws std::runtime_error unless this is an INPUT_SWITCH
    void set_state(bool state);

    /// Flips the switch state and immediately executes the switch
    /// @throws std::runtime_error unless this is an INPUT_SWITCH
    void toggle();

    // --- LED_OUTPUT ---

    /// @throws std::runtime_error unless this is an LED_OUTPUT
    [[nodiscard]] bool is_lit() const;

    // --- SUB_CIRCUIT ---

    /// Returns the sub-circuit state, or nullptr for other component types
    [[nodiscard]] SubCircuit* sub_circuit() { return sub_circuit_.get(); }
    [[nodiscard]] const SubCircuit* sub_circuit() const { return sub_circuit_.get(); }

    /// Loads a sub-circuit body on first need and synthesizes its ports.
    /// Always true for non-sub-circuit components.
    /// @return true if the component has a usable body
    bool ensure_loaded();

    /// Replaces the sub-circuit body and rebuilds the ports from scratch
    /// @throws std::runtime_error unless this is a SUB_CIRCUIT
    void update_sub_circuit(std::unique_ptr<Circuit> body);

    /// Returns a fresh copy with the same id, name, position and state.
    /// A sub-circuit copy refers to the same circuit and reloads lazily.
    [[nodiscard]] std::unique_ptr<Component> clone() const;

  private:
    struct SubCircuitTag {
        explicit SubCircuitTag() = default;
    };

  public:
    /// Sub-circuit constructor, reachable only through make_sub_circuit() and clone()
    Component(SubCircuitTag, std::string id, std::string name, Vec2 position,
              std::unique_ptr<SubCircuit> sub_circuit);

  private:

    void require_type(ComponentType type, const char* operation) const;
    void rebuild_ports(size_t input_count, size_t output_count);
    void update_port_positions();

    std::string id_;
    ComponentType type_;
    std::string name_;
    Vec2 position_;
    std::vector<Port> inputs_;
    std::vector<Port> outputs_;
    bool state_ = false; ///< Switch state, or LED lit flag
    std::unique_ptr<SubCircuit> sub_circuit_;
};

} // namespace logicsim
