#pragma once

/// @file circuit.hpp
/// @brief Circuit model: owns components and connectors, the graph simulation runs on

#include "simulation/component.hpp"
#include "simulation/connector.hpp"
#include "simulation/id_generator.hpp"
#include "simulation/sub_circuit.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace logicsim {

/// A circuit is an owned graph of components and connectors.
///
/// Construction:
///   1. Create components with add_component() / add_sub_circuit()
///   2. Wire output ports to input ports with connect()
///   3. Drive it with a SimulationContext
///
/// The circuit is the sole owner of its components and connectors; everything
/// else holds non-owning pointers. Every connector's endpoints are members of
/// the same circuit, and removing a component removes its connectors too.
/// Collections keep insertion order, which fixes execution order and the
/// discovery order of switches and LEDs.
class Circuit {
  public:
    Circuit(std::string id, std::string name);

    // Non-copyable (use clone()), movable
    Circuit(const Circuit&) = delete;
    Circuit& operator=(const Circuit&) = delete;
    Circuit(Circuit&&) = default;
    Circuit& operator=(Circuit&&) = default;

    [[nodiscard]] const std::string& get_id() const { return id_; }
    [[nodiscard]] const std::string& get_name() const { return name_; }
    void set_id(std::string id) { id_ = std::move(id); }
    void set_name(std::string name) { name_ = std::move(name); }

    /// Creates a gate, switch or LED and returns a non-owning pointer.
    /// An empty name selects the type's default label.
    /// @throws std::invalid_argument for ComponentType::SUB_CIRCUIT
    Component* add_component(ComponentType type, std::string name = {}, Vec2 position = {});

    /// Creates a sub-circuit that resolves @p reference through @p loader on first need
    Component* add_sub_circuit(CircuitReference reference, CircuitLoader* loader,
                               std::string name = {}, Vec2 position = {});

    /// Takes ownership of an externally built component.
    /// @return the stored pointer, or nullptr (and no-op) when @p component is null
    Component* add_component(std::unique_ptr<Component> component);

    /// Removes a component and every connector that references it.
    /// No-op for null or non-member components.
    void remove_component(const Component* component);

    /// Wires output port @p output_index of @p source into input port
    /// @p input_index of @p sink. Sub-circuit endpoints are loaded first so
    /// their ports exist. Returns the existing connector when the same
    /// source port already feeds the same sink port.
    /// @throws std::invalid_argument if an endpoint is null
    /// @throws std::runtime_error if an endpoint is not a member of this circuit
    /// @throws std::out_of_range if a port index does not exist
    Connector* connect(Component* source, size_t output_index, Component* sink,
                       size_t input_index);

    /// Removes a connector. No-op for null or non-member connectors.
    void remove_connector(const Connector* connector);

    /// Linear-scan lookups; nullptr when absent
    [[nodiscard]] Component* find_component(std::string_view id) const;
    [[nodiscard]] Connector* find_connector(std::string_view id) const;

    /// Returns the first component whose 60x40 footprint contains @p point
    [[nodiscard]] Component* find_component_at(Vec2 point) const;

    [[nodiscard]] bool contains(const Component* component) const;
    [[nodiscard]] bool contains(const Connector* connector) const;

    /// INPUT_SWITCH components in insertion order
    [[nodiscard]] std::vector<Component*> input_switches() const;

    /// LED_OUTPUT components in insertion order
    [[nodiscard]] std::vector<Component*> led_outputs() const;

    /// Deep copy with the same ids. Sub-circuits in the copy are unloaded and
    /// reload through their loader; port, switch and connector values carry over.
    [[nodiscard]] std::unique_ptr<Circuit> clone() const;

    // --- Accessors ---
    [[nodiscard]] const std::vector<std::unique_ptr<Component>>& components() const { return components_; }
    [[nodiscard]] const std::vector<std::unique_ptr<Connector>>& connectors() const { return connectors_; }
    [[nodiscard]] size_t num_components() const { return components_.size(); }
    [[nodiscard]] size_t num_connectors() const { return connectors_.size(); }

  private:
    /// Throws unless the component belongs to this circuit
    void require_member(const Component* component, const char* role) const;

    std::string id_;
    std::string name_;
    IdGenerator ids_;

    std::vector<std::unique_ptr<Component>> components_;
    std::vector<std::unique_ptr<Connector>> connectors_;
};

} // namespace logicsim
