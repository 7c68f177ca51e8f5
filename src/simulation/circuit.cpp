/// @file circuit.cpp
/// @brief Circuit construction, cascading removal, lookups, and deep copy

#include "simulation/circuit.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace logicsim {

Circuit::Circuit(std::string id, std::string name) : id_(std::move(id)), name_(std::move(name)) {}

Component* Circuit::add_component(ComponentType type, std::string name, Vec2 position) {
    components_.push_back(
        std::make_unique<Component>(ids_.next("comp"), type, std::move(name), position));
    return components_.back().get();
}

Component* Circuit::add_sub_circuit(CircuitReference reference, CircuitLoader* loader,
                                    std::string name, Vec2 position) {
    components_.push_back(Component::make_sub_circuit(ids_.next("comp"), std::move(name),
                                                      std::move(reference), loader, position));
    return components_.back().get();
}

Component* Circuit::add_component(std::unique_ptr<Component> component) {
    if (component == nullptr) {
        return nullptr;
    }
    components_.push_back(std::move(component));
    return components_.back().get();
}

void Circuit::remove_component(const Component* component) {
    if (component == nullptr || !contains(component)) {
        return;
    }

    // Drop incident connectors first so none is left holding a dangling endpoint
    connectors_.erase(std::remove_if(connectors_.begin(), connectors_.end(),
                                     [component](const std::unique_ptr<Connector>& c) {
                                         return c->get_source() == component ||
                                                c->get_sink() == component;
                                     }),
                      connectors_.end());

    components_.erase(std::remove_if(components_.begin(), components_.end(),
                                     [component](const std::unique_ptr<Component>& c) {
                                         return c.get() == component;
                                     }),
                      components_.end());
}

void Circuit::require_member(const Component* component, const char* role) const {
    if (!contains(component)) {
        throw std::runtime_error(std::string("connect() ") + role +
                                 " component is not a member of circuit '" + name_ + "'");
    }
}

Connector* Circuit::connect(Component* source, size_t output_index, Component* sink,
                            size_t input_index) {
    if (source == nullptr || sink == nullptr) {
        throw std::invalid_argument("connect() requires non-null source and sink components");
    }
    require_member(source, "source");
    require_member(sink, "sink");

    source->ensure_loaded();
    sink->ensure_loaded();

    if (output_index >= source->output_count()) {
        throw std::out_of_range("connect() source output port index out of range");
    }
    if (input_index >= sink->input_count()) {
        throw std::out_of_range("connect() sink input port index out of range");
    }

    for (const auto& existing : connectors_) {
        if (existing->get_source() == source && existing->get_output_index() == output_index &&
            existing->get_sink() == sink && existing->get_input_index() == input_index) {
            return existing.get();
        }
    }

    connectors_.push_back(
        std::make_unique<Connector>(ids_.next("conn"), source, output_index, sink, input_index));
    return connectors_.back().get();
}

void Circuit::remove_connector(const Connector* connector) {
    if (connector == nullptr) {
        return;
    }
    connectors_.erase(std::remove_if(connectors_.begin(), connectors_.end(),
                                     [connector](const std::unique_ptr<Connector>& c) {
                                         return c.get() == connector;
                                     }),
                      connectors_.end());
}

Component* Circuit::find_component(std::string_view id) const {
    for (const auto& component : components_) {
        if (component->get_id() == id) {
            return component.get();
        }
    }
    return nullptr;
}

Connector* Circuit::find_connector(std::string_view id) const {
    for (const auto& connector : connectors_) {
        if (connector->get_id() == id) {
            return connector.get();
        }
    }
    return nullptr;
}

Component* Circuit::find_component_at(Vec2 point) const {
    for (const auto& component : components_) {
        Vec2 pos = component->get_position();
        if (point.x >= pos.x && point.x <= pos.x + COMPONENT_WIDTH && point.y >= pos.y &&
            point.y <= pos.y + COMPONENT_HEIGHT) {
            return component.get();
        }
    }
    return nullptr;
}

bool Circuit::contains(const Component* component) const {
    return std::any_of(components_.begin(), components_.end(),
                       [component](const std::unique_ptr<Component>& c) {
                           return c.get() == component;
                       });
}

bool Circuit::contains(const Connector* connector) const {
    return std::any_of(connectors_.begin(), connectors_.end(),
                       [connector](const std::unique_ptr<Connector>& c) {
                           return c.get() == connector;
                       });
}

std::vector<Component*> Circuit::input_switches() const {
    std::vector<Component*> result;
    for (const auto& component : components_) {
        if (component->get_type() == ComponentType::INPUT_SWITCH) {
            result.push_back(component.get());
        }
    }
    return result;
}

std::vector<Component*> Circuit::led_outputs() const {
    std::vector<Component*> result;
    for (const auto& component : components_) {
        if (component->get_type() == ComponentType::LED_OUTPUT) {
            result.push_back(component.get());
        }
    }
    return result;
}

std::unique_ptr<Circuit> Circuit::clone() const {
    auto copy = std::make_unique<Circuit>(id_, name_);
    copy->ids_ = ids_;

    std::unordered_map<const Component*, Component*> mapping;
    for (const auto& component : components_) {
        mapping[component.get()] = copy->add_component(component->clone());
    }

    // Endpoints may be unloaded sub-circuits with no ports yet, so connectors
    // are rebuilt directly instead of through connect(); they attach once the
    // sub-circuit body loads.
    for (const auto& connector : connectors_) {
        auto wire = std::make_unique<Connector>(
            connector->get_id(), mapping.at(connector->get_source()),
            connector->get_output_index(), mapping.at(connector->get_sink()),
            connector->get_input_index());
        wire->set_value(connector->get_value());
        copy->connectors_.push_back(std::move(wire));
    }
    return copy;
}

} // namespace logicsim
