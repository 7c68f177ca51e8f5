/// @file simulation_context.cpp
/// @brief Step, settle, and reset over a circuit graph

#include "simulation/simulation_context.hpp"

#include <algorithm>

namespace logicsim {

namespace {

void append_state(const Circuit& circuit, std::vector<bool>& out) {
    for (const auto& component : circuit.components()) {
        for (const Port& port : component->input_ports()) {
            out.push_back(port.get_value());
        }
        for (const Port& port : component->output_ports()) {
            out.push_back(port.get_value());
        }
        switch (component->get_type()) {
        case ComponentType::INPUT_SWITCH:
            out.push_back(component->get_state());
            break;
        case ComponentType::LED_OUTPUT:
            out.push_back(component->is_lit());
            break;
        case ComponentType::SUB_CIRCUIT:
            if (const Circuit* body = component->sub_circuit()->body(); body != nullptr) {
                append_state(*body, out);
            }
            break;
        case ComponentType::AND:
        case ComponentType::OR:
        case ComponentType::NOT:
            break;
        }
    }
    for (const auto& connector : circuit.connectors()) {
        out.push_back(connector->get_value());
    }
}

} // namespace

SimulationContext::SimulationContext(Circuit* circuit) : circuit_(circuit) {}

void SimulationContext::step() {
    if (circuit_ == nullptr) {
        return;
    }
    for (const auto& component : circuit_->components()) {
        component->execute();
    }
    for (const auto& connector : circuit_->connectors()) {
        connector->propagate();
    }
    for (const auto& component : circuit_->components()) {
        component->execute();
    }
    step_count_++;
    notify_listeners();
}

bool SimulationContext::settle(int max_steps) {
    if (circuit_ == nullptr) {
        return true;
    }
    std::vector<bool> previous = snapshot();
    for (int i = 0; i < max_steps; i++) {
        step();
        std::vector<bool> current = snapshot();
        if (current == previous) {
            return true;
        }
        previous = std::move(current);
    }
    return false;
}

void SimulationContext::start() {
    running_ = true;
    notify_listeners();
}

void SimulationContext::stop() {
    running_ = false;
    notify_listeners();
}

void SimulationContext::reset() {
    if (circuit_ != nullptr) {
        for (const auto& component : circuit_->components()) {
            if (component->get_type() == ComponentType::INPUT_SWITCH) {
                component->set_state(false);
            }
            component->clear_ports();
        }
        for (const auto& connector : circuit_->connectors()) {
            connector->set_value(false);
        }
        for (const auto& component : circuit_->components()) {
            component->execute();
        }
    }
    notify_listeners();
}

SimulationContext::ListenerId SimulationContext::add_listener(Listener listener) {
    ListenerId id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void SimulationContext::remove_listener(ListenerId id) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const auto& entry) { return entry.first == id; }),
                     listeners_.end());
}

void SimulationContext::notify_listeners() {
    // Listeners may add or remove listeners while being called
    const auto listeners = listeners_;
    for (const auto& [id, listener] : listeners) {
        (void)id;
        if (listener) {
            listener(*this);
        }
    }
}

std::vector<bool> SimulationContext::snapshot() const {
    std::vector<bool> state;
    if (circuit_ != nullptr) {
        append_state(*circuit_, state);
    }
    return state;
}

} // namespace logicsim
