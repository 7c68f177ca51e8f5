/// @file component.cpp
/// @brief Gate evaluation and Component class implementation

#include "simulation/component.hpp"

#include "simulation/circuit.hpp"
#include "simulation/sub_circuit.hpp"

#include <cctype>
#include <stdexcept>
#include <string>

namespace logicsim {

namespace {

constexpr float PORT_OFFSET_Y = 10.0f;
constexpr float PORT_SPACING = 20.0f;

std::string default_name(ComponentType type) {
    switch (type) {
    case ComponentType::AND:
        return "AND";
    case ComponentType::OR:
        return "OR";
    case ComponentType::NOT:
        return "NOT";
    case ComponentType::INPUT_SWITCH:
        return "Input";
    case ComponentType::LED_OUTPUT:
        return "LED";
    case ComponentType::SUB_CIRCUIT:
        return "SubCircuit";
    }
    return "Component";
}

} // namespace

std::optional<ComponentType> parse_component_type(std::string_view name) {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (upper == "AND") {
        return ComponentType::AND;
    }
    if (upper == "OR") {
        return ComponentType::OR;
    }
    if (upper == "NOT") {
        return ComponentType::NOT;
    }
    if (upper == "INPUT" || upper == "SWITCH") {
        return ComponentType::INPUT_SWITCH;
    }
    if (upper == "LED" || upper == "OUTPUT") {
        return ComponentType::LED_OUTPUT;
    }
    return std::nullopt;
}

bool evaluate(ComponentType type, const std::vector<bool>& inputs) {
    switch (type) {
    case ComponentType::NOT:
        if (inputs.size() != 1) {
            throw std::invalid_argument("NOT gate requires exactly 1 input");
        }
        return !inputs[0];

    case ComponentType::AND:
        if (inputs.size() < 2) {
            throw std::invalid_argument("AND gate requires at least 2 inputs");
        }
        for (bool v : inputs) {
            if (!v) {
                return false;
            }
        }
        return true;

    case ComponentType::OR:
        if (inputs.size() < 2) {
            throw std::invalid_argument("OR gate requires at least 2 inputs");
        }
        for (bool v : inputs) {
            if (v) {
                return true;
            }
        }
        return false;

    case ComponentType::INPUT_SWITCH:
    case ComponentType::LED_OUTPUT:
    case ComponentType::SUB_CIRCUIT:
        break;
    }
    throw std::invalid_argument(std::string("Not a combinational gate: ") +
                                std::string(component_type_name(type)));
}

Component::Component(std::string id, ComponentType type, std::string name, Vec2 position)
    : id_(std::move(id)), type_(type), name_(name.empty() ? default_name(type) : std::move(name)),
      position_(position) {
    switch (type_) {
    case ComponentType::AND:
    case ComponentType::OR:
        inputs_.emplace_back("in0", PortDirection::INPUT);
        inputs_.emplace_back("in1", PortDirection::INPUT);
        outputs_.emplace_back("out", PortDirection::OUTPUT);
        break;
    case ComponentType::NOT:
        inputs_.emplace_back("in", PortDirection::INPUT);
        outputs_.emplace_back("out", PortDirection::OUTPUT);
        break;
    case ComponentType::INPUT_SWITCH:
        outputs_.emplace_back("out", PortDirection::OUTPUT);
        break;
    case ComponentType::LED_OUTPUT:
        inputs_.emplace_back("in", PortDirection::INPUT);
        break;
    case ComponentType::SUB_CIRCUIT:
        throw std::invalid_argument("Sub-circuit components must be created with make_sub_circuit()");
    }
    update_port_positions();
}

Component::Component(SubCircuitTag, std::string id, std::string name, Vec2 position,
                     std::unique_ptr<SubCircuit> sub_circuit)
    : id_(std::move(id)), type_(ComponentType::SUB_CIRCUIT), name_(std::move(name)),
      position_(position), sub_circuit_(std::move(sub_circuit)) {
    if (sub_circuit_->state() == LoadState::LOADED) {
        rebuild_ports(sub_circuit_->input_count(), sub_circuit_->output_count());
    }
}

Component::~Component() = default;

std::unique_ptr<Component> Component::make_sub_circuit(std::string id, std::string name,
                                                       CircuitReference reference,
                                                       CircuitLoader* loader, Vec2 position) {
    if (name.empty()) {
        name = reference.circuit_name.empty() ? default_name(ComponentType::SUB_CIRCUIT)
                                              : reference.circuit_name;
    }
    auto sub = std::make_unique<SubCircuit>(std::move(reference), loader);
    return std::make_unique<Component>(SubCircuitTag{}, std::move(id), std::move(name), position,
                                       std::move(sub));
}

std::unique_ptr<Component> Component::make_sub_circuit(std::string id, std::string name,
                                                       std::unique_ptr<Circuit> body,
                                                       Vec2 position) {
    if (body == nullptr) {
        throw std::invalid_argument("make_sub_circuit() requires a non-null body circuit");
    }
    if (name.empty()) {
        name = body->get_name();
    }
    auto sub = std::make_unique<SubCircuit>(std::move(body));
    return std::make_unique<Component>(SubCircuitTag{}, std::move(id), std::move(name), position,
                                       std::move(sub));
}

Port& Component::input_port(size_t index) {
    if (index >= inputs_.size()) {
        throw std::out_of_range("Input port index out of range");
    }
    return inputs_[index];
}

const Port& Component::input_port(size_t index) const {
    if (index >= inputs_.size()) {
        throw std::out_of_range("Input port index out of range");
    }
    return inputs_[index];
}

Port& Component::output_port(size_t index) {
    if (index >= outputs_.size()) {
        throw std::out_of_range("Output port index out of range");
    }
    return outputs_[index];
}

const Port& Component::output_port(size_t index) const {
    if (index >= outputs_.size()) {
        throw std::out_of_range("Output port index out of range");
    }
    return outputs_[index];
}

void Component::set_position(Vec2 position) {
    position_ = position;
    update_port_positions();
}

void Component::update_port_positions() {
    for (size_t i = 0; i < inputs_.size(); i++) {
        inputs_[i].set_position(
            {position_.x, position_.y + PORT_OFFSET_Y + static_cast<float>(i) * PORT_SPACING});
    }
    for (size_t i = 0; i < outputs_.size(); i++) {
        outputs_[i].set_position({position_.x + COMPONENT_WIDTH,
                                  position_.y + PORT_OFFSET_Y + static_cast<float>(i) * PORT_SPACING});
    }
}

void Component::execute() {
    switch (type_) {
    case ComponentType::AND:
    case ComponentType::OR:
    case ComponentType::NOT: {
        std::vector<bool> values;
        values.reserve(inputs_.size());
        for (const Port& port : inputs_) {
            values.push_back(port.get_value());
        }
        outputs_[0].set_value(evaluate(type_, values));
        break;
    }

    case ComponentType::INPUT_SWITCH:
        outputs_[0].set_value(state_);
        break;

    case ComponentType::LED_OUTPUT:
        state_ = inputs_[0].get_value();
        break;

    case ComponentType::SUB_CIRCUIT:
        if (ensure_loaded()) {
            sub_circuit_->evaluate(inputs_, outputs_);
        }
        break;
    }
}

void Component::clear_ports() {
    for (Port& port : inputs_) {
        port.set_value(false);
    }
    for (Port& port : outputs_) {
        port.set_value(false);
    }
}

void Component::require_type(ComponentType type, const char* operation) const {
    if (type_ != type) {
        throw std::runtime_error(std::string(operation) + " requires an " +
                                 std::string(component_type_name(type)) + " component, got " +
                                 std::string(component_type_name(type_)));
    }
}

bool Component::get_state() const {
    require_type(ComponentType::INPUT_SWITCH, "get_state()");
    return state_;
}

void Component::set_state(bool state) {
    require_type(ComponentType::INPUT_SWITCH, "set_state()");
    state_ = state;
    execute();
}

void Component::toggle() {
    require_type(ComponentType::INPUT_SWITCH, "toggle()");
    state_ = !state_;
    execute();
}

bool Component::is_lit() const {
    require_type(ComponentType::LED_OUTPUT, "is_lit()");
    return state_;
}

bool Component::ensure_loaded() {
    if (sub_circuit_ == nullptr) {
        return true;
    }
    if (sub_circuit_->state() == LoadState::UNLOADED) {
        sub_circuit_->ensure_loaded();
        rebuild_ports(sub_circuit_->input_count(), sub_circuit_->output_count());
    }
    return sub_circuit_->state() == LoadState::LOADED;
}

void Component::update_sub_circuit(std::unique_ptr<Circuit> body) {
    require_type(ComponentType::SUB_CIRCUIT, "update_sub_circuit()");
    sub_circuit_->replace_body(std::move(body));
    rebuild_ports(sub_circuit_->input_count(), sub_circuit_->output_count());
}

void Component::rebuild_ports(size_t input_count, size_t output_count) {
    inputs_.clear();
    outputs_.clear();
    for (size_t i = 0; i < input_count; i++) {
        inputs_.emplace_back("in" + std::to_string(i), PortDirection::INPUT);
    }
    for (size_t i = 0; i < output_count; i++) {
        outputs_.emplace_back("out" + std::to_string(i), PortDirection::OUTPUT);
    }
    update_port_positions();
}

std::unique_ptr<Component> Component::clone() const {
    std::unique_ptr<Component> copy;
    if (sub_circuit_ != nullptr) {
        copy = std::make_unique<Component>(SubCircuitTag{}, id_, name_, position_,
                                           sub_circuit_->clone());
    } else {
        copy = std::make_unique<Component>(id_, type_, name_, position_);
        copy->state_ = state_;
    }
    for (size_t i = 0; i < copy->inputs_.size() && i < inputs_.size(); i++) {
        copy->inputs_[i].set_value(inputs_[i].get_value());
    }
    for (size_t i = 0; i < copy->outputs_.size() && i < outputs_.size(); i++) {
        copy->outputs_[i].set_value(outputs_[i].get_value());
    }
    return copy;
}

} // namespace logicsim
