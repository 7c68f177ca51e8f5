/// @file circuit_builder.cpp
/// @brief Implementation of standard circuit builder functions

#include "simulation/circuit_builder.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace logicsim {

namespace {

// Column/row pitch used to place components on the canvas
constexpr float COLUMN = 100.0f;
constexpr float ROW = 60.0f;

Vec2 cell(int column, int row) {
    return {40.0f + static_cast<float>(column) * COLUMN, 40.0f + static_cast<float>(row) * ROW};
}

/// Makes sure @p project has a circuit called @p name, building it if needed
void ensure_registered(Project& project, const char* name,
                       std::unique_ptr<Circuit> (*build)(Project&)) {
    if (project.find_circuit_by_name(name) == nullptr) {
        project.add_circuit(build(project));
    }
}

std::unique_ptr<Circuit> build_half_adder_for(Project&) {
    return build_half_adder();
}

/// Adds the XOR network between @p a and @p b and returns its output gate
Component* add_xor(Circuit& circuit, Component* a, Component* b, int column, int row) {
    Component* not_a = circuit.add_component(ComponentType::NOT, {}, cell(column, row));
    Component* not_b = circuit.add_component(ComponentType::NOT, {}, cell(column, row + 1));
    Component* a_and_not_b = circuit.add_component(ComponentType::AND, {}, cell(column + 1, row));
    Component* not_a_and_b =
        circuit.add_component(ComponentType::AND, {}, cell(column + 1, row + 1));
    Component* either = circuit.add_component(ComponentType::OR, {}, cell(column + 2, row));

    circuit.connect(a, 0, not_a, 0);
    circuit.connect(b, 0, not_b, 0);
    circuit.connect(a, 0, a_and_not_b, 0);
    circuit.connect(not_b, 0, a_and_not_b, 1);
    circuit.connect(not_a, 0, not_a_and_b, 0);
    circuit.connect(b, 0, not_a_and_b, 1);
    circuit.connect(a_and_not_b, 0, either, 0);
    circuit.connect(not_a_and_b, 0, either, 1);
    return either;
}

} // namespace

std::unique_ptr<Circuit> build_and_circuit() {
    auto circuit = std::make_unique<Circuit>("and_gate", "AND Gate");

    Component* a = circuit->add_component(ComponentType::INPUT_SWITCH, "A", cell(0, 0));
    Component* b = circuit->add_component(ComponentType::INPUT_SWITCH, "B", cell(0, 1));
    Component* gate = circuit->add_component(ComponentType::AND, {}, cell(1, 0));
    Component* y = circuit->add_component(ComponentType::LED_OUTPUT, "Y", cell(2, 0));

    circuit->connect(a, 0, gate, 0);
    circuit->connect(b, 0, gate, 1);
    circuit->connect(gate, 0, y, 0);
    return circuit;
}

std::unique_ptr<Circuit> build_xor_circuit() {
    auto circuit = std::make_unique<Circuit>("xor_gate", "XOR Gate");

    Component* a = circuit->add_component(ComponentType::INPUT_SWITCH, "A", cell(0, 0));
    Component* b = circuit->add_component(ComponentType::INPUT_SWITCH, "B", cell(0, 1));
    Component* x = add_xor(*circuit, a, b, 1, 0);
    Component* y = circuit->add_component(ComponentType::LED_OUTPUT, "Y", cell(4, 0));

    circuit->connect(x, 0, y, 0);
    return circuit;
}

std::unique_ptr<Circuit> build_half_adder() {
    auto circuit = std::make_unique<Circuit>("half_adder", HALF_ADDER_NAME);

    Component* a = circuit->add_component(ComponentType::INPUT_SWITCH, "A", cell(0, 0));
    Component* b = circuit->add_component(ComponentType::INPUT_SWITCH, "B", cell(0, 1));
    Component* sum = add_xor(*circuit, a, b, 1, 0);
    Component* carry = circuit->add_component(ComponentType::AND, {}, cell(2, 2));

    circuit->connect(a, 0, carry, 0);
    circuit->connect(b, 0, carry, 1);

    // LED order fixes output order: Sum (0), Carry (1)
    Component* sum_led = circuit->add_component(ComponentType::LED_OUTPUT, "Sum", cell(4, 0));
    Component* carry_led = circuit->add_component(ComponentType::LED_OUTPUT, "Carry", cell(4, 2));
    circuit->connect(sum, 0, sum_led, 0);
    circuit->connect(carry, 0, carry_led, 0);
    return circuit;
}

std::unique_ptr<Circuit> build_full_adder(Project& project) {
    ensure_registered(project, HALF_ADDER_NAME, build_half_adder_for);

    auto circuit = std::make_unique<Circuit>("full_adder", FULL_ADDER_NAME);
    const CircuitReference half_adder{HALF_ADDER_NAME, {}};

    Component* a = circuit->add_component(ComponentType::INPUT_SWITCH, "A", cell(0, 0));
    Component* b = circuit->add_component(ComponentType::INPUT_SWITCH, "B", cell(0, 1));
    Component* cin = circuit->add_component(ComponentType::INPUT_SWITCH, "Cin", cell(0, 2));

    // Half adder 1: A + B
    Component* ha1 = circuit->add_sub_circuit(half_adder, &project, "HA1", cell(1, 0));
    // Half adder 2: (A XOR B) + Cin
    Component* ha2 = circuit->add_sub_circuit(half_adder, &project, "HA2", cell(2, 1));
    Component* carry = circuit->add_component(ComponentType::OR, {}, cell(3, 2));

    circuit->connect(a, 0, ha1, 0);
    circuit->connect(b, 0, ha1, 1);
    circuit->connect(ha1, 0, ha2, 0);
    circuit->connect(cin, 0, ha2, 1);
    circuit->connect(ha1, 1, carry, 0);
    circuit->connect(ha2, 1, carry, 1);

    Component* sum_led = circuit->add_component(ComponentType::LED_OUTPUT, "Sum", cell(4, 1));
    Component* cout_led = circuit->add_component(ComponentType::LED_OUTPUT, "Cout", cell(4, 2));
    circuit->connect(ha2, 0, sum_led, 0);
    circuit->connect(carry, 0, cout_led, 0);
    return circuit;
}

std::unique_ptr<Circuit> build_ripple_carry_adder(Project& project, int bits) {
    if (bits < 1) {
        throw std::invalid_argument("Ripple-carry adder requires at least 1 bit");
    }
    ensure_registered(project, HALF_ADDER_NAME, build_half_adder_for);
    ensure_registered(project, FULL_ADDER_NAME, build_full_adder);

    auto circuit = std::make_unique<Circuit>("ripple_carry_adder_" + std::to_string(bits),
                                             std::to_string(bits) + "-bit Adder");

    std::vector<Component*> a_switches(bits);
    std::vector<Component*> b_switches(bits);
    for (int i = 0; i < bits; i++) {
        a_switches[i] = circuit->add_component(ComponentType::INPUT_SWITCH,
                                               "A" + std::to_string(i), cell(0, 2 * i));
    }
    for (int i = 0; i < bits; i++) {
        b_switches[i] = circuit->add_component(ComponentType::INPUT_SWITCH,
                                               "B" + std::to_string(i), cell(0, 2 * i + 1));
    }

    // Bit 0 has no carry-in and uses a half adder
    std::vector<Component*> stages(bits);
    stages[0] = circuit->add_sub_circuit({HALF_ADDER_NAME, {}}, &project, "HA0", cell(1, 0));
    circuit->connect(a_switches[0], 0, stages[0], 0);
    circuit->connect(b_switches[0], 0, stages[0], 1);

    for (int i = 1; i < bits; i++) {
        stages[i] = circuit->add_sub_circuit({FULL_ADDER_NAME, {}}, &project,
                                             "FA" + std::to_string(i), cell(1 + i, 2 * i));
        circuit->connect(a_switches[i], 0, stages[i], 0);
        circuit->connect(b_switches[i], 0, stages[i], 1);
        circuit->connect(stages[i - 1], 1, stages[i], 2); // carry chain
    }

    for (int i = 0; i < bits; i++) {
        Component* led = circuit->add_component(ComponentType::LED_OUTPUT, "S" + std::to_string(i),
                                                cell(bits + 1, 2 * i));
        circuit->connect(stages[i], 0, led, 0);
    }
    Component* cout_led =
        circuit->add_component(ComponentType::LED_OUTPUT, "Cout", cell(bits + 1, 2 * bits));
    circuit->connect(stages[bits - 1], 1, cout_led, 0);
    return circuit;
}

} // namespace logicsim
