/// @file test_circuit_builder.cpp
/// @brief Tests for the standard circuit builders

#include <catch2/catch.hpp>

#include "service/truth_table.hpp"
#include "simulation/circuit_builder.hpp"
#include "simulation/simulation_context.hpp"

#include <stdexcept>
#include <vector>

using namespace logicsim;

namespace {

std::vector<std::string> names(const std::vector<Component*>& components) {
    std::vector<std::string> result;
    for (const Component* c : components) {
        result.push_back(c->get_name());
    }
    return result;
}

} // namespace

TEST_CASE("AND circuit shape", "[builder]") {
    auto circuit = build_and_circuit();
    CHECK(circuit->get_name() == "AND Gate");
    CHECK(circuit->num_components() == 4);
    CHECK(circuit->num_connectors() == 3);
    CHECK(names(circuit->input_switches()) == std::vector<std::string>{"A", "B"});
    CHECK(names(circuit->led_outputs()) == std::vector<std::string>{"Y"});
}

TEST_CASE("Builders lay components out without overlap", "[builder]") {
    auto circuit = build_half_adder();
    for (const auto& component : circuit->components()) {
        Vec2 pos = component->get_position();
        // Probe the centre of the footprint: it must hit this component only
        Vec2 centre = {pos.x + COMPONENT_WIDTH / 2.0f, pos.y + COMPONENT_HEIGHT / 2.0f};
        CHECK(circuit->find_component_at(centre) == component.get());
    }
}

TEST_CASE("Half adder exhaustive evaluation", "[builder]") {
    auto circuit = build_half_adder();
    REQUIRE(names(circuit->input_switches()) == std::vector<std::string>{"A", "B"});
    REQUIRE(names(circuit->led_outputs()) == std::vector<std::string>{"Sum", "Carry"});

    Component* a = circuit->input_switches()[0];
    Component* b = circuit->input_switches()[1];
    Component* sum = circuit->led_outputs()[0];
    Component* carry = circuit->led_outputs()[1];

    struct Row {
        bool a, b, sum, carry;
    };
    std::vector<Row> truth_table = {
        {false, false, false, false},
        {false, true, true, false},
        {true, false, true, false},
        {true, true, false, true},
    };

    SimulationContext context(circuit.get());
    for (auto& [in_a, in_b, expected_sum, expected_carry] : truth_table) {
        a->set_state(in_a);
        b->set_state(in_b);
        for (int i = 0; i < 5; i++) {
            context.step();
        }

        INFO("A=" << in_a << " B=" << in_b);
        CHECK(sum->is_lit() == expected_sum);
        CHECK(carry->is_lit() == expected_carry);
    }
}

TEST_CASE("Full adder registers its half adder once", "[builder]") {
    Project project("adders");
    auto first = build_full_adder(project);
    auto second = build_full_adder(project);

    REQUIRE(project.circuits().size() == 1);
    CHECK(project.circuits().front()->get_name() == HALF_ADDER_NAME);

    CHECK(names(first->input_switches()) == std::vector<std::string>{"A", "B", "Cin"});
    CHECK(names(first->led_outputs()) == std::vector<std::string>{"Sum", "Cout"});

    size_t sub_circuits = 0;
    for (const auto& component : first->components()) {
        if (const SubCircuit* sub = component->sub_circuit()) {
            sub_circuits++;
            CHECK(sub->state() == LoadState::LOADED);
            CHECK(sub->reference().circuit_name == HALF_ADDER_NAME);
            CHECK(component->input_count() == 2);
            CHECK(component->output_count() == 2);
        }
    }
    CHECK(sub_circuits == 2);
    CHECK(first->num_connectors() == second->num_connectors());
}

TEST_CASE("Ripple-carry adder adds", "[builder]") {
    Project project("adders");
    auto circuit = build_ripple_carry_adder(project, 2);

    CHECK(project.find_circuit_by_name(HALF_ADDER_NAME) != nullptr);
    CHECK(project.find_circuit_by_name(FULL_ADDER_NAME) != nullptr);
    REQUIRE(names(circuit->input_switches()) ==
            std::vector<std::string>{"A0", "A1", "B0", "B1"});
    REQUIRE(names(circuit->led_outputs()) == std::vector<std::string>{"S0", "S1", "Cout"});

    TruthTableOptions options;
    options.mode = SettleMode::UNTIL_STABLE;
    options.max_settle_steps = 128;
    TruthTable table = TruthTableService(options).generate_truth_table(*circuit);
    REQUIRE(table.rows.size() == 16);

    for (const auto& row : table.rows) {
        int a = int(row.inputs[0]) + 2 * int(row.inputs[1]);
        int b = int(row.inputs[2]) + 2 * int(row.inputs[3]);
        int sum = int(row.outputs[0]) + 2 * int(row.outputs[1]) + 4 * int(row.outputs[2]);
        INFO(a << " + " << b);
        CHECK(row.stable);
        CHECK(sum == a + b);
    }
}

TEST_CASE("Ripple-carry adder needs at least one bit", "[builder]") {
    Project project("adders");
    CHECK_THROWS_AS(build_ripple_carry_adder(project, 0), std::invalid_argument);
}
