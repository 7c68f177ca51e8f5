/// @file test_simulation_context.cpp
/// @brief Tests for step ordering, settling, reset, and listener notification

#include <catch2/catch.hpp>

#include "simulation/circuit.hpp"
#include "simulation/simulation_context.hpp"

#include <vector>

using namespace logicsim;

namespace {

struct AndCircuit {
    Circuit circuit{"c", "AND"};
    Component* a = circuit.add_component(ComponentType::INPUT_SWITCH, "A");
    Component* b = circuit.add_component(ComponentType::INPUT_SWITCH, "B");
    Component* gate = circuit.add_component(ComponentType::AND);
    Component* y = circuit.add_component(ComponentType::LED_OUTPUT, "Y");

    AndCircuit() {
        circuit.connect(a, 0, gate, 0);
        circuit.connect(b, 0, gate, 1);
        circuit.connect(gate, 0, y, 0);
    }
};

/// NOT gate whose output feeds its own input
struct RingOscillator {
    Circuit circuit{"r", "Ring"};
    Component* inverter = circuit.add_component(ComponentType::NOT);

    RingOscillator() { circuit.connect(inverter, 0, inverter, 0); }
};

} // namespace

TEST_CASE("Each step settles one more level", "[context]") {
    AndCircuit fixture;
    SimulationContext context(&fixture.circuit);

    fixture.a->set_state(true);
    fixture.b->set_state(true);

    // Step 1: the gate sees its propagated inputs, the LED still reads the old output
    context.step();
    CHECK(fixture.gate->output_port(0).get_value() == true);
    CHECK(fixture.y->is_lit() == false);

    // Step 2: the gate output reaches the LED
    context.step();
    CHECK(fixture.y->is_lit() == true);
    CHECK(context.step_count() == 2);
}

TEST_CASE("Stepping a settled circuit changes nothing", "[context]") {
    AndCircuit fixture;
    SimulationContext context(&fixture.circuit);
    fixture.a->set_state(true);

    for (int i = 0; i < 5; i++) {
        context.step();
    }
    CHECK(fixture.y->is_lit() == false);

    fixture.b->set_state(true);
    for (int i = 0; i < 5; i++) {
        context.step();
    }
    CHECK(fixture.y->is_lit() == true);

    context.step();
    CHECK(fixture.y->is_lit() == true);
    for (const auto& connector : fixture.circuit.connectors()) {
        CHECK(connector->get_value() == true);
    }
}

TEST_CASE("Feedback loops keep stepping without converging", "[context]") {
    RingOscillator fixture;
    SimulationContext context(&fixture.circuit);

    context.step();
    bool second = fixture.inverter->output_port(0).get_value();
    context.step();
    bool third = fixture.inverter->output_port(0).get_value();

    CHECK(second != third);
    CHECK_FALSE(context.settle(16));
    CHECK(context.step_count() == 18);
}

TEST_CASE("settle stops at a fixed point", "[context]") {
    AndCircuit fixture;
    SimulationContext context(&fixture.circuit);
    fixture.a->set_state(true);
    fixture.b->set_state(true);

    CHECK(context.settle(64));
    CHECK(fixture.y->is_lit() == true);
    CHECK(context.step_count() < 64);

    // Already stable: one confirming step
    uint64_t before = context.step_count();
    CHECK(context.settle(64));
    CHECK(context.step_count() == before + 1);
}

TEST_CASE("Stepping without a circuit does nothing", "[context]") {
    SimulationContext context;
    int notifications = 0;
    context.add_listener([&](const SimulationContext&) { notifications++; });

    context.step();
    CHECK(notifications == 0);
    CHECK(context.step_count() == 0);

    context.reset();
    CHECK(notifications == 1);
    CHECK(context.settle(4));
}

TEST_CASE("A switch wired to an LED lights within one step", "[context]") {
    Circuit circuit("c", "Wire");
    Component* sw = circuit.add_component(ComponentType::INPUT_SWITCH, "A");
    Component* led = circuit.add_component(ComponentType::LED_OUTPUT, "Y");
    circuit.connect(sw, 0, led, 0);
    SimulationContext context(&circuit);

    sw->set_state(true);
    context.step();
    CHECK(led->is_lit());

    sw->set_state(false);
    context.step();
    CHECK_FALSE(led->is_lit());
}

TEST_CASE("start and stop only toggle the running flag", "[context]") {
    AndCircuit fixture;
    SimulationContext context(&fixture.circuit);
    int notifications = 0;
    context.add_listener([&](const SimulationContext& ctx) {
        notifications++;
        CHECK(ctx.get_circuit() == &fixture.circuit);
    });

    CHECK_FALSE(context.is_running());
    context.start();
    CHECK(context.is_running());
    context.stop();
    CHECK_FALSE(context.is_running());

    CHECK(notifications == 2);
    CHECK(context.step_count() == 0);
}

TEST_CASE("reset clears switches, ports and connectors", "[context]") {
    AndCircuit fixture;
    SimulationContext context(&fixture.circuit);
    fixture.a->set_state(true);
    fixture.b->set_state(true);
    context.settle(16);
    REQUIRE(fixture.y->is_lit());

    context.reset();

    CHECK(fixture.a->get_state() == false);
    CHECK(fixture.b->get_state() == false);
    CHECK(fixture.y->is_lit() == false);
    for (const auto& component : fixture.circuit.components()) {
        for (const Port& port : component->input_ports()) {
            CHECK(port.get_value() == false);
        }
        for (const Port& port : component->output_ports()) {
            CHECK(port.get_value() == false);
        }
    }
    for (const auto& connector : fixture.circuit.connectors()) {
        CHECK(connector->get_value() == false);
    }
}

TEST_CASE("reset twice leaves the same state as reset once", "[context]") {
    AndCircuit fixture;
    SimulationContext context(&fixture.circuit);
    fixture.a->set_state(true);
    fixture.b->set_state(true);
    context.settle(16);
    REQUIRE(fixture.y->is_lit());

    context.reset();
    std::vector<bool> once = context.snapshot();

    context.reset();
    CHECK(context.snapshot() == once);
    CHECK(fixture.a->get_state() == false);
    CHECK(fixture.b->get_state() == false);
    CHECK(fixture.y->is_lit() == false);

    // A never-stepped circuit resets to the same state
    AndCircuit fresh;
    SimulationContext fresh_context(&fresh.circuit);
    fresh_context.reset();
    CHECK(fresh_context.snapshot() == once);
}

TEST_CASE("Removed listeners are no longer called", "[context]") {
    AndCircuit fixture;
    SimulationContext context(&fixture.circuit);
    int first = 0;
    int second = 0;
    auto id = context.add_listener([&](const SimulationContext&) { first++; });
    context.add_listener([&](const SimulationContext&) { second++; });

    context.step();
    context.remove_listener(id);
    context.step();

    CHECK(first == 1);
    CHECK(second == 2);
}

TEST_CASE("Contexts can be retargeted", "[context]") {
    AndCircuit one;
    AndCircuit two;
    SimulationContext context(&one.circuit);
    context.set_circuit(&two.circuit);

    two.a->set_state(true);
    two.b->set_state(true);
    context.settle(16);

    CHECK(two.y->is_lit());
    CHECK_FALSE(one.y->is_lit());
}

TEST_CASE("Listeners may unsubscribe while being notified", "[context]") {
    AndCircuit fixture;
    SimulationContext context(&fixture.circuit);
    int calls = 0;
    int one_shot_calls = 0;

    SimulationContext::ListenerId one_shot = 0;
    one_shot = context.add_listener([&](const SimulationContext&) {
        one_shot_calls++;
        context.remove_listener(one_shot);
    });
    for (int i = 0; i < 4; i++) {
        context.add_listener([&](const SimulationContext&) { calls++; });
    }

    context.step();
    CHECK(one_shot_calls == 1);
    CHECK(calls == 4);

    context.step();
    CHECK(one_shot_calls == 1);
    CHECK(calls == 8);
}

TEST_CASE("Listeners added while notifying start with the next step", "[context]") {
    AndCircuit fixture;
    SimulationContext context(&fixture.circuit);
    int late_calls = 0;
    bool added = false;

    context.add_listener([&](const SimulationContext&) {
        if (!added) {
            added = true;
            // Enough registrations to force the listener list to grow
            for (int i = 0; i < 16; i++) {
                context.add_listener([&](const SimulationContext&) { late_calls++; });
            }
        }
    });

    context.step();
    CHECK(late_calls == 0);

    context.step();
    CHECK(late_calls == 16);
}
