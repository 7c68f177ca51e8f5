/// @file test_circuit.cpp
/// @brief Tests for circuit construction, wiring rules, removal, lookups and copies

#include <catch2/catch.hpp>

#include "simulation/circuit.hpp"

#include <stdexcept>

using namespace logicsim;

TEST_CASE("Components get circuit-unique ids in creation order", "[circuit]") {
    Circuit circuit("c", "Test");

    Component* a = circuit.add_component(ComponentType::INPUT_SWITCH, "A");
    Component* g = circuit.add_component(ComponentType::AND);
    Component* y = circuit.add_component(ComponentType::LED_OUTPUT, "Y");

    CHECK(a->get_id() == "comp_0");
    CHECK(g->get_id() == "comp_1");
    CHECK(y->get_id() == "comp_2");
    CHECK(circuit.num_components() == 3);
    CHECK(circuit.components()[1].get() == g);
}

TEST_CASE("Separate circuits number independently", "[circuit]") {
    Circuit first("c1", "First");
    Circuit second("c2", "Second");
    first.add_component(ComponentType::NOT);
    first.add_component(ComponentType::NOT);

    CHECK(second.add_component(ComponentType::NOT)->get_id() == "comp_0");
}

TEST_CASE("Adding a null component is a no-op", "[circuit]") {
    Circuit circuit("c", "Test");
    CHECK(circuit.add_component(std::unique_ptr<Component>()) == nullptr);
    CHECK(circuit.num_components() == 0);
}

TEST_CASE("Plain sub-circuit type is rejected by add_component", "[circuit]") {
    Circuit circuit("c", "Test");
    CHECK_THROWS_AS(circuit.add_component(ComponentType::SUB_CIRCUIT), std::invalid_argument);
    CHECK(circuit.num_components() == 0);
}

// ---------- Wiring ----------

TEST_CASE("connect wires an output port to an input port", "[circuit]") {
    Circuit circuit("c", "Test");
    Component* a = circuit.add_component(ComponentType::INPUT_SWITCH, "A");
    Component* g = circuit.add_component(ComponentType::NOT);

    Connector* wire = circuit.connect(a, 0, g, 0);
    REQUIRE(wire != nullptr);
    // Components and connectors share one counter
    CHECK(wire->get_id() == "conn_2");
    CHECK(wire->get_source() == a);
    CHECK(wire->get_sink() == g);
    CHECK(wire->is_attached());
    CHECK(&wire->source_port() == &a->output_port(0));
    CHECK(&wire->sink_port() == &g->input_port(0));
    CHECK(circuit.num_connectors() == 1);
}

TEST_CASE("connect returns the existing connector for a duplicate pair", "[circuit]") {
    Circuit circuit("c", "Test");
    Component* a = circuit.add_component(ComponentType::INPUT_SWITCH, "A");
    Component* g = circuit.add_component(ComponentType::AND);

    Connector* first = circuit.connect(a, 0, g, 0);
    Connector* again = circuit.connect(a, 0, g, 0);
    Connector* other = circuit.connect(a, 0, g, 1);

    CHECK(first == again);
    CHECK(first != other);
    CHECK(circuit.num_connectors() == 2);
}

TEST_CASE("connect validates its endpoints", "[circuit]") {
    Circuit circuit("c", "Test");
    Circuit other("o", "Other");
    Component* a = circuit.add_component(ComponentType::INPUT_SWITCH, "A");
    Component* g = circuit.add_component(ComponentType::NOT);
    Component* stranger = other.add_component(ComponentType::NOT);

    SECTION("null endpoints") {
        CHECK_THROWS_AS(circuit.connect(nullptr, 0, g, 0), std::invalid_argument);
        CHECK_THROWS_AS(circuit.connect(a, 0, nullptr, 0), std::invalid_argument);
    }

    SECTION("endpoints from another circuit") {
        CHECK_THROWS_AS(circuit.connect(a, 0, stranger, 0), std::runtime_error);
        CHECK_THROWS_AS(circuit.connect(stranger, 0, g, 0), std::runtime_error);
    }

    SECTION("port indices past the last port") {
        CHECK_THROWS_AS(circuit.connect(a, 1, g, 0), std::out_of_range);
        CHECK_THROWS_AS(circuit.connect(a, 0, g, 1), std::out_of_range);
    }

    CHECK(circuit.num_connectors() == 0);
}

TEST_CASE("Connector propagation copies and caches the source value", "[circuit]") {
    Circuit circuit("c", "Test");
    Component* a = circuit.add_component(ComponentType::INPUT_SWITCH, "A");
    Component* y = circuit.add_component(ComponentType::LED_OUTPUT, "Y");
    Connector* wire = circuit.connect(a, 0, y, 0);

    CHECK(wire->color().g == CONNECTOR_LOW_COLOR.g);

    a->set_state(true);
    wire->propagate();
    CHECK(wire->get_value() == true);
    CHECK(y->input_port(0).get_value() == true);
    CHECK(wire->color().g == CONNECTOR_HIGH_COLOR.g);
}

TEST_CASE("Connector endpoints fall back to port positions", "[circuit]") {
    Circuit circuit("c", "Test");
    Component* a = circuit.add_component(ComponentType::INPUT_SWITCH, "A", {0.0f, 0.0f});
    Component* y = circuit.add_component(ComponentType::LED_OUTPUT, "Y", {200.0f, 100.0f});
    Connector* wire = circuit.connect(a, 0, y, 0);

    CHECK(wire->start_position().x == 60.0f);
    CHECK(wire->start_position().y == 10.0f);
    CHECK(wire->end_position().x == 200.0f);
    CHECK(wire->end_position().y == 110.0f);

    wire->set_end_position({1.0f, 2.0f});
    CHECK(wire->end_position().x == 1.0f);
}

// ---------- Removal ----------

TEST_CASE("Removing a component removes its connectors", "[circuit]") {
    Circuit circuit("c", "Test");
    Component* a = circuit.add_component(ComponentType::INPUT_SWITCH, "A");
    Component* b = circuit.add_component(ComponentType::INPUT_SWITCH, "B");
    Component* g = circuit.add_component(ComponentType::AND);
    Component* y = circuit.add_component(ComponentType::LED_OUTPUT, "Y");
    circuit.connect(a, 0, g, 0);
    circuit.connect(b, 0, g, 1);
    Connector* out = circuit.connect(g, 0, y, 0);
    REQUIRE(circuit.num_connectors() == 3);

    circuit.remove_component(a);
    CHECK(circuit.num_components() == 3);
    CHECK(circuit.num_connectors() == 2);
    CHECK_FALSE(circuit.contains(a));

    circuit.remove_component(g);
    CHECK(circuit.num_connectors() == 0);
    CHECK_FALSE(circuit.contains(out));

    for (const auto& connector : circuit.connectors()) {
        CHECK(circuit.contains(connector->get_source()));
        CHECK(circuit.contains(connector->get_sink()));
    }
}

TEST_CASE("Removing unknown objects is a no-op", "[circuit]") {
    Circuit circuit("c", "Test");
    Circuit other("o", "Other");
    Component* a = circuit.add_component(ComponentType::INPUT_SWITCH, "A");
    Component* y = circuit.add_component(ComponentType::LED_OUTPUT, "Y");
    circuit.connect(a, 0, y, 0);
    Component* stranger = other.add_component(ComponentType::NOT);

    circuit.remove_component(nullptr);
    circuit.remove_component(stranger);
    circuit.remove_connector(nullptr);
    CHECK(circuit.num_components() == 2);
    CHECK(circuit.num_connectors() == 1);

    circuit.remove_connector(circuit.connectors().front().get());
    CHECK(circuit.num_connectors() == 0);
    CHECK(circuit.num_components() == 2);
}

// ---------- Lookups ----------

TEST_CASE("Lookups by id and by point", "[circuit]") {
    Circuit circuit("c", "Test");
    Component* a = circuit.add_component(ComponentType::INPUT_SWITCH, "A", {0.0f, 0.0f});
    Component* g = circuit.add_component(ComponentType::NOT, {}, {100.0f, 0.0f});
    Connector* wire = circuit.connect(a, 0, g, 0);

    CHECK(circuit.find_component("comp_1") == g);
    CHECK(circuit.find_component("missing") == nullptr);
    CHECK(circuit.find_connector(wire->get_id()) == wire);
    CHECK(circuit.find_connector("missing") == nullptr);

    CHECK(circuit.find_component_at({30.0f, 20.0f}) == a);
    CHECK(circuit.find_component_at({159.0f, 39.0f}) == g);
    CHECK(circuit.find_component_at({80.0f, 20.0f}) == nullptr);
}

TEST_CASE("Switches and LEDs are discovered in insertion order", "[circuit]") {
    Circuit circuit("c", "Test");
    Component* b = circuit.add_component(ComponentType::INPUT_SWITCH, "B");
    Component* y = circuit.add_component(ComponentType::LED_OUTPUT, "Y");
    circuit.add_component(ComponentType::AND);
    Component* a = circuit.add_component(ComponentType::INPUT_SWITCH, "A");
    Component* z = circuit.add_component(ComponentType::LED_OUTPUT, "Z");

    auto switches = circuit.input_switches();
    auto leds = circuit.led_outputs();
    REQUIRE(switches.size() == 2);
    REQUIRE(leds.size() == 2);
    CHECK(switches[0] == b);
    CHECK(switches[1] == a);
    CHECK(leds[0] == y);
    CHECK(leds[1] == z);
}

// ---------- Copies ----------

TEST_CASE("clone produces an independent graph with the same ids", "[circuit]") {
    Circuit circuit("c", "Test");
    Component* a = circuit.add_component(ComponentType::INPUT_SWITCH, "A");
    Component* y = circuit.add_component(ComponentType::LED_OUTPUT, "Y");
    circuit.connect(a, 0, y, 0);
    a->set_state(true);

    auto copy = circuit.clone();
    REQUIRE(copy->num_components() == 2);
    REQUIRE(copy->num_connectors() == 1);
    CHECK(copy->get_id() == "c");
    CHECK(copy->get_name() == "Test");

    Component* copy_a = copy->find_component(a->get_id());
    REQUIRE(copy_a != nullptr);
    CHECK(copy_a != a);
    CHECK(copy_a->get_state() == true);

    const Connector* copy_wire = copy->connectors().front().get();
    CHECK(copy_wire->get_source() == copy_a);
    CHECK(copy->contains(copy_wire->get_sink()));

    copy_a->toggle();
    CHECK(a->get_state() == true);

    // The copy keeps numbering after the original's last id
    CHECK(copy->add_component(ComponentType::NOT)->get_id() == "comp_3");
}
