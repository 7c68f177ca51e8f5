/// @file test_step_scheduler.cpp
/// @brief Tests for interval stepping, manual steps, speed, and reset

#include <catch2/catch.hpp>

#include "simulation/circuit_builder.hpp"
#include "timing/step_scheduler.hpp"

using namespace logicsim;
using Catch::Detail::Approx;

TEST_CASE("A stopped context only steps on request", "[scheduler]") {
    SimulationContext context;
    StepScheduler scheduler(&context, 0.5f);

    CHECK(scheduler.tick(10.0f) == 0);
    scheduler.request_step();
    CHECK(scheduler.tick(0.0f) == 1);
    CHECK(scheduler.tick(0.0f) == 0);
}

TEST_CASE("A running context steps once per interval", "[scheduler]") {
    auto circuit = build_and_circuit();
    SimulationContext context(circuit.get());
    StepScheduler scheduler(&context, 0.5f);
    scheduler.toggle_running();
    REQUIRE(scheduler.is_running());

    CHECK(scheduler.tick(0.25f) == 0);
    CHECK(scheduler.tick(0.25f) == 1);
    CHECK(scheduler.tick(1.25f) == 2);
    // The remaining quarter interval carries over
    CHECK(scheduler.tick(0.25f) == 1);
    CHECK(context.step_count() == 4);

    scheduler.toggle_running();
    CHECK_FALSE(context.is_running());
    CHECK(scheduler.tick(5.0f) == 0);
}

TEST_CASE("Long frames are capped and the backlog dropped", "[scheduler]") {
    SimulationContext context;
    StepScheduler scheduler(&context, 0.5f);
    context.start();

    CHECK(scheduler.tick(100.0f) == StepScheduler::MAX_STEPS_PER_TICK);
    CHECK(scheduler.tick(0.25f) == 0);
}

TEST_CASE("Speed scales the step rate", "[scheduler]") {
    SimulationContext context;
    StepScheduler scheduler(&context, 0.5f);
    context.start();

    scheduler.set_speed(2.0f);
    CHECK(scheduler.effective_interval() == Approx(0.25f));
    CHECK(scheduler.tick(1.0f) == 4);

    scheduler.set_speed(0.0f);
    scheduler.set_speed(-1.0f);
    CHECK(scheduler.speed() == Approx(2.0f));

    scheduler.set_interval(0.0f);
    CHECK(scheduler.interval() == Approx(0.5f));
}

TEST_CASE("Reset clears the driven circuit", "[scheduler]") {
    auto circuit = build_and_circuit();
    SimulationContext context(circuit.get());
    StepScheduler scheduler(&context);
    CHECK(scheduler.interval() == Approx(0.1f));

    for (Component* sw : circuit->input_switches()) {
        sw->set_state(true);
    }
    scheduler.request_step();
    scheduler.reset();
    CHECK(scheduler.tick(0.0f) == 0);

    for (Component* sw : circuit->input_switches()) {
        CHECK(sw->get_state() == false);
    }
}

TEST_CASE("A scheduler without a context does nothing", "[scheduler]") {
    StepScheduler scheduler(nullptr);
    scheduler.request_step();
    scheduler.toggle_running();
    scheduler.reset();
    CHECK(scheduler.tick(1.0f) == 0);
    CHECK_FALSE(scheduler.is_running());

    SimulationContext context;
    scheduler.set_context(&context);
    CHECK(scheduler.context() == &context);
    CHECK(scheduler.tick(1.0f) == 0);
}
