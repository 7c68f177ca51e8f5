/// @file step_scheduler.hpp
/// @brief The external timer that turns a SimulationContext into a running simulation.
///
/// The simulation core defines no timing. The scheduler accumulates frame
/// time and calls step() once per interval while the context is running;
/// while it is stopped, only explicitly requested steps run.

#pragma once

#include "simulation/simulation_context.hpp"

namespace logicsim {

/// Usage:
///   1. Construct with the context to drive and the base step interval
///   2. Each frame, call tick(delta_time)
///   3. Use toggle_running() / request_step() / reset() from the UI
class StepScheduler {
  public:
    /// Upper bound on steps run by one tick(), so a long frame cannot stall the UI
    static constexpr int MAX_STEPS_PER_TICK = 8;

    /// @param context Non-owning pointer to the driven context (may be null)
    /// @param interval Seconds between steps at speed 1.0
    explicit StepScheduler(SimulationContext* context, float interval = 0.1f);

    [[nodiscard]] SimulationContext* context() const { return context_; }

    /// Rebinds the scheduler; pending time and step requests are dropped
    void set_context(SimulationContext* context);

    /// Advances the timer by one frame.
    /// @param delta_time Seconds since last frame
    /// @return number of step() calls made
    int tick(float delta_time);

    /// Queues one step, run on the next tick regardless of the running flag
    void request_step() { step_requested_ = true; }

    /// Starts or stops the context
    void toggle_running();

    [[nodiscard]] bool is_running() const;

    /// Resets the context and drops accumulated time
    void reset();

    // --- Speed control ---

    /// Multiplier on the step rate; values <= 0 are ignored
    void set_speed(float speed);
    [[nodiscard]] float speed() const { return speed_; }

    void set_interval(float interval);
    [[nodiscard]] float interval() const { return interval_; }

    /// Seconds between steps at the current speed
    [[nodiscard]] float effective_interval() const { return interval_ / speed_; }

  private:
    SimulationContext* context_;
    float interval_;
    float speed_ = 1.0f;
    float accumulated_ = 0.0f;
    bool step_requested_ = false;
};

} // namespace logicsim
