#pragma once

/// @file simulation_context.hpp
/// @brief Drives one circuit through discrete execute/propagate steps

#include "simulation/circuit.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace logicsim {

/// How callers that need settled outputs (truth tables) advance the circuit
enum class SettleMode {
    FIXED_STEPS,  ///< A fixed number of step() calls, no convergence check
    UNTIL_STABLE, ///< step() until nothing changes, capped to stay finite on loops
};

/// Propagation engine for a single circuit.
///
/// step() runs, in order:
///   1. execute every component (outputs from possibly stale inputs)
///   2. propagate every connector (source outputs into sink inputs)
///   3. execute every component again (outputs from fresh inputs)
///   4. notify listeners
///
/// Each step settles roughly one more level of a cascaded circuit. There is no
/// cycle detection: a combinational loop never reaches a fixed point, but each
/// step() still returns. start()/stop() only toggle an advisory flag that an
/// external scheduler reads; this class defines no timing.
class SimulationContext {
  public:
    using Listener = std::function<void(const SimulationContext&)>;
    using ListenerId = std::size_t;

    /// @param circuit Non-owning pointer to the driven circuit (may be null)
    explicit SimulationContext(Circuit* circuit = nullptr);

    [[nodiscard]] Circuit* get_circuit() const { return circuit_; }
    void set_circuit(Circuit* circuit) { circuit_ = circuit; }

    [[nodiscard]] bool is_running() const { return running_; }

    /// Number of step() calls made on this context
    [[nodiscard]] uint64_t step_count() const { return step_count_; }

    /// One execute/propagate/execute cycle. No-op, without notification, when
    /// no circuit is attached.
    void step();

    /// Steps until no port, connector, switch or LED value changes between two
    /// consecutive steps (sub-circuit bodies included), or @p max_steps is hit.
    /// @return true if a fixed point was reached
    bool settle(int max_steps);

    /// Sets the running flag and notifies
    void start();

    /// Clears the running flag and notifies
    void stop();

    /// Forces every switch, port and connector value to false, executes every
    /// component once, and notifies.
    void reset();

    /// Registers a change callback invoked after step/start/stop/reset
    ListenerId add_listener(Listener listener);
    void remove_listener(ListenerId id);

    /// Flattened values of every port, connector, switch and LED, nested bodies included
    [[nodiscard]] std::vector<bool> snapshot() const;

  private:
    void notify_listeners();

    Circuit* circuit_;
    bool running_ = false;
    uint64_t step_count_ = 0;
    ListenerId next_listener_id_ = 0;
    std::vector<std::pair<ListenerId, Listener>> listeners_;
};

} // namespace logicsim
