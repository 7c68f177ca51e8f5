#pragma once

/// @file sub_circuit.hpp
/// @brief Hierarchical composition: a saved circuit used as a black-box component
///
/// A sub-circuit stores a reference (circuit name, optional file path) rather
/// than an embedded copy. The body is fetched through a CircuitLoader on first
/// need, scanned once for INPUT_SWITCH and LED_OUTPUT components, and driven
/// by a dedicated SimulationContext owned by the sub-circuit.
///
/// State machine:
///   UNLOADED --ensure_loaded()--> LOADED  (body analyzed, ports known)
///   UNLOADED --ensure_loaded()--> FAILED  (loader null/threw, or reference cycle)
///   any      --replace_body()---> LOADED

#include "simulation/port.hpp"
#include "util/log.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace logicsim {

class Circuit;
class Component;
class SimulationContext;

/// Names the circuit a sub-circuit stands for
struct CircuitReference {
    std::string circuit_name;
    std::string file_path; ///< Optional, informational for the persistence layer
};

/// Capability supplied by the owning application to resolve circuit references.
/// Implementations return a fresh graph the caller owns, or nullptr when the
/// circuit is unavailable. Throwing is tolerated and treated like nullptr.
class CircuitLoader {
  public:
    virtual ~CircuitLoader() = default;
    [[nodiscard]] virtual std::unique_ptr<Circuit> load_circuit(const std::string& name) = 0;
};

enum class LoadState { UNLOADED, LOADED, FAILED };

class SubCircuit {
  public:
    /// Unloaded sub-circuit resolved later through @p loader (not owned)
    SubCircuit(CircuitReference reference, CircuitLoader* loader);

    /// Loaded sub-circuit around an in-memory body.
    /// @throws std::invalid_argument if @p body is null
    explicit SubCircuit(std::unique_ptr<Circuit> body);

    ~SubCircuit();

    SubCircuit(const SubCircuit&) = delete;
    SubCircuit& operator=(const SubCircuit&) = delete;

    [[nodiscard]] LoadState state() const { return state_; }
    [[nodiscard]] const CircuitReference& reference() const { return reference_; }
    [[nodiscard]] const std::string& load_error() const { return load_error_; }
    [[nodiscard]] CircuitLoader* loader() const { return loader_; }
    void set_loader(CircuitLoader* loader) { loader_ = loader; }

    /// Names of the circuits enclosing this one, outermost first
    [[nodiscard]] const std::vector<std::string>& ancestry() const { return ancestry_; }
    void set_ancestry(std::vector<std::string> ancestry) { ancestry_ = std::move(ancestry); }

    /// The body circuit, or nullptr unless LOADED
    [[nodiscard]] Circuit* body() const { return body_.get(); }

    /// Body switches in discovery order; index i backs input port i
    [[nodiscard]] const std::vector<Component*>& input_switches() const { return switches_; }

    /// Body LEDs in discovery order; index i backs output port i
    [[nodiscard]] const std::vector<Component*>& output_leds() const { return leds_; }

    [[nodiscard]] size_t input_count() const { return switches_.size(); }
    [[nodiscard]] size_t output_count() const { return leds_.size(); }

    /// Performs the UNLOADED transition. Never throws; a failure is logged,
    /// recorded in load_error() and leaves the sub-circuit with no ports.
    /// @return true if the body is LOADED
    bool ensure_loaded();

    /// Replaces the body and re-runs the analysis
    /// @throws std::invalid_argument if @p body is null
    void replace_body(std::unique_ptr<Circuit> body);

    /// Copies input port values into the body switches, runs one body step,
    /// and copies the body LED values into the output ports.
    void evaluate(const std::vector<Port>& inputs, std::vector<Port>& outputs);

    /// Unloaded copy with the same reference and loader; a sub-circuit with no
    /// loader copies its body instead.
    [[nodiscard]] std::unique_ptr<SubCircuit> clone() const;

  private:
    void analyze();
    void fail(std::string reason, LogLevel level = LogLevel::WARNING);

    CircuitReference reference_;
    CircuitLoader* loader_ = nullptr;
    LoadState state_ = LoadState::UNLOADED;
    std::string load_error_;
    std::vector<std::string> ancestry_;

    std::unique_ptr<Circuit> body_;
    std::vector<Component*> switches_;
    std::vector<Component*> leds_;
    std::unique_ptr<SimulationContext> context_;
};

} // namespace logicsim
