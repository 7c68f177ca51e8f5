#pragma once

/// @file project.hpp
/// @brief Project: a named set of circuits that also resolves sub-circuit references

#include "simulation/circuit.hpp"
#include "simulation/id_generator.hpp"
#include "simulation/sub_circuit.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace logicsim {

/// Owns the circuits of one design. Sub-circuits refer to project circuits by
/// name, and the project serves them as a CircuitLoader by handing out fresh
/// copies, so a nested instance never aliases the circuit being edited.
///
/// Sub-circuits created with this project as their loader keep a non-owning
/// pointer to it; the project must outlive them.
class Project : public CircuitLoader {
  public:
    explicit Project(std::string name, std::string path = {});

    // The address is handed out as a loader, so the project stays put
    Project(const Project&) = delete;
    Project& operator=(const Project&) = delete;

    [[nodiscard]] const std::string& get_name() const { return name_; }
    [[nodiscard]] const std::string& get_path() const { return path_; }
    void set_name(std::string name) { name_ = std::move(name); }
    void set_path(std::string path) { path_ = std::move(path); }

    /// Creates an empty circuit with a project-unique id. The first circuit
    /// becomes the current one.
    Circuit* create_circuit(std::string name);

    /// Takes ownership of a circuit. Returns nullptr (no-op) for null.
    Circuit* add_circuit(std::unique_ptr<Circuit> circuit);

    /// Removes and destroys a circuit. The current circuit falls back to the
    /// first remaining one. No-op for null or non-member circuits.
    void remove_circuit(const Circuit* circuit);

    [[nodiscard]] Circuit* find_circuit_by_id(std::string_view id) const;
    [[nodiscard]] Circuit* find_circuit_by_name(std::string_view name) const;

    [[nodiscard]] Circuit* current_circuit() const { return current_; }

    /// @throws std::invalid_argument if @p circuit is not part of this project
    void set_current_circuit(Circuit* circuit);

    [[nodiscard]] const std::vector<std::unique_ptr<Circuit>>& circuits() const { return circuits_; }

    /// Returns a deep copy of the named circuit, or nullptr if there is none
    [[nodiscard]] std::unique_ptr<Circuit> load_circuit(const std::string& name) override;

    /// Re-resolves every sub-circuit in the project that refers to
    /// @p circuit_name, after that circuit was edited.
    /// @return number of sub-circuit instances refreshed
    size_t refresh_sub_circuits(std::string_view circuit_name);

  private:
    std::string name_;
    std::string path_;
    IdGenerator ids_;
    std::vector<std::unique_ptr<Circuit>> circuits_;
    Circuit* current_ = nullptr;
};

} // namespace logicsim
