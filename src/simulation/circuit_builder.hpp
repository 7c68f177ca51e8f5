#pragma once

/// @file circuit_builder.hpp
/// @brief Factory functions that construct standard circuits from components

#include "simulation/circuit.hpp"
#include "simulation/project.hpp"

#include <memory>

namespace logicsim {

/// Project circuit names the hierarchical builders reference
constexpr const char* HALF_ADDER_NAME = "Half Adder";
constexpr const char* FULL_ADDER_NAME = "Full Adder";

/// Two switches feeding one AND gate.
/// Switches: A, B. LEDs: Y
[[nodiscard]] std::unique_ptr<Circuit> build_and_circuit();

/// XOR as (A AND NOT B) OR (NOT A AND B).
/// Switches: A, B. LEDs: Y
[[nodiscard]] std::unique_ptr<Circuit> build_xor_circuit();

/// Switches: A, B. LEDs: Sum, Carry
[[nodiscard]] std::unique_ptr<Circuit> build_half_adder();

/// Full adder from two "Half Adder" sub-circuits and an OR gate.
/// Registers a half adder in @p project if it has none; the sub-circuits load
/// it through the project.
/// Switches: A, B, Cin. LEDs: Sum, Cout
[[nodiscard]] std::unique_ptr<Circuit> build_full_adder(Project& project);

/// Ripple-carry adder: a "Half Adder" sub-circuit for bit 0 and a chain of
/// "Full Adder" sub-circuits above it, both registered in @p project on demand.
/// Switches: A0..A{n-1}, B0..B{n-1} (index 0 = LSB). LEDs: S0..S{n-1}, Cout
/// @throws std::invalid_argument if @p bits < 1
[[nodiscard]] std::unique_ptr<Circuit> build_ripple_carry_adder(Project& project, int bits);

} // namespace logicsim
