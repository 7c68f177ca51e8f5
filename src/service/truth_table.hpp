#pragma once

/// @file truth_table.hpp
/// @brief Exhaustive truth-table generation and sum-of-products derivation

#include "simulation/circuit.hpp"
#include "simulation/simulation_context.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace logicsim {

/// Middle dot (U+00B7), written between the literals of a minterm
constexpr std::string_view PRODUCT_SEPARATOR = "\xC2\xB7";
constexpr std::string_view SUM_SEPARATOR = " + ";
constexpr char NEGATION_MARK = '\'';

/// Enumeration is exponential in the switch count; beyond this it is refused
constexpr size_t MAX_TRUTH_TABLE_INPUTS = 20;

struct TruthTableRow {
    std::vector<bool> inputs;
    std::vector<bool> outputs;
    bool stable = true; ///< False if UNTIL_STABLE hit its cap on this row
};

struct TruthTable {
    std::vector<std::string> input_columns;  ///< Switch names, discovery order
    std::vector<std::string> output_columns; ///< LED names, discovery order
    std::vector<TruthTableRow> rows;

    [[nodiscard]] bool empty() const { return rows.empty(); }
};

struct TruthTableOptions {
    SettleMode mode = SettleMode::FIXED_STEPS;
    int settle_steps = 5;      ///< step() calls per row in FIXED_STEPS mode
    int max_settle_steps = 64; ///< Cap per row in UNTIL_STABLE mode
};

class TruthTableService {
  public:
    TruthTableService() = default;
    explicit TruthTableService(TruthTableOptions options) : options_(options) {}

    [[nodiscard]] const TruthTableOptions& options() const { return options_; }
    void set_options(TruthTableOptions options) { options_ = options; }

    /// Drives @p circuit through all 2^n switch combinations, most significant
    /// switch first. Each row starts from all-false switches, ports and
    /// connectors. The switches are left in the state of the last row.
    ///
    /// A circuit without switches or without LEDs yields an empty table.
    /// @throws std::invalid_argument if the circuit has more than
    ///         MAX_TRUTH_TABLE_INPUTS switches
    [[nodiscard]] TruthTable generate_truth_table(Circuit& circuit) const;

    /// Sum-of-products over the rows where output @p output_index is true.
    /// Returns "0" when no row is true and "1" when every row is.
    /// @throws std::out_of_range if @p output_index names no output column
    [[nodiscard]] static std::string derive_boolean_expression(const TruthTable& table,
                                                               size_t output_index);

  private:
    TruthTableOptions options_;
};

} // namespace logicsim
