/// @file truth_table_panel.hpp
/// @brief Panel listing a generated truth table and the derived expression per output.

#pragma once

#include "service/truth_table.hpp"

#include <raylib.h>

#include <string>
#include <vector>

namespace logicsim {

/// A truth table plus its per-output expressions, computed once on request
struct TruthTableView {
    std::string circuit_name;
    TruthTable table;
    std::vector<std::string> expressions; ///< One per output column
    std::string error;                    ///< Set instead of a table when generation failed
};

/// Runs the service on @p circuit and derives every output's expression.
/// Errors are captured in TruthTableView::error instead of propagating.
[[nodiscard]] TruthTableView build_truth_table_view(const TruthTableService& service,
                                                    Circuit& circuit);

/// Draws the table, at most as many rows as fit in @p max_height.
/// @return Rendered panel height, for dynamic stacking.
float draw_truth_table_panel(const TruthTableView& view, float panel_x, float panel_y,
                             float panel_w, float max_height);

} // namespace logicsim
