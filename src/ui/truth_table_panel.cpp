/// @file truth_table_panel.cpp
/// @brief Implements the truth table panel

#include "ui/truth_table_panel.hpp"

#include "util/log.hpp"

#include <algorithm>
#include <exception>
#include <sstream>
#include <string>
#include <utility>

namespace logicsim {

namespace {

constexpr float PADDING = 10.0f;
constexpr float ROW_HEIGHT = 18.0f;
constexpr float TITLE_HEIGHT = 26.0f;
constexpr float COLUMN_WIDTH = 44.0f;
constexpr int FONT_SIZE = 16;
constexpr int FONT_SIZE_SMALL = 13;

const Color BG_COLOR = {35, 35, 42, 230};
const Color BORDER_COLOR = {70, 70, 85, 255};
const Color TEXT_COLOR = {220, 220, 230, 255};
const Color LABEL_COLOR = {160, 160, 180, 255};
const Color BIT_ONE = {50, 220, 80, 255};
const Color BIT_ZERO = {150, 150, 170, 255};
const Color UNSTABLE_COLOR = {255, 160, 60, 255};
const Color ERROR_COLOR = {255, 110, 110, 255};
const Color EXPRESSION_COLOR = {180, 180, 100, 255};
const Color SEPARATOR_COLOR = {60, 60, 75, 255};

/// Draws wrapped text and returns consumed height.
float draw_wrapped_text(const std::string& text, float x, float y, float max_width, int font_size,
                        Color color, float line_gap = 2.0f) {
    std::istringstream iss(text);
    std::string word;
    std::string line;
    float cy = y;

    while (iss >> word) {
        std::string candidate = line.empty() ? word : (line + " " + word);
        if (MeasureText(candidate.c_str(), font_size) <= static_cast<int>(max_width)) {
            line = std::move(candidate);
        } else {
            if (!line.empty()) {
                DrawText(line.c_str(), static_cast<int>(x), static_cast<int>(cy), font_size, color);
                cy += static_cast<float>(font_size) + line_gap;
            }
            line = word;
        }
    }

    if (!line.empty()) {
        DrawText(line.c_str(), static_cast<int>(x), static_cast<int>(cy), font_size, color);
        cy += static_cast<float>(font_size);
    }

    return cy - y;
}

void draw_cell(const std::string& text, float x, float y, Color color) {
    int tw = MeasureText(text.c_str(), FONT_SIZE_SMALL);
    DrawText(text.c_str(), static_cast<int>(x + (COLUMN_WIDTH - static_cast<float>(tw)) / 2.0f),
             static_cast<int>(y), FONT_SIZE_SMALL, color);
}

} // namespace

TruthTableView build_truth_table_view(const TruthTableService& service, Circuit& circuit) {
    TruthTableView view;
    view.circuit_name = circuit.get_name();
    try {
        view.table = service.generate_truth_table(circuit);
        for (size_t i = 0; i < view.table.output_columns.size(); i++) {
            view.expressions.push_back(TruthTableService::derive_boolean_expression(view.table, i));
        }
    } catch (const std::exception& e) {
        log_error("truth table for '{}' failed: {}", circuit.get_name(), e.what());
        view.error = e.what();
    }
    return view;
}

float draw_truth_table_panel(const TruthTableView& view, float panel_x, float panel_y,
                             float panel_w, float max_height) {
    float content_w = panel_w - 2.0f * PADDING;
    float cx = panel_x + PADDING;

    // Measure first so the background goes underneath
    const TruthTable& table = view.table;
    size_t columns = table.input_columns.size() + table.output_columns.size();
    float fixed_h = PADDING + TITLE_HEIGHT + ROW_HEIGHT + 4.0f; // title + header
    float expr_h = static_cast<float>(table.output_columns.size()) * (ROW_HEIGHT * 2.0f);
    float avail_rows_h = max_height - fixed_h - expr_h - 2.0f * PADDING - ROW_HEIGHT;
    size_t fit_rows = avail_rows_h > 0.0f ? static_cast<size_t>(avail_rows_h / ROW_HEIGHT) : 0;
    size_t shown_rows = std::min(fit_rows, table.rows.size());
    bool truncated = shown_rows < table.rows.size();

    float panel_h = fixed_h + static_cast<float>(shown_rows) * ROW_HEIGHT + expr_h + PADDING;
    if (truncated) {
        panel_h += ROW_HEIGHT;
    }
    if (!view.error.empty() || table.empty()) {
        panel_h = PADDING + TITLE_HEIGHT + 3.0f * ROW_HEIGHT + PADDING;
    }
    panel_h = std::min(panel_h, max_height);

    DrawRectangleRec({panel_x, panel_y, panel_w, panel_h}, BG_COLOR);
    DrawRectangleLinesEx({panel_x, panel_y, panel_w, panel_h}, 1.0f, BORDER_COLOR);

    float cy = panel_y + PADDING;
    std::string title = "TRUTH TABLE: " + view.circuit_name;
    DrawText(title.c_str(), static_cast<int>(cx), static_cast<int>(cy), FONT_SIZE, TEXT_COLOR);
    cy += TITLE_HEIGHT;

    if (!view.error.empty()) {
        draw_wrapped_text(view.error, cx, cy, content_w, FONT_SIZE_SMALL, ERROR_COLOR);
        return panel_h;
    }
    if (table.empty()) {
        draw_wrapped_text("Needs at least one switch and one LED.", cx, cy, content_w,
                          FONT_SIZE_SMALL, LABEL_COLOR);
        return panel_h;
    }

    // Header: inputs | outputs
    float x = cx;
    for (const std::string& name : table.input_columns) {
        draw_cell(name, x, cy, LABEL_COLOR);
        x += COLUMN_WIDTH;
    }
    float divider_x = x;
    for (const std::string& name : table.output_columns) {
        draw_cell(name, x, cy, TEXT_COLOR);
        x += COLUMN_WIDTH;
    }
    cy += ROW_HEIGHT;
    DrawLine(static_cast<int>(cx), static_cast<int>(cy),
             static_cast<int>(cx + static_cast<float>(columns) * COLUMN_WIDTH),
             static_cast<int>(cy), SEPARATOR_COLOR);
    cy += 4.0f;

    for (size_t r = 0; r < shown_rows; r++) {
        const TruthTableRow& row = table.rows[r];
        x = cx;
        for (bool bit : row.inputs) {
            draw_cell(bit ? "1" : "0", x, cy, bit ? BIT_ONE : BIT_ZERO);
            x += COLUMN_WIDTH;
        }
        for (bool bit : row.outputs) {
            draw_cell(bit ? "1" : "0", x, cy, bit ? BIT_ONE : BIT_ZERO);
            x += COLUMN_WIDTH;
        }
        if (!row.stable) {
            DrawText("unstable", static_cast<int>(x + 4.0f), static_cast<int>(cy),
                     FONT_SIZE_SMALL, UNSTABLE_COLOR);
        }
        cy += ROW_HEIGHT;
    }
    DrawLine(static_cast<int>(divider_x - 2.0f), static_cast<int>(panel_y + PADDING + TITLE_HEIGHT),
             static_cast<int>(divider_x - 2.0f), static_cast<int>(cy), SEPARATOR_COLOR);

    if (truncated) {
        std::string more = "... " + std::to_string(table.rows.size() - shown_rows) + " more rows";
        DrawText(more.c_str(), static_cast<int>(cx), static_cast<int>(cy), FONT_SIZE_SMALL,
                 LABEL_COLOR);
        cy += ROW_HEIGHT;
    }

    cy += 4.0f;
    for (size_t i = 0; i < view.expressions.size(); i++) {
        std::string line = table.output_columns[i] + " = " + view.expressions[i];
        cy += draw_wrapped_text(line, cx, cy, content_w, FONT_SIZE_SMALL, EXPRESSION_COLOR) + 4.0f;
    }

    return panel_h;
}

} // namespace logicsim
