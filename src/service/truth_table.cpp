/// @file truth_table.cpp
/// @brief Row enumeration over a SimulationContext, and minterm assembly

#include "service/truth_table.hpp"

#include "util/log.hpp"

#include <stdexcept>

namespace logicsim {

namespace {

/// Zeroes switch states, port values and connector values of the top-level graph
void clear_circuit(Circuit& circuit) {
    for (const auto& component : circuit.components()) {
        if (component->get_type() == ComponentType::INPUT_SWITCH) {
            component->set_state(false);
        }
        component->clear_ports();
    }
    for (const auto& connector : circuit.connectors()) {
        connector->set_value(false);
    }
}

} // namespace

TruthTable TruthTableService::generate_truth_table(Circuit& circuit) const {
    std::vector<Component*> switches = circuit.input_switches();
    std::vector<Component*> leds = circuit.led_outputs();

    TruthTable table;
    if (switches.empty() || leds.empty()) {
        log_debug("circuit '{}' has {} switches and {} LEDs; no truth table",
                  circuit.get_name(), switches.size(), leds.size());
        return table;
    }
    if (switches.size() > MAX_TRUTH_TABLE_INPUTS) {
        throw std::invalid_argument("truth table limited to " +
                                    std::to_string(MAX_TRUTH_TABLE_INPUTS) + " inputs, circuit has " +
                                    std::to_string(switches.size()));
    }

    for (const Component* sw : switches) {
        table.input_columns.push_back(sw->get_name());
    }
    for (const Component* led : leds) {
        table.output_columns.push_back(led->get_name());
    }

    const size_t n = switches.size();
    const size_t row_count = size_t{1} << n;
    table.rows.reserve(row_count);

    SimulationContext context(&circuit);
    size_t unstable_rows = 0;

    for (size_t i = 0; i < row_count; i++) {
        clear_circuit(circuit);

        for (size_t j = 0; j < n; j++) {
            // set_state() executes the switch, so its output is live
            switches[j]->set_state(((i >> (n - 1 - j)) & 1U) != 0);
        }

        TruthTableRow row;
        if (options_.mode == SettleMode::UNTIL_STABLE) {
            row.stable = context.settle(options_.max_settle_steps);
        } else {
            for (int s = 0; s < options_.settle_steps; s++) {
                context.step();
            }
        }

        for (Component* led : leds) {
            led->execute();
            row.outputs.push_back(led->is_lit());
        }
        for (const Component* sw : switches) {
            row.inputs.push_back(sw->get_state());
        }

        if (!row.stable) {
            unstable_rows++;
            log_warning("circuit '{}': row {} did not settle within {} steps", circuit.get_name(),
                        i, options_.max_settle_steps);
        }
        table.rows.push_back(std::move(row));
    }

    log_info("truth table for '{}': {} inputs, {} outputs, {} rows ({} unstable)",
             circuit.get_name(), n, leds.size(), row_count, unstable_rows);
    return table;
}

std::string TruthTableService::derive_boolean_expression(const TruthTable& table,
                                                         size_t output_index) {
    if (output_index >= table.output_columns.size()) {
        throw std::out_of_range("output index " + std::to_string(output_index) +
                                " out of range (" + std::to_string(table.output_columns.size()) +
                                " outputs)");
    }

    std::string expression;
    size_t true_rows = 0;
    for (const TruthTableRow& row : table.rows) {
        if (output_index >= row.outputs.size() || !row.outputs[output_index]) {
            continue;
        }
        true_rows++;

        std::string minterm;
        for (size_t i = 0; i < row.inputs.size() && i < table.input_columns.size(); i++) {
            if (i > 0) {
                minterm += PRODUCT_SEPARATOR;
            }
            minterm += table.input_columns[i];
            if (!row.inputs[i]) {
                minterm += NEGATION_MARK;
            }
        }

        if (!expression.empty()) {
            expression += SUM_SEPARATOR;
        }
        expression += minterm;
    }

    if (true_rows == 0) {
        return "0";
    }
    if (true_rows == table.rows.size()) {
        return "1";
    }
    return expression;
}

} // namespace logicsim
