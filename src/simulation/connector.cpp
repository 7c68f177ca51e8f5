/// @file connector.cpp
/// @brief Connector class implementation

#include "simulation/connector.hpp"

#include "simulation/component.hpp"

#include <stdexcept>
#include <utility>

namespace logicsim {

Connector::Connector(std::string id, Component* source, size_t output_index, Component* sink,
                     size_t input_index)
    : id_(std::move(id)), source_(source), output_index_(output_index), sink_(sink),
      input_index_(input_index) {
    if (source_ == nullptr || sink_ == nullptr) {
        throw std::invalid_argument("Connector requires non-null source and sink components");
    }
}

const Port& Connector::source_port() const {
    return source_->output_port(output_index_);
}

const Port& Connector::sink_port() const {
    return sink_->input_port(input_index_);
}

bool Connector::is_attached() const {
    return output_index_ < source_->output_count() && input_index_ < sink_->input_count();
}

Vec2 Connector::start_position() const {
    if (start_position_) {
        return *start_position_;
    }
    if (output_index_ < source_->output_count()) {
        return source_->output_port(output_index_).get_position();
    }
    return source_->get_position();
}

Vec2 Connector::end_position() const {
    if (end_position_) {
        return *end_position_;
    }
    if (input_index_ < sink_->input_count()) {
        return sink_->input_port(input_index_).get_position();
    }
    return sink_->get_position();
}

void Connector::propagate() {
    if (!is_attached()) {
        return;
    }
    value_ = source_->output_port(output_index_).get_value();
    sink_->input_port(input_index_).set_value(value_);
}

} // namespace logicsim
