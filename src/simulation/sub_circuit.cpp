/// @file sub_circuit.cpp
/// @brief Lazy loading, port analysis, cycle detection, and nested evaluation

#include "simulation/sub_circuit.hpp"

#include "simulation/circuit.hpp"
#include "simulation/simulation_context.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace logicsim {

namespace {

std::string join_chain(const std::vector<std::string>& chain, const std::string& last) {
    std::string text;
    for (const std::string& name : chain) {
        text += name;
        text += " -> ";
    }
    text += last;
    return text;
}

} // namespace

SubCircuit::SubCircuit(CircuitReference reference, CircuitLoader* loader)
    : reference_(std::move(reference)), loader_(loader) {}

SubCircuit::SubCircuit(std::unique_ptr<Circuit> body) {
    if (body == nullptr) {
        throw std::invalid_argument("SubCircuit requires a non-null body circuit");
    }
    reference_.circuit_name = body->get_name();
    body_ = std::move(body);
    analyze();
}

SubCircuit::~SubCircuit() = default;

bool SubCircuit::ensure_loaded() {
    if (state_ != LoadState::UNLOADED) {
        return state_ == LoadState::LOADED;
    }

    if (loader_ == nullptr) {
        fail("no circuit loader set");
        return false;
    }

    std::unique_ptr<Circuit> loaded;
    try {
        loaded = loader_->load_circuit(reference_.circuit_name);
    } catch (const std::exception& e) {
        fail(std::string("loader threw: ") + e.what());
        return false;
    }
    if (loaded == nullptr) {
        fail("loader returned no circuit");
        return false;
    }

    body_ = std::move(loaded);
    analyze();
    return state_ == LoadState::LOADED;
}

void SubCircuit::replace_body(std::unique_ptr<Circuit> body) {
    if (body == nullptr) {
        throw std::invalid_argument("replace_body() requires a non-null body circuit");
    }
    body_ = std::move(body);
    load_error_.clear();
    analyze();
}

void SubCircuit::analyze() {
    switches_.clear();
    leds_.clear();
    context_.reset();

    // The chain of circuits this body is nested in, itself included
    std::vector<std::string> chain = ancestry_;
    chain.push_back(reference_.circuit_name);

    for (const auto& component : body_->components()) {
        const SubCircuit* nested = component->sub_circuit();
        if (nested == nullptr) {
            continue;
        }
        const std::string& name = nested->reference().circuit_name;
        if (std::find(chain.begin(), chain.end(), name) != chain.end()) {
            body_.reset();
            fail("circuit reference cycle: " + join_chain(chain, name), LogLevel::ERROR);
            return;
        }
    }

    for (const auto& component : body_->components()) {
        if (component->get_type() == ComponentType::INPUT_SWITCH) {
            switches_.push_back(component.get());
        } else if (component->get_type() == ComponentType::LED_OUTPUT) {
            leds_.push_back(component.get());
        } else if (SubCircuit* nested = component->sub_circuit(); nested != nullptr) {
            nested->set_ancestry(chain);
        }
    }

    state_ = LoadState::LOADED;
    log_debug("sub-circuit '{}' analyzed: {} inputs, {} outputs", reference_.circuit_name,
              switches_.size(), leds_.size());
}

void SubCircuit::fail(std::string reason, LogLevel level) {
    state_ = LoadState::FAILED;
    load_error_ = std::move(reason);
    switches_.clear();
    leds_.clear();
    context_.reset();

    if (level == LogLevel::ERROR) {
        log_error("sub-circuit '{}': {}", reference_.circuit_name, load_error_);
    } else {
        log_warning("failed to load sub-circuit '{}': {}; using it with no ports",
                    reference_.circuit_name, load_error_);
    }
}

void SubCircuit::evaluate(const std::vector<Port>& inputs, std::vector<Port>& outputs) {
    if (state_ != LoadState::LOADED) {
        return;
    }

    for (size_t i = 0; i < inputs.size() && i < switches_.size(); i++) {
        switches_[i]->set_state(inputs[i].get_value());
    }

    if (context_ == nullptr) {
        context_ = std::make_unique<SimulationContext>(body_.get());
    }
    context_->step();

    for (size_t i = 0; i < outputs.size() && i < leds_.size(); i++) {
        leds_[i]->execute();
        outputs[i].set_value(leds_[i]->is_lit());
    }
}

std::unique_ptr<SubCircuit> SubCircuit::clone() const {
    if (loader_ == nullptr && body_ != nullptr) {
        auto copy = std::make_unique<SubCircuit>(body_->clone());
        copy->reference_ = reference_;
        copy->ancestry_ = ancestry_;
        return copy;
    }
    auto copy = std::make_unique<SubCircuit>(reference_, loader_);
    copy->ancestry_ = ancestry_;
    return copy;
}

} // namespace logicsim
