/// @file project.cpp
/// @brief Project circuit management and reference resolution

#include "simulation/project.hpp"

#include "util/log.hpp"

#include <algorithm>
#include <stdexcept>

namespace logicsim {

Project::Project(std::string name, std::string path)
    : name_(std::move(name)), path_(std::move(path)) {}

Circuit* Project::create_circuit(std::string name) {
    return add_circuit(std::make_unique<Circuit>(ids_.next("circuit"), std::move(name)));
}

Circuit* Project::add_circuit(std::unique_ptr<Circuit> circuit) {
    if (circuit == nullptr) {
        return nullptr;
    }
    circuits_.push_back(std::move(circuit));
    Circuit* added = circuits_.back().get();
    if (current_ == nullptr) {
        current_ = added;
    }
    return added;
}

void Project::remove_circuit(const Circuit* circuit) {
    if (circuit == nullptr) {
        return;
    }
    circuits_.erase(std::remove_if(circuits_.begin(), circuits_.end(),
                                   [circuit](const std::unique_ptr<Circuit>& c) {
                                       return c.get() == circuit;
                                   }),
                    circuits_.end());
    if (current_ == circuit) {
        current_ = circuits_.empty() ? nullptr : circuits_.front().get();
    }
}

Circuit* Project::find_circuit_by_id(std::string_view id) const {
    for (const auto& circuit : circuits_) {
        if (circuit->get_id() == id) {
            return circuit.get();
        }
    }
    return nullptr;
}

Circuit* Project::find_circuit_by_name(std::string_view name) const {
    for (const auto& circuit : circuits_) {
        if (circuit->get_name() == name) {
            return circuit.get();
        }
    }
    return nullptr;
}

void Project::set_current_circuit(Circuit* circuit) {
    auto it = std::find_if(circuits_.begin(), circuits_.end(),
                           [circuit](const std::unique_ptr<Circuit>& c) {
                               return c.get() == circuit;
                           });
    if (it == circuits_.end()) {
        throw std::invalid_argument("set_current_circuit() requires a circuit of this project");
    }
    current_ = circuit;
}

std::unique_ptr<Circuit> Project::load_circuit(const std::string& name) {
    const Circuit* source = find_circuit_by_name(name);
    if (source == nullptr) {
        log_warning("project '{}' has no circuit named '{}'", name_, name);
        return nullptr;
    }
    return source->clone();
}

size_t Project::refresh_sub_circuits(std::string_view circuit_name) {
    size_t refreshed = 0;
    for (const auto& circuit : circuits_) {
        for (const auto& component : circuit->components()) {
            const SubCircuit* sub = component->sub_circuit();
            if (sub == nullptr || sub->reference().circuit_name != circuit_name) {
                continue;
            }
            std::unique_ptr<Circuit> body = load_circuit(sub->reference().circuit_name);
            if (body == nullptr) {
                continue;
            }
            component->update_sub_circuit(std::move(body));
            refreshed++;
        }
    }
    log_info("refreshed {} instance(s) of sub-circuit '{}'", refreshed, circuit_name);
    return refreshed;
}

} // namespace logicsim
