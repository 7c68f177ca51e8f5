/// @file id_generator.cpp
/// @brief IdGenerator implementation

#include "simulation/id_generator.hpp"

namespace logicsim {

std::string IdGenerator::next(std::string_view prefix) {
    std::string id(prefix);
    id += '_';
    id += std::to_string(next_++);
    return id;
}

} // namespace logicsim
