#pragma once

/// @file id_generator.hpp
/// @brief Monotonic id source owned by whichever context creates the objects

#include <cstdint>
#include <string>
#include <string_view>

namespace logicsim {

/// Hands out "<prefix>_<n>" ids from a per-instance counter.
/// Each Circuit owns one for its components and connectors, and each Project
/// owns one for its circuits, so ids never depend on process-wide state.
class IdGenerator {
  public:
    IdGenerator() = default;
    explicit IdGenerator(uint32_t first) : next_(first) {}

    /// Returns "<prefix>_<n>" and advances the counter
    [[nodiscard]] std::string next(std::string_view prefix);

    /// The number the next id will carry
    [[nodiscard]] uint32_t peek() const { return next_; }

  private:
    uint32_t next_ = 0;
};

} // namespace logicsim
