/// @file src/core/errors.cpp
/// @brief Messages for the chassis error taxonomy.

#include "chassis/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace chassis {

const char* to_string(GeometryField f) noexcept {
    switch (f) {
        case GeometryField::UpperMount: return "upper mount";
        case GeometryField::LowerMount: return "lower mount";
        case GeometryField::Offset:     return "offset";
    }
    return "?";
}

std::string GeometryError::to_string() const {
    return fmt::format("row {} ({}/{}/{}): {}",
                       row_index, clip_id, center_section_id,
                       chassis::to_string(corner), message);
}

RankingError::RankingError(std::string scope_name)
    : std::invalid_argument(fmt::format(
          "unknown ranking scope '{}' (expected LF, RF, LR, RR, Front, Rear or Overall)",
          scope_name))
    , scope_name_(std::move(scope_name)) {}

InfeasibleLineupError::InfeasibleLineupError(std::size_t unmatched_count,
                                             std::size_t clip_count,
                                             std::size_t section_count,
                                             const std::string& what)
    : std::runtime_error(what)
    , unmatched_count_(unmatched_count)
    , clip_count_(clip_count)
    , section_count_(section_count) {}

}  // namespace chassis
