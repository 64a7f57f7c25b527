#pragma once

/// @file include/chassis/errors.hpp
/// @brief Error taxonomy for the chassis core.
///
/// # Propagation
/// - `GeometryError` is a value: one per bad row, collected next to the
///   successful rows so a single bad measurement never aborts the batch.
/// - `RankingError` and `InfeasibleLineupError` are exceptions that abort one
///   ranking or one optimization call. They carry the context a display layer
///   needs to render a message (scope name, mismatched counts).
///
/// Nothing here terminates the process.

#include "chassis/types.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace chassis {

// ─── GeometryError ────────────────────────────────────────────────────────────

/// Which input of a configuration row was unusable.
enum class GeometryField {
    UpperMount,
    LowerMount,
    Offset,
};

[[nodiscard]] const char* to_string(GeometryField f) noexcept;

/// A row-scoped failure to compute a damper length.
struct GeometryError {
    std::size_t   row_index;
    std::string   clip_id;
    std::string   center_section_id;
    Corner        corner;
    GeometryField field;
    std::string   message;

    /// "row 7 (C01/S02/LF): upper mount has a missing or non-numeric coordinate"
    [[nodiscard]] std::string to_string() const;
};

// ─── RankingError ─────────────────────────────────────────────────────────────

/// Raised when a ranking scope selector is not one of
/// LF, RF, LR, RR, Front, Rear, Overall.
class RankingError : public std::invalid_argument {
public:
    explicit RankingError(std::string scope_name);

    /// The selector text that could not be parsed.
    [[nodiscard]] const std::string& scope_name() const noexcept { return scope_name_; }

private:
    std::string scope_name_;
};

// ─── InfeasibleLineupError ────────────────────────────────────────────────────

/// Raised when no complete clip ↔ center-section bijection exists.
///
/// `unmatched_count` is |clips − sections| for a size mismatch, or the number
/// of pairs that had to fall on an unmeasured clip/section combination when a
/// per-pair length table was supplied.
class InfeasibleLineupError : public std::runtime_error {
public:
    InfeasibleLineupError(std::size_t unmatched_count,
                          std::size_t clip_count,
                          std::size_t section_count,
                          const std::string& what);

    [[nodiscard]] std::size_t unmatched_count() const noexcept { return unmatched_count_; }
    [[nodiscard]] std::size_t clip_count()      const noexcept { return clip_count_; }
    [[nodiscard]] std::size_t section_count()   const noexcept { return section_count_; }

private:
    std::size_t unmatched_count_;
    std::size_t clip_count_;
    std::size_t section_count_;
};

}  // namespace chassis
