#pragma once

/// @file include/chassis/lineup.hpp
/// @brief Lineup Optimizer: assign clips to center sections.
///
/// # Module: Lineup Builder
///
/// ## Responsibility
/// Pair every clip with one center section (and every section with one clip)
/// so that the summed weighted damper score is minimal or maximal:
///
///     score(clip, section) = Σ_c  w_c · L_c(clip, section)
///     objective            = Σ_pairs score
///
/// ## Two paths, one call
/// - Interchangeable sections: each clip has one length per corner whatever
///   section it sits on. Clips are stably sorted by score and dealt out in
///   section order. O(n log n).
/// - Per-pair lengths (`LineupRequest::pair_lengths` set): every clip was
///   measured on every section, so the score depends on the pair. Solved as a
///   rectangular assignment problem (Kuhn–Munkres) over the score matrix.
///   O(n³). Unmeasured pairs are forbidden.
///
/// ## Guarantees
/// - Deterministic: identical requests give identical lineups; ties keep the
///   input order of clips and sections
/// - A returned lineup is one-to-one; with `TruncationPolicy::DropExcess` the
///   ids left out are listed in the result
/// - Never returns a lineup that uses an unmeasured pair
///
/// ## NOT Responsible For
/// - Computing damper lengths (see src/geometry/)
/// - Picking which clips or sections take part (filter the rows first)

#include "chassis/types.hpp"
#include "chassis/errors.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chassis::lineup {

// ─── Options ──────────────────────────────────────────────────────────────────

enum class Direction {
    Minimize,
    Maximize,
};

/// What to do when clip and section counts differ.
enum class TruncationPolicy {
    Strict,      ///< Throw `InfeasibleLineupError`
    DropExcess,  ///< Keep the best-scoring subset, list the rest as dropped
};

[[nodiscard]] const char* to_string(Direction d) noexcept;

// ─── CornerWeights ────────────────────────────────────────────────────────────

/// Per-corner score weights. Every weight is finite and non-negative and at
/// least one is positive.
class CornerWeights {
public:
    /// Validate and wrap `weights` (indexed LF, RF, LR, RR).
    ///
    /// # Returns
    /// `nullopt` if any weight is negative or non-finite, or all are zero.
    [[nodiscard]] static std::optional<CornerWeights>
    make(const CornerArray<double>& weights) noexcept;

    /// 0.25 on every corner.
    [[nodiscard]] static CornerWeights uniform() noexcept;

    [[nodiscard]] double operator[](Corner c) const noexcept { return w_[index(c)]; }
    [[nodiscard]] const CornerArray<double>& values() const noexcept { return w_; }

private:
    explicit CornerWeights(const CornerArray<double>& w) noexcept : w_(w) {}

    CornerArray<double> w_;
};

// ─── Inputs ───────────────────────────────────────────────────────────────────

/// A clip with exactly one damper length per corner.
struct ClipProfile {
    std::string         clip_id;
    CornerArray<double> lengths{};
};

/// Damper lengths of every (clip, section) combination. Row i is the i-th
/// clip of the request, column j its j-th center section. NaN marks a pair
/// that was never measured.
struct PairLengthMatrix {
    CornerArray<Eigen::MatrixXd> lengths;

    /// A matrix of `clips × sections` NaN entries per corner.
    [[nodiscard]] static PairLengthMatrix unmeasured(std::size_t clips,
                                                     std::size_t sections);

    [[nodiscard]] std::size_t clip_count() const noexcept {
        return static_cast<std::size_t>(lengths[0].rows());
    }
    [[nodiscard]] std::size_t section_count() const noexcept {
        return static_cast<std::size_t>(lengths[0].cols());
    }

    /// The four corner lengths of pair (clip i, section j).
    [[nodiscard]] CornerArray<double> at(std::size_t i, std::size_t j) const noexcept;

    /// True if all four corners of pair (i, j) are finite.
    [[nodiscard]] bool measured(std::size_t i, std::size_t j) const noexcept;
};

/// Everything one optimization needs.
struct LineupRequest {
    /// Clips in input order. With `pair_lengths` set only the ids are read.
    std::vector<ClipProfile> clips;

    /// Center-section ids in input (and assignment) order.
    std::vector<std::string> center_sections;

    CornerWeights    weights    = CornerWeights::uniform();
    Direction        direction  = Direction::Minimize;
    TruncationPolicy truncation = TruncationPolicy::Strict;

    /// Per-pair lengths. When set the assignment solver is used.
    std::optional<PairLengthMatrix> pair_lengths;
};

// ─── Outputs ──────────────────────────────────────────────────────────────────

/// One assigned pair and its score breakdown.
struct PairScore {
    std::string         clip_id;
    std::string         center_section_id;
    CornerArray<double> lengths{};       ///< Damper length per corner for this pair
    CornerArray<double> contribution{};  ///< weight × length per corner
    double              score = 0.0;     ///< Σ contribution
};

struct Lineup {
    std::vector<PairScore>   pairs;              ///< In center-section order
    double                   objective = 0.0;    ///< Σ pair scores
    Direction                direction = Direction::Minimize;
    std::vector<std::string> dropped_clips;      ///< Input order
    std::vector<std::string> dropped_sections;   ///< Input order
    bool                     used_pair_lengths = false;

    [[nodiscard]] const PairScore* find_section(std::string_view section_id) const noexcept;
    [[nodiscard]] const PairScore* find_clip(std::string_view clip_id) const noexcept;
};

/// A manual lineup: (clip id, center-section id) pairs.
using Assignment = std::vector<std::pair<std::string, std::string>>;

/// What happens to one section if another clip is moved onto it.
struct SwapCandidate {
    std::string                clip_id;
    std::optional<std::string> assigned_section;  ///< Where the clip sits now, if anywhere
    CornerArray<double>        lengths{};         ///< Lengths of this clip on the section
    CornerArray<double>        delta{};           ///< lengths − current clip's lengths
    double                     score_delta = 0.0; ///< Weighted Σ delta
};

// ─── LineupOptimizer ──────────────────────────────────────────────────────────

class LineupOptimizer {
public:
    /// Build the optimal lineup for `request`.
    ///
    /// # Errors
    /// - `InfeasibleLineupError` when counts differ under
    ///   `TruncationPolicy::Strict`, or when every complete assignment needs an
    ///   unmeasured pair (`unmatched_count` is the fewest such pairs)
    /// - `std::invalid_argument` for duplicate ids, non-finite clip lengths or
    ///   a `pair_lengths` table whose shape does not match the request
    [[nodiscard]] static Lineup optimize(const LineupRequest& request);

    /// Σ_c weight(c) · lengths[c].
    [[nodiscard]] static double weighted_score(const CornerArray<double>& lengths,
                                               const CornerWeights& weights) noexcept;

    /// Score a caller-chosen lineup.
    ///
    /// # Errors
    /// - `std::invalid_argument` if `assignment` names an unknown id, repeats an
    ///   id, or covers fewer than min(clips, sections) pairs
    /// - `InfeasibleLineupError` as for `optimize` (count mismatch under
    ///   `Strict`, or an unmeasured pair)
    [[nodiscard]] static Lineup evaluate(const LineupRequest& request,
                                         const Assignment& assignment);

    /// For `section_id`, how each other clip of the request would compare to
    /// the clip `lineup` puts there. Best improvement in the request's
    /// direction first; unmeasured pairs are skipped.
    ///
    /// # Errors
    /// `std::invalid_argument` if `lineup` has no clip on `section_id`.
    [[nodiscard]] static std::vector<SwapCandidate>
    swap_candidates(const LineupRequest& request,
                    const Lineup& lineup,
                    std::string_view section_id);
};

// ─── Building requests from damper results ────────────────────────────────────

/// Distinct clip ids of `results` in order of first appearance.
[[nodiscard]] std::vector<std::string> clip_ids(std::span<const DamperResult> results);

/// Distinct center-section ids of `results` in order of first appearance.
[[nodiscard]] std::vector<std::string>
center_section_ids(std::span<const DamperResult> results);

/// Per-pair length table for `clips × sections`. Combinations absent from
/// `results` stay NaN; a repeated (clip, section, corner) keeps the first row.
[[nodiscard]] PairLengthMatrix
build_pair_lengths(std::span<const DamperResult> results,
                   std::span<const std::string> clips,
                   std::span<const std::string> sections);

struct ClipProfileSet {
    std::vector<ClipProfile> profiles;    ///< Complete clips, first-appearance order
    std::vector<std::string> incomplete;  ///< Clips missing at least one corner
};

/// One profile per clip, each corner averaged over every section the clip
/// was measured on.
[[nodiscard]] ClipProfileSet build_clip_profiles(std::span<const DamperResult> results);

}  // namespace chassis::lineup
