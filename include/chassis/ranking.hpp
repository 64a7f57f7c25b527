#pragma once

/// @file include/chassis/ranking.hpp
/// @brief Ranking Engine: order configurations by damper metrics.
///
/// # Module: Ranking Engine
///
/// ## Responsibility
/// Order computed damper lengths by a single corner or by an aggregate over an
/// assembly, where an assembly is the (clip, center section) pair measured
/// together:
///
///     Front   = mean(LF, RF)
///     Rear    = mean(LR, RR)
///     Overall = mean(LF, RF, LR, RR)
///
/// Assemblies missing a corner that the scope needs are left out of that
/// scope's ranking.
///
/// ## Ordering
/// Ascending by value unless `SortOrder::Descending` is requested. Equal
/// values keep their original table order, so a ranking is reproducible.
/// Each entry carries a competition rank: equal values share the lowest rank
/// and the next distinct value skips ahead (1, 2, 2, 4).
///
/// ## Filtering
/// An optional row predicate (typically a track-type filter) is applied to the
/// damper results before ranking. A filter that excludes every row yields an
/// empty ranking, not an error.
///
/// ## Sensitivity
/// Pearson correlation of a corner's damper length against one of its mount
/// coordinates, or of one corner's length against another's across
/// assemblies. Undefined correlations (fewer than two points, or a constant
/// series) are `nullopt`.
///
/// ## NOT Responsible For
/// - Computing damper lengths (see src/geometry/)
/// - Assigning clips to center sections (see src/lineup/)

#include "chassis/types.hpp"
#include "chassis/errors.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chassis::ranking {

// ─── Scope ────────────────────────────────────────────────────────────────────

/// What a ranking orders by.
enum class Scope {
    LF,
    RF,
    LR,
    RR,
    Front,
    Rear,
    Overall,
};

[[nodiscard]] const char* to_string(Scope s) noexcept;

/// Parse a scope name (case-insensitive). Returns `nullopt` if unknown.
[[nodiscard]] std::optional<Scope> try_parse_scope(std::string_view name) noexcept;

/// Parse a scope name, throwing `RankingError` if it is unknown.
[[nodiscard]] Scope parse_scope(std::string_view name);

/// The single-corner scope for `c`.
[[nodiscard]] Scope scope_of(Corner c) noexcept;

enum class SortOrder {
    Ascending,
    Descending,
};

// ─── Filters ──────────────────────────────────────────────────────────────────

/// Predicate over damper results. An empty function accepts every row.
using RowFilter = std::function<bool(const DamperResult&)>;

/// Accept rows whose track type is one of `accepted`. Untagged rows are
/// rejected.
[[nodiscard]] RowFilter track_type_filter(std::vector<TrackType> accepted);

// ─── Result types ─────────────────────────────────────────────────────────────

/// The corner lengths of one (clip, center section) assembly.
struct AssemblyLengths {
    std::string                        clip_id;
    std::string                        center_section_id;
    CornerArray<std::optional<double>> length{};
    std::optional<TrackType>           track_type;  ///< Tag of the first row seen
    std::size_t                        first_row;   ///< Smallest source row index
};

/// One position in a ranking.
struct RankedEntry {
    std::size_t              rank;   ///< Competition rank, 1-based
    std::string              clip_id;
    std::string              center_section_id;
    double                   value;  ///< Length (corner scope) or mean length (aggregate)
    std::optional<TrackType> track_type;
    std::size_t              row_index;
};

// ─── RankingEngine ────────────────────────────────────────────────────────────

/// Stateless ranking over `std::span<const DamperResult>`.
class RankingEngine {
public:
    /// Rank `results` by `scope`.
    ///
    /// # Errors
    /// Throws `RankingError` if `scope` is not a valid enumerator.
    [[nodiscard]] static std::vector<RankedEntry>
    rank(std::span<const DamperResult> results,
         Scope scope,
         SortOrder order = SortOrder::Ascending,
         const RowFilter& filter = {});

    /// Rank by a scope given by name (e.g. from a CLI argument or UI control).
    ///
    /// # Errors
    /// Throws `RankingError` carrying `scope_name` if it is not a scope.
    [[nodiscard]] static std::vector<RankedEntry>
    rank(std::span<const DamperResult> results,
         std::string_view scope_name,
         SortOrder order = SortOrder::Ascending,
         const RowFilter& filter = {});

    /// Group results into assemblies, in order of first appearance. If a
    /// corner appears twice for one assembly the first row wins.
    [[nodiscard]] static std::vector<AssemblyLengths>
    assemble(std::span<const DamperResult> results);

    /// Value of `scope` for a set of corner lengths, or `nullopt` if a needed
    /// corner is missing.
    [[nodiscard]] static std::optional<double>
    scope_value(const CornerArray<std::optional<double>>& lengths, Scope scope);

    /// Competition ("min") ranks for values already sorted in ranking order.
    [[nodiscard]] static std::vector<std::size_t>
    competition_ranks(std::span<const double> sorted_values);
};

// ─── Group summaries ──────────────────────────────────────────────────────────

enum class GroupKey {
    CenterSection,
    Clip,
};

/// Mean damper lengths of every row sharing a center section or a clip.
struct GroupSummary {
    std::string                        key;
    CornerArray<std::optional<double>> mean_length{};  ///< `nullopt` if no rows for the corner
    std::optional<double>              front;          ///< mean(mean LF, mean RF)
    std::optional<double>              rear;           ///< mean(mean LR, mean RR)
    std::optional<double>              overall;        ///< mean of the four corner means
    std::size_t                        row_count = 0;
};

/// Summarize `results` by `key`, ordered by `order_by`. Groups with no value
/// for `order_by` sort last; ties keep first-appearance order.
[[nodiscard]] std::vector<GroupSummary>
summarize(std::span<const DamperResult> results,
          GroupKey key,
          Scope order_by = Scope::Overall,
          SortOrder order = SortOrder::Ascending,
          const RowFilter& filter = {});

// ─── Correlation ──────────────────────────────────────────────────────────────

/// A surveyed coordinate a damper length can be compared against. `Lower*`
/// is the LCA point as loaded (the pivot midpoint when pivots are mapped).
enum class Attribute {
    UpperX,
    UpperY,
    UpperZ,
    LowerX,
    LowerY,
    LowerZ,
};

[[nodiscard]] const char* to_string(Attribute a) noexcept;

/// Parse names such as "upper_z" or "lower_x" (case-insensitive).
[[nodiscard]] std::optional<Attribute> parse_attribute(std::string_view name) noexcept;

/// Pearson correlation of paired samples. Pairs where either value is not
/// finite are skipped.
///
/// # Returns
/// `nullopt` if the spans differ in length, fewer than two pairs remain, or
/// either series has zero variance.
[[nodiscard]] std::optional<double>
pearson(std::span<const double> x, std::span<const double> y);

/// Correlation of `corner` damper length against `attribute` of the source
/// row. Results are joined to `table` by `row_index`.
[[nodiscard]] std::optional<double>
correlation(std::span<const DamperResult> results,
            std::span<const Configuration> table,
            Attribute attribute,
            Corner corner,
            const RowFilter& filter = {});

/// Correlation of the `a` and `b` lengths over assemblies that measured both
/// (e.g. LF against RF).
[[nodiscard]] std::optional<double>
corner_correlation(std::span<const DamperResult> results,
                   Corner a,
                   Corner b,
                   const RowFilter& filter = {});

}  // namespace chassis::ranking
