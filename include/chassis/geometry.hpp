#pragma once

/// @file include/chassis/geometry.hpp
/// @brief Damper Length Calculator and LCA Z-height normalizer.
///
/// # Module: Damper Geometry
///
/// ## Responsibility
/// Turn raw mount coordinates into one damper length per configuration row.
///
/// ## Formula
/// The lower damper mount sits outboard of the lower-control-arm point by the
/// row's offset, along Y:
///
///     left  corners (LF, LR):  y_damper = y_lca − |offset|
///     right corners (RF, RR):  y_damper = y_lca + |offset|
///
///     length = ‖ upper − (x_lca, y_damper, z_lca) ‖₂
///
/// ## LCA Z-height Normalization
/// Optional. z_lca is replaced by the median lower-mount z of every row that
/// shares the corner (or of every row, with `MedianScope::Global`) before the
/// distance is taken. Raw z scatter between rows is survey noise; removing it
/// makes lengths comparable across configurations. A corner with fewer than
/// `MIN_MEDIAN_SAMPLES` finite z values keeps its raw z.
///
/// ## Guarantees
/// - Pure: outputs depend only on the arguments; the input table is never
///   modified
/// - One bad row yields one `GeometryError` and does not affect other rows
/// - Every returned length is finite and ≥ 0

#include "chassis/types.hpp"
#include "chassis/errors.hpp"

#include <Eigen/Dense>

#include <optional>
#include <span>
#include <vector>

namespace chassis::geometry {

// ─── Normalization options ────────────────────────────────────────────────────

/// Which rows pool into one median.
enum class MedianScope {
    PerCorner,  ///< One median per corner
    Global,     ///< One median over the lower z of all corners
};

struct NormalizationOptions {
    bool        enabled = false;
    MedianScope scope   = MedianScope::PerCorner;
};

/// The medians derived from one table. `z[c]` is `nullopt` when corner `c`
/// had too few finite samples, in which case normalization leaves it alone.
struct LcaMedians {
    CornerArray<std::optional<double>> z{};
    MedianScope scope = MedianScope::PerCorner;
};

// ─── LcaNormalizer ────────────────────────────────────────────────────────────

/// Median computation for LCA Z-height normalization. Stateless.
class LcaNormalizer {
public:
    /// Compute the lower-mount z medians of `table`.
    ///
    /// Rows whose lower z is non-finite do not contribute.
    [[nodiscard]] static LcaMedians
    compute(std::span<const Configuration> table,
            MedianScope scope = MedianScope::PerCorner);

    /// Median of `values`: the middle element, or the mean of the two middle
    /// elements for an even count. `nullopt` on empty input.
    [[nodiscard]] static std::optional<double>
    median(std::vector<double> values) noexcept;

    /// The z that enters the distance formula for `cfg`.
    [[nodiscard]] static double
    effective_z(const Configuration& cfg, const LcaMedians* medians) noexcept;
};

// ─── CalculationResult ────────────────────────────────────────────────────────

/// Partial-success result of a table calculation.
struct CalculationResult {
    std::vector<DamperResult>  results;  ///< One per good row, in table order
    std::vector<GeometryError> errors;   ///< One per bad row, in table order
    std::optional<LcaMedians>  medians;  ///< Set when normalization was on

    [[nodiscard]] bool ok() const noexcept { return errors.empty(); }
};

// ─── DamperCalculator ─────────────────────────────────────────────────────────

class DamperCalculator {
public:
    /// Lower damper mount position: the LCA point displaced outboard along Y.
    [[nodiscard]] static Eigen::Vector3d
    damper_mount(const Eigen::Vector3d& lca, double offset, Corner corner) noexcept;

    /// Damper length for one corner.
    ///
    /// # Returns
    /// The distance, or `nullopt` if any coordinate or the offset is
    /// non-finite.
    [[nodiscard]] static std::optional<double>
    damper_length(const Eigen::Vector3d& upper,
                  const Eigen::Vector3d& lca,
                  double offset,
                  Corner corner) noexcept;

    /// Validate a row before computing it.
    ///
    /// # Returns
    /// `nullopt` if the row is usable, otherwise the error describing the
    /// first unusable input (upper mount, then lower mount, then offset).
    [[nodiscard]] static std::optional<GeometryError>
    check_row(const Configuration& cfg);

    /// Compute every row of `table`.
    ///
    /// When `options.enabled` is set the medians are derived from `table`
    /// itself.
    [[nodiscard]] static CalculationResult
    calculate(std::span<const Configuration> table,
              const NormalizationOptions& options = NormalizationOptions{});

    /// Compute every row of `table` using precomputed medians (pass `nullptr`
    /// to disable normalization). `medians` must come from the same table.
    [[nodiscard]] static CalculationResult
    calculate(std::span<const Configuration> table, const LcaMedians* medians);
};

/// Midpoint of the LCA front and rear pivots, used as the lower-control-arm
/// point when a survey measures both pivots.
[[nodiscard]] Eigen::Vector3d
lca_midpoint(const Eigen::Vector3d& front, const Eigen::Vector3d& rear) noexcept;

}  // namespace chassis::geometry
