/// @file src/geometry/damper_calculator.cpp
/// @brief DamperCalculator: damper length per configuration row.

#include "chassis/geometry.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace chassis::geometry {

// ─── damper_mount ─────────────────────────────────────────────────────────────

Eigen::Vector3d DamperCalculator::damper_mount(const Eigen::Vector3d& lca,
                                               double offset,
                                               Corner corner) noexcept {
    // Outboard is −Y on the left side of the car, +Y on the right.
    const double outboard = is_left(corner) ? -std::abs(offset) : std::abs(offset);
    return Eigen::Vector3d(lca.x(), lca.y() + outboard, lca.z());
}

// ─── damper_length ────────────────────────────────────────────────────────────

std::optional<double> DamperCalculator::damper_length(const Eigen::Vector3d& upper,
                                                      const Eigen::Vector3d& lca,
                                                      double offset,
                                                      Corner corner) noexcept {
    if (!upper.allFinite() || !lca.allFinite() || !std::isfinite(offset)) {
        return std::nullopt;
    }
    const double len = (upper - damper_mount(lca, offset, corner)).norm();
    if (!std::isfinite(len)) {
        // Overflow on extreme coordinates.
        return std::nullopt;
    }
    return len;
}

// ─── check_row ────────────────────────────────────────────────────────────────

std::optional<GeometryError> DamperCalculator::check_row(const Configuration& cfg) {
    auto make = [&cfg](GeometryField field, std::string message) {
        return GeometryError{
            .row_index         = cfg.row_index,
            .clip_id           = cfg.clip_id,
            .center_section_id = cfg.center_section_id,
            .corner            = cfg.corner,
            .field             = field,
            .message           = std::move(message),
        };
    };

    if (!cfg.upper.is_finite()) {
        return make(GeometryField::UpperMount,
                    "upper mount has a missing or non-numeric coordinate");
    }
    if (!cfg.lower.is_finite()) {
        return make(GeometryField::LowerMount,
                    "lower mount has a missing or non-numeric coordinate");
    }
    if (!std::isfinite(cfg.offset)) {
        return make(GeometryField::Offset, "offset is missing or non-numeric");
    }
    return std::nullopt;
}

// ─── calculate ────────────────────────────────────────────────────────────────

CalculationResult DamperCalculator::calculate(std::span<const Configuration> table,
                                              const NormalizationOptions& options) {
    if (!options.enabled) {
        return calculate(table, nullptr);
    }
    const LcaMedians medians = LcaNormalizer::compute(table, options.scope);
    return calculate(table, &medians);
}

CalculationResult DamperCalculator::calculate(std::span<const Configuration> table,
                                              const LcaMedians* medians) {
    CalculationResult out;
    out.results.reserve(table.size());
    if (medians != nullptr) {
        out.medians = *medians;
    }

    for (const auto& cfg : table) {
        if (auto err = check_row(cfg)) {
            out.errors.push_back(std::move(*err));
            continue;
        }

        const double z = LcaNormalizer::effective_z(cfg, medians);
        const Eigen::Vector3d lca(cfg.lower.x(), cfg.lower.y(), z);

        const auto len = damper_length(cfg.upper.position, lca, cfg.offset, cfg.corner);
        if (!len) {
            out.errors.push_back(GeometryError{
                .row_index         = cfg.row_index,
                .clip_id           = cfg.clip_id,
                .center_section_id = cfg.center_section_id,
                .corner            = cfg.corner,
                .field             = GeometryField::LowerMount,
                .message           = "damper length is not finite",
            });
            continue;
        }

        out.results.push_back(DamperResult{
            .clip_id           = cfg.clip_id,
            .center_section_id = cfg.center_section_id,
            .corner            = cfg.corner,
            .length            = *len,
            .lower_z_used      = z,
            .track_type        = cfg.track_type,
            .row_index         = cfg.row_index,
        });
    }
    return out;
}

// ─── lca_midpoint ─────────────────────────────────────────────────────────────

Eigen::Vector3d lca_midpoint(const Eigen::Vector3d& front,
                             const Eigen::Vector3d& rear) noexcept {
    return 0.5 * (front + rear);
}

}  // namespace chassis::geometry
