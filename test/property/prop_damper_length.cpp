/**
 * @file  prop_damper_length.cpp
 * @brief Properties of the damper length formula.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_damper_length
 *
 * Geometry:
 *   y_damper = y_lca ∓ |offset|   (− on the left corners, + on the right)
 *   length   = ‖ upper − (x_lca, y_damper, z_lca) ‖₂
 *
 * Coordinates are drawn from (−500, 500) mm by squashing arbitrary doubles
 * through tanh, which keeps every input finite.
 */

#include <rapidcheck.h>
#include <cmath>
#include <vector>

#include "chassis/geometry.hpp"

using namespace chassis;
using namespace chassis::geometry;

namespace {

constexpr double SPAN = 500.0;

double coord(double raw) { return std::tanh(raw / 100.0) * SPAN; }

Eigen::Vector3d point(double x, double y, double z) {
    return Eigen::Vector3d(coord(x), coord(y), coord(z));
}

Configuration row(Corner corner, const Eigen::Vector3d& upper,
                  const Eigen::Vector3d& lower, double offset, std::size_t idx) {
    return Configuration{
        .clip_id           = "C",
        .center_section_id = "S",
        .corner            = corner,
        .upper             = MountPoint{upper, MountRole::Upper},
        .lower             = MountPoint{lower, MountRole::LowerControlArm},
        .offset            = offset,
        .track_type        = std::nullopt,
        .row_index         = idx,
    };
}

}  // namespace

int main() {
    bool ok = true;

    // ── Property 1: length is finite, non-negative and matches the formula ──
    ok &= rc::check(
        "damper_length: finite, >= 0 and equal to the displaced-mount distance",
        [](double ux, double uy, double uz, double lx, double ly, double lz, double raw_off) {
            RC_PRE(std::isfinite(ux) && std::isfinite(uy) && std::isfinite(uz));
            RC_PRE(std::isfinite(lx) && std::isfinite(ly) && std::isfinite(lz));
            RC_PRE(std::isfinite(raw_off));

            const auto upper  = point(ux, uy, uz);
            const auto lca    = point(lx, ly, lz);
            const double off  = coord(raw_off);
            const auto corner = *rc::gen::element(Corner::LF, Corner::RF, Corner::LR, Corner::RR);

            const auto len = DamperCalculator::damper_length(upper, lca, off, corner);
            RC_ASSERT(len.has_value());
            RC_ASSERT(std::isfinite(*len));
            RC_ASSERT(*len >= 0.0);

            const double dy = is_left(corner) ? -std::abs(off) : std::abs(off);
            const double ex = upper.x() - lca.x();
            const double ey = upper.y() - (lca.y() + dy);
            const double ez = upper.z() - lca.z();
            const double expected = std::sqrt(ex * ex + ey * ey + ez * ez);
            RC_ASSERT(std::abs(*len - expected) <= 1e-9 * (1.0 + expected));
        }
    );

    // ── Property 2: mirroring across y = 0 swaps left and right corners ──────
    ok &= rc::check(
        "damper_length: LF(y) == RF(-y) and LR(y) == RR(-y)",
        [](double ux, double uy, double uz, double lx, double ly, double lz, double raw_off) {
            RC_PRE(std::isfinite(ux) && std::isfinite(uy) && std::isfinite(uz));
            RC_PRE(std::isfinite(lx) && std::isfinite(ly) && std::isfinite(lz));
            RC_PRE(std::isfinite(raw_off));

            const auto upper = point(ux, uy, uz);
            const auto lca   = point(lx, ly, lz);
            const double off = coord(raw_off);
            const Eigen::Vector3d upper_m(upper.x(), -upper.y(), upper.z());
            const Eigen::Vector3d lca_m(lca.x(), -lca.y(), lca.z());

            const auto lf = DamperCalculator::damper_length(upper, lca, off, Corner::LF);
            const auto rf = DamperCalculator::damper_length(upper_m, lca_m, off, Corner::RF);
            const auto lr = DamperCalculator::damper_length(upper, lca, off, Corner::LR);
            const auto rr = DamperCalculator::damper_length(upper_m, lca_m, off, Corner::RR);
            RC_ASSERT(lf.has_value() && rf.has_value() && lr.has_value() && rr.has_value());
            RC_ASSERT(std::abs(*lf - *rf) <= 1e-9 * (1.0 + *lf));
            RC_ASSERT(std::abs(*lr - *rr) <= 1e-9 * (1.0 + *lr));
        }
    );

    // ── Property 3: the sign of the offset does not matter ───────────────────
    ok &= rc::check(
        "damper_length: offset and -offset give the same length",
        [](double ux, double uz, double ly, double raw_off) {
            RC_PRE(std::isfinite(ux) && std::isfinite(uz) && std::isfinite(ly));
            RC_PRE(std::isfinite(raw_off));

            const auto upper = point(ux, 0.0, uz);
            const auto lca   = point(0.0, ly, 0.0);
            const double off = coord(raw_off);
            for (Corner c : ALL_CORNERS) {
                const auto a = DamperCalculator::damper_length(upper, lca, off, c);
                const auto b = DamperCalculator::damper_length(upper, lca, -off, c);
                RC_ASSERT(a.has_value() && b.has_value());
                RC_ASSERT(*a == *b);
            }
        }
    );

    // ── Property 4: normalization is a no-op when every z already agrees ────
    ok &= rc::check(
        "normalization: identical lower z on every row leaves lengths unchanged",
        [](double lz, double u1, double u2, double u3) {
            RC_PRE(std::isfinite(lz) && std::isfinite(u1) && std::isfinite(u2));
            RC_PRE(std::isfinite(u3));

            const double z = coord(lz);
            std::vector<Configuration> table;
            std::size_t idx = 0;
            for (Corner c : ALL_CORNERS) {
                for (double u : {u1, u2, u3}) {
                    table.push_back(row(c, point(u, u, 2.0 * u), Eigen::Vector3d(0.0, 0.0, z),
                                        12.0, idx++));
                }
            }

            const auto raw  = DamperCalculator::calculate(table);
            const auto norm = DamperCalculator::calculate(table, NormalizationOptions{.enabled = true});
            RC_ASSERT(raw.results.size() == table.size());
            RC_ASSERT(norm.results.size() == table.size());
            for (std::size_t i = 0; i < table.size(); ++i) {
                RC_ASSERT(raw.results[i].length == norm.results[i].length);
            }
        }
    );

    return ok ? 0 : 1;
}
