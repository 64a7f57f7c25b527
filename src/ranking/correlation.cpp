/// @file src/ranking/correlation.cpp
/// @brief Pearson correlation of damper lengths against mount coordinates.

#include "chassis/ranking.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <unordered_map>
#include <vector>

namespace chassis::ranking {

namespace {

constexpr std::array<Attribute, 6> ALL_ATTRIBUTES = {
    Attribute::UpperX, Attribute::UpperY, Attribute::UpperZ,
    Attribute::LowerX, Attribute::LowerY, Attribute::LowerZ,
};

[[nodiscard]] double coordinate(const Configuration& cfg, Attribute a) noexcept {
    switch (a) {
        case Attribute::UpperX: return cfg.upper.x();
        case Attribute::UpperY: return cfg.upper.y();
        case Attribute::UpperZ: return cfg.upper.z();
        case Attribute::LowerX: return cfg.lower.x();
        case Attribute::LowerY: return cfg.lower.y();
        case Attribute::LowerZ: return cfg.lower.z();
    }
    return std::nan("");
}

}  // namespace

// ─── Attribute names ──────────────────────────────────────────────────────────

const char* to_string(Attribute a) noexcept {
    switch (a) {
        case Attribute::UpperX: return "upper_x";
        case Attribute::UpperY: return "upper_y";
        case Attribute::UpperZ: return "upper_z";
        case Attribute::LowerX: return "lower_x";
        case Attribute::LowerY: return "lower_y";
        case Attribute::LowerZ: return "lower_z";
    }
    return "?";
}

std::optional<Attribute> parse_attribute(std::string_view name) noexcept {
    for (Attribute a : ALL_ATTRIBUTES) {
        const std::string_view candidate = to_string(a);
        if (candidate.size() != name.size()) continue;
        const bool same = std::equal(
            name.begin(), name.end(), candidate.begin(), [](char l, char r) {
                return std::tolower(static_cast<unsigned char>(l)) ==
                       std::tolower(static_cast<unsigned char>(r));
            });
        if (same) return a;
    }
    return std::nullopt;
}

// ─── pearson ──────────────────────────────────────────────────────────────────

std::optional<double> pearson(std::span<const double> x, std::span<const double> y) {
    if (x.size() != y.size()) {
        return std::nullopt;
    }

    std::vector<double> xs;
    std::vector<double> ys;
    xs.reserve(x.size());
    ys.reserve(y.size());
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (std::isfinite(x[i]) && std::isfinite(y[i])) {
            xs.push_back(x[i]);
            ys.push_back(y[i]);
        }
    }
    if (xs.size() < 2) {
        return std::nullopt;
    }

    const Eigen::Map<const Eigen::VectorXd> vx(xs.data(), static_cast<Eigen::Index>(xs.size()));
    const Eigen::Map<const Eigen::VectorXd> vy(ys.data(), static_cast<Eigen::Index>(ys.size()));
    // Constant series are detected exactly, before the mean is subtracted.
    if (vx.minCoeff() == vx.maxCoeff() || vy.minCoeff() == vy.maxCoeff()) {
        return std::nullopt;
    }

    const Eigen::VectorXd cx = (vx.array() - vx.mean()).matrix();
    const Eigen::VectorXd cy = (vy.array() - vy.mean()).matrix();
    const double denom = std::sqrt(cx.squaredNorm() * cy.squaredNorm());
    if (!(denom > 0.0)) {
        return std::nullopt;
    }
    return std::clamp(cx.dot(cy) / denom, -1.0, 1.0);
}

// ─── correlation ──────────────────────────────────────────────────────────────

std::optional<double> correlation(std::span<const DamperResult> results,
                                  std::span<const Configuration> table,
                                  Attribute attribute,
                                  Corner corner,
                                  const RowFilter& filter) {
    std::unordered_map<std::size_t, const Configuration*> by_row;
    by_row.reserve(table.size());
    for (const auto& cfg : table) {
        by_row.emplace(cfg.row_index, &cfg);
    }

    std::vector<double> attr;
    std::vector<double> length;
    for (const auto& r : results) {
        if (r.corner != corner) continue;
        if (filter && !filter(r)) continue;
        const auto it = by_row.find(r.row_index);
        if (it == by_row.end()) continue;
        attr.push_back(coordinate(*it->second, attribute));
        length.push_back(r.length);
    }
    return pearson(attr, length);
}

std::optional<double> corner_correlation(std::span<const DamperResult> results,
                                         Corner a,
                                         Corner b,
                                         const RowFilter& filter) {
    std::vector<DamperResult> kept;
    kept.reserve(results.size());
    for (const auto& r : results) {
        if (!filter || filter(r)) kept.push_back(r);
    }

    std::vector<double> xs;
    std::vector<double> ys;
    for (const auto& assembly : RankingEngine::assemble(kept)) {
        const auto& la = assembly.length[index(a)];
        const auto& lb = assembly.length[index(b)];
        if (la && lb) {
            xs.push_back(*la);
            ys.push_back(*lb);
        }
    }
    return pearson(xs, ys);
}

}  // namespace chassis::ranking
