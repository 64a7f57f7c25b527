/// @file src/geometry/lca_normalizer.cpp
/// @brief LcaNormalizer: median LCA z-heights per corner.
///
/// Collects the finite lower-mount z values of a table into one bucket per
/// corner (or a single bucket for MedianScope::Global) and takes the median of
/// each bucket. Buckets below MIN_MEDIAN_SAMPLES produce no median.

#include "chassis/geometry.hpp"
#include "chassis/constants.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace chassis::geometry {

// ─── median ───────────────────────────────────────────────────────────────────

std::optional<double> LcaNormalizer::median(std::vector<double> values) noexcept {
    if (values.empty()) {
        return std::nullopt;
    }
    const std::size_t n   = values.size();
    const std::size_t mid = n / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    const double upper = values[mid];
    if (n % 2 == 1) {
        return upper;
    }
    // Even count: the lower middle is the max of the left partition.
    const double lower = *std::max_element(values.begin(), values.begin() + mid);
    return 0.5 * (lower + upper);
}

// ─── compute ──────────────────────────────────────────────────────────────────

LcaMedians LcaNormalizer::compute(std::span<const Configuration> table,
                                  MedianScope scope) {
    CornerArray<std::vector<double>> buckets;
    std::vector<double> pooled;

    for (const auto& cfg : table) {
        const double z = cfg.lower.z();
        if (!std::isfinite(z)) {
            continue;
        }
        buckets[index(cfg.corner)].push_back(z);
        pooled.push_back(z);
    }

    LcaMedians out;
    out.scope = scope;

    if (scope == MedianScope::Global) {
        if (pooled.size() >= constants::MIN_MEDIAN_SAMPLES) {
            const auto m = median(std::move(pooled));
            out.z.fill(m);
        }
        return out;
    }

    for (Corner c : ALL_CORNERS) {
        auto& bucket = buckets[index(c)];
        if (bucket.size() >= constants::MIN_MEDIAN_SAMPLES) {
            out.z[index(c)] = median(std::move(bucket));
        }
    }
    return out;
}

// ─── effective_z ──────────────────────────────────────────────────────────────

double LcaNormalizer::effective_z(const Configuration& cfg,
                                  const LcaMedians* medians) noexcept {
    if (medians == nullptr) {
        return cfg.lower.z();
    }
    const auto& m = medians->z[index(cfg.corner)];
    return m ? *m : cfg.lower.z();
}

}  // namespace chassis::geometry
