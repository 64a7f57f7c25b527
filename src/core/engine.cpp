/// @file src/core/engine.cpp
/// @brief AnalysisSession: table ownership, median cache and pipeline runs.

#include "chassis/engine.hpp"

#include <fmt/core.h>

#include <string>
#include <utility>

namespace chassis::core {

namespace {

[[nodiscard]] std::size_t slot(geometry::MedianScope scope) noexcept {
    return scope == geometry::MedianScope::PerCorner ? 0 : 1;
}

[[nodiscard]] std::vector<DamperResult>
filtered(std::vector<DamperResult> results, const ranking::RowFilter& filter) {
    if (!filter) {
        return results;
    }
    std::vector<DamperResult> kept;
    kept.reserve(results.size());
    for (auto& r : results) {
        if (filter(r)) kept.push_back(std::move(r));
    }
    return kept;
}

}  // namespace

// ─── AnalysisSession constructor ──────────────────────────────────────────────

AnalysisSession::AnalysisSession(EngineConfig config)
    : config_(std::move(config))
{}

// ─── AnalysisSession::load ────────────────────────────────────────────────────

void AnalysisSession::load(std::vector<Configuration> table) {
    table_ = std::move(table);
    for (auto& cached : medians_cache_) {
        cached.reset();
    }
    if (config_.verbose) {
        fmt::print(stderr, "[chassis] loaded {} configuration rows\n", table_.size());
    }
}

void AnalysisSession::set_normalization(const geometry::NormalizationOptions& options) noexcept {
    config_.normalization = options;
}

// ─── AnalysisSession::medians ─────────────────────────────────────────────────

const geometry::LcaMedians& AnalysisSession::medians(geometry::MedianScope scope) {
    auto& cached = medians_cache_[slot(scope)];
    if (!cached) {
        cached = geometry::LcaNormalizer::compute(table_, scope);
        ++median_computations_;
        if (config_.verbose) {
            for (Corner c : ALL_CORNERS) {
                const auto& z = cached->z[index(c)];
                if (z) {
                    fmt::print(stderr, "[chassis] median LCA z {}: {:.4f}\n", to_string(c), *z);
                } else {
                    fmt::print(stderr, "[chassis] median LCA z {}: too few samples\n",
                               to_string(c));
                }
            }
        }
    }
    return *cached;
}

// ─── AnalysisSession::calculate ───────────────────────────────────────────────

geometry::CalculationResult AnalysisSession::calculate() {
    const geometry::LcaMedians* m = nullptr;
    if (config_.normalization.enabled) {
        m = &medians(config_.normalization.scope);
    }
    auto result = geometry::DamperCalculator::calculate(table_, m);

    if (config_.verbose) {
        fmt::print(stderr, "[chassis] {} damper lengths, {} row errors{}\n",
                   result.results.size(), result.errors.size(),
                   m != nullptr ? " (LCA z normalized)" : "");
        for (const auto& e : result.errors) {
            fmt::print(stderr, "[chassis]   {}\n", e.to_string());
        }
    }
    return result;
}

// ─── AnalysisSession::rank / summarize ────────────────────────────────────────

std::vector<ranking::RankedEntry>
AnalysisSession::rank(ranking::Scope scope,
                      ranking::SortOrder order,
                      const ranking::RowFilter& filter) {
    const auto calc = calculate();
    return ranking::RankingEngine::rank(calc.results, scope, order, filter);
}

std::vector<ranking::GroupSummary>
AnalysisSession::summarize(ranking::GroupKey key,
                           ranking::Scope order_by,
                           ranking::SortOrder order,
                           const ranking::RowFilter& filter) {
    const auto calc = calculate();
    return ranking::summarize(calc.results, key, order_by, order, filter);
}

// ─── AnalysisSession::correlate ───────────────────────────────────────────────

std::optional<double> AnalysisSession::correlate(ranking::Attribute attribute,
                                                 Corner corner,
                                                 const ranking::RowFilter& filter) {
    const auto calc = calculate();
    const auto r = ranking::correlation(calc.results, table_, attribute, corner, filter);
    if (config_.verbose) {
        fmt::print(stderr, "[chassis] correlation {} vs {}: {}\n", to_string(corner),
                   ranking::to_string(attribute),
                   r ? fmt::format("{:.3f}", *r) : std::string("undefined"));
    }
    return r;
}

std::optional<double> AnalysisSession::correlate(Corner a, Corner b,
                                                 const ranking::RowFilter& filter) {
    const auto calc = calculate();
    const auto r = ranking::corner_correlation(calc.results, a, b, filter);
    if (config_.verbose) {
        fmt::print(stderr, "[chassis] correlation {} vs {}: {}\n", to_string(a), to_string(b),
                   r ? fmt::format("{:.3f}", *r) : std::string("undefined"));
    }
    return r;
}

// ─── AnalysisSession::prepare_lineup ──────────────────────────────────────────

PreparedLineup AnalysisSession::prepare_lineup(const LineupOptions& options,
                                               const ranking::RowFilter& filter) {
    const auto rows = filtered(calculate().results, filter);

    PreparedLineup out{
        .request = lineup::LineupRequest{
            .clips           = {},
            .center_sections = lineup::center_section_ids(rows),
            .weights         = options.weights,
            .direction       = options.direction,
            .truncation      = options.truncation,
            .pair_lengths    = std::nullopt,
        },
        .incomplete_clips = {},
    };

    if (options.pair_lengths) {
        const auto ids = lineup::clip_ids(rows);
        for (const auto& id : ids) {
            out.request.clips.push_back(lineup::ClipProfile{.clip_id = id});
        }
        out.request.pair_lengths =
            lineup::build_pair_lengths(rows, ids, out.request.center_sections);
    } else {
        auto profiles         = lineup::build_clip_profiles(rows);
        out.request.clips     = std::move(profiles.profiles);
        out.incomplete_clips  = std::move(profiles.incomplete);
    }

    if (config_.verbose) {
        fmt::print(stderr, "[chassis] lineup request: {} clips, {} center sections, {}{}\n",
                   out.request.clips.size(), out.request.center_sections.size(),
                   lineup::to_string(options.direction),
                   options.pair_lengths ? ", per-pair lengths" : "");
        for (const auto& id : out.incomplete_clips) {
            fmt::print(stderr, "[chassis]   clip {} is incomplete and left out\n", id);
        }
    }
    return out;
}

// ─── AnalysisSession::optimize ────────────────────────────────────────────────

lineup::Lineup AnalysisSession::optimize(const LineupOptions& options,
                                         const ranking::RowFilter& filter) {
    const auto prepared = prepare_lineup(options, filter);
    auto result = lineup::LineupOptimizer::optimize(prepared.request);
    if (config_.verbose) {
        fmt::print(stderr, "[chassis] lineup objective {:.4f} over {} pairs\n",
                   result.objective, result.pairs.size());
    }
    return result;
}

}  // namespace chassis::core
