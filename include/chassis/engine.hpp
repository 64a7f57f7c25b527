#pragma once

/// @file include/chassis/engine.hpp
/// @brief Analysis session: one loaded table and the computations over it.
///
/// # Module: Analysis Session
///
/// ## Responsibility
/// Hold one configuration table and run the pipeline over it:
///   Configuration rows → DamperCalculator → {RankingEngine, LineupOptimizer}
///
/// The LCA medians are a pure function of the table. They are computed on
/// first use for each median scope and kept until the table is replaced.
///
/// ## Usage
/// ```cpp
/// auto loaded = DataLoader::load_csv("survey.csv");
/// if (loaded && loaded->ok()) {
///     AnalysisSession session(EngineConfig{.normalization = {.enabled = true}});
///     session.load(std::move(loaded->rows));
///     auto ranking = session.rank(ranking::Scope::Front);
/// }
/// ```
///
/// ## Guarantees
/// - Independent sessions share nothing
/// - Results are identical to calling the stateless modules directly with
///   the same inputs

#include "chassis/types.hpp"
#include "chassis/geometry.hpp"
#include "chassis/lineup.hpp"
#include "chassis/ranking.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chassis::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// Configuration parameters for an analysis session.
struct EngineConfig {
    /// LCA Z-height normalization applied by every calculation.
    geometry::NormalizationOptions normalization{};

    /// If true, emit per-step diagnostics to stderr.
    bool verbose = false;
};

// ─── Lineup inputs ────────────────────────────────────────────────────────────

/// How the session should build a lineup request from its table.
struct LineupOptions {
    lineup::CornerWeights    weights    = lineup::CornerWeights::uniform();
    lineup::Direction        direction  = lineup::Direction::Minimize;
    lineup::TruncationPolicy truncation = lineup::TruncationPolicy::Strict;

    /// Score each clip on each center section individually instead of using
    /// one averaged profile per clip.
    bool pair_lengths = false;
};

struct PreparedLineup {
    lineup::LineupRequest    request;
    std::vector<std::string> incomplete_clips;  ///< Left out: a corner was never measured
};

// ─── AnalysisSession ──────────────────────────────────────────────────────────

class AnalysisSession {
public:
    explicit AnalysisSession(EngineConfig config = EngineConfig{});

    /// Replace the table. Cached medians are dropped.
    void load(std::vector<Configuration> table);

    [[nodiscard]] std::span<const Configuration> table() const noexcept { return table_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    /// Change normalization settings. The medians cache is kept, since it
    /// depends only on the table.
    void set_normalization(const geometry::NormalizationOptions& options) noexcept;

    /// LCA medians of the current table for `scope` (cached).
    [[nodiscard]] const geometry::LcaMedians& medians(geometry::MedianScope scope);

    /// How many times medians were actually computed since construction.
    [[nodiscard]] std::size_t median_computations() const noexcept { return median_computations_; }

    /// Damper lengths for every row, normalized per `config().normalization`.
    [[nodiscard]] geometry::CalculationResult calculate();

    [[nodiscard]] std::vector<ranking::RankedEntry>
    rank(ranking::Scope scope,
         ranking::SortOrder order = ranking::SortOrder::Ascending,
         const ranking::RowFilter& filter = {});

    [[nodiscard]] std::vector<ranking::GroupSummary>
    summarize(ranking::GroupKey key,
              ranking::Scope order_by = ranking::Scope::Overall,
              ranking::SortOrder order = ranking::SortOrder::Ascending,
              const ranking::RowFilter& filter = {});

    /// Pearson correlation of `corner` length against `attribute` of its row.
    [[nodiscard]] std::optional<double> correlate(ranking::Attribute attribute,
                                                  Corner corner,
                                                  const ranking::RowFilter& filter = {});

    /// Pearson correlation of two corner lengths across assemblies.
    [[nodiscard]] std::optional<double> correlate(Corner a, Corner b,
                                                  const ranking::RowFilter& filter = {});

    /// Build a lineup request from the rows `filter` accepts.
    [[nodiscard]] PreparedLineup prepare_lineup(const LineupOptions& options,
                                                const ranking::RowFilter& filter = {});

    /// `prepare_lineup` followed by `LineupOptimizer::optimize`.
    ///
    /// # Errors
    /// Propagates `InfeasibleLineupError` and `std::invalid_argument`.
    [[nodiscard]] lineup::Lineup optimize(const LineupOptions& options,
                                          const ranking::RowFilter& filter = {});

private:
    EngineConfig                                  config_;
    std::vector<Configuration>                    table_;
    std::array<std::optional<geometry::LcaMedians>, 2> medians_cache_;  ///< By MedianScope
    std::size_t                                   median_computations_ = 0;
};

}  // namespace chassis::core
