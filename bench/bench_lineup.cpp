/**
 * @file  bench/bench_lineup.cpp
 * @brief Google Benchmark suite for damper calculation and lineup solving.
 *
 * Benchmarks
 * ----------
 *   BM_DamperCalculate         raw lengths over a synthetic survey
 *   BM_DamperCalculateNormalized same with per-corner LCA medians
 *   BM_LineupInterchangeable   sort-based path
 *   BM_LineupPairwise          Kuhn–Munkres path, n × n
 *   BM_AssignmentSolver        bare solver on a random cost matrix
 *
 * Build (CMake):
 *   cmake -DCHASSIS_BENCH=ON ..
 *   cmake --build build --target bench_lineup
 *   ./build/bench_lineup --benchmark_format=json
 *
 * Throughput units: items/second (rows or clips processed).
 */

#include "benchmark/benchmark.h"

// Solver detail header (internal, needs src/ on include path)
#include "lineup/hungarian.hpp"

#include "chassis/geometry.hpp"
#include "chassis/lineup.hpp"

#include <cstddef>
#include <random>
#include <string>
#include <vector>

using namespace chassis;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// `clips` × `sections` full assemblies with jittered mount coordinates.
static std::vector<Configuration> make_survey(std::size_t clips, std::size_t sections) {
    std::mt19937 rng(42);
    std::normal_distribution<double> jitter(0.0, 1.5);
    std::vector<Configuration> table;
    table.reserve(clips * sections * CORNER_COUNT);
    for (std::size_t c = 0; c < clips; ++c) {
        for (std::size_t s = 0; s < sections; ++s) {
            for (Corner corner : ALL_CORNERS) {
                const double side = is_left(corner) ? 1.0 : -1.0;
                table.push_back(Configuration{
                    .clip_id           = "C" + std::to_string(c),
                    .center_section_id = "S" + std::to_string(s),
                    .corner            = corner,
                    .upper             = MountPoint{{jitter(rng), side * 250.0, 420.0 + jitter(rng)},
                                                    MountRole::Upper},
                    .lower             = MountPoint{{jitter(rng), side * 300.0, 90.0 + jitter(rng)},
                                                    MountRole::LowerControlArm},
                    .offset            = 12.0,
                    .track_type        = TrackType::INT,
                    .row_index         = table.size(),
                });
            }
        }
    }
    return table;
}

static Eigen::MatrixXd make_scores(std::size_t n) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> dist(300.0, 360.0);
    Eigen::MatrixXd m(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(n));
    for (Eigen::Index i = 0; i < m.rows(); ++i) {
        for (Eigen::Index j = 0; j < m.cols(); ++j) m(i, j) = dist(rng);
    }
    return m;
}

static lineup::LineupRequest make_request(std::size_t n, bool pairwise) {
    const auto scores = make_scores(n);
    lineup::LineupRequest req;
    for (std::size_t i = 0; i < n; ++i) {
        const double v = scores(static_cast<Eigen::Index>(i), 0);
        req.clips.push_back(lineup::ClipProfile{.clip_id = "C" + std::to_string(i),
                                                .lengths = {v, v, v, v}});
        req.center_sections.push_back("S" + std::to_string(i));
    }
    if (pairwise) {
        lineup::PairLengthMatrix table;
        for (auto& m : table.lengths) m = scores;
        req.pair_lengths = table;
    }
    return req;
}

// ── Geometry ───────────────────────────────────────────────────────────────────

static void BM_DamperCalculate(benchmark::State& state) {
    const auto table = make_survey(static_cast<std::size_t>(state.range(0)), 8);
    for (auto _ : state) {
        auto result = geometry::DamperCalculator::calculate(table);
        benchmark::DoNotOptimize(result.results.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(table.size()));
}
BENCHMARK(BM_DamperCalculate)->RangeMultiplier(4)->Range(4, 1024)->Unit(benchmark::kMicrosecond);

static void BM_DamperCalculateNormalized(benchmark::State& state) {
    const auto table = make_survey(static_cast<std::size_t>(state.range(0)), 8);
    const geometry::NormalizationOptions opts{.enabled = true};
    for (auto _ : state) {
        auto result = geometry::DamperCalculator::calculate(table, opts);
        benchmark::DoNotOptimize(result.results.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(table.size()));
}
BENCHMARK(BM_DamperCalculateNormalized)->RangeMultiplier(4)->Range(4, 1024)->Unit(benchmark::kMicrosecond);

// ── Lineup ─────────────────────────────────────────────────────────────────────

static void BM_LineupInterchangeable(benchmark::State& state) {
    const auto req = make_request(static_cast<std::size_t>(state.range(0)), false);
    for (auto _ : state) {
        auto result = lineup::LineupOptimizer::optimize(req);
        benchmark::DoNotOptimize(result.objective);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_LineupInterchangeable)->RangeMultiplier(4)->Range(4, 4096)->Unit(benchmark::kMicrosecond);

static void BM_LineupPairwise(benchmark::State& state) {
    const auto req = make_request(static_cast<std::size_t>(state.range(0)), true);
    for (auto _ : state) {
        auto result = lineup::LineupOptimizer::optimize(req);
        benchmark::DoNotOptimize(result.objective);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_LineupPairwise)->RangeMultiplier(2)->Range(4, 256)->Unit(benchmark::kMicrosecond)
    ->Complexity(benchmark::oNCubed);

static void BM_AssignmentSolver(benchmark::State& state) {
    const auto cost = make_scores(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto a = lineup::detail::solve_assignment(cost);
        benchmark::DoNotOptimize(a.data());
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_AssignmentSolver)->RangeMultiplier(2)->Range(4, 256)->Unit(benchmark::kMicrosecond)
    ->Complexity(benchmark::oNCubed);

BENCHMARK_MAIN();
