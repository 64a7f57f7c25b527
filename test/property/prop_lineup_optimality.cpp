/**
 * @file  prop_lineup_optimality.cpp
 * @brief Property: the optimizer's objective equals the exhaustive optimum.
 *
 * Run with 1,000 random inputs:
 *   RC_PARAMS="max_success=1000" ./prop_lineup_optimality
 *
 * Instances are at most 5 × 5 so the brute force over all permutations
 * stays cheap. Lengths are integers in [20, 40) to produce ties.
 */

#include <rapidcheck.h>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <set>
#include <string>
#include <vector>

#include "chassis/lineup.hpp"

using namespace chassis;
using namespace chassis::lineup;

namespace {

Eigen::MatrixXd random_scores(int n) {
    Eigen::MatrixXd m(n, n);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            m(i, j) = static_cast<double>(*rc::gen::inRange(20, 40));
        }
    }
    return m;
}

LineupRequest pairwise_request(const Eigen::MatrixXd& score, Direction dir) {
    LineupRequest req;
    for (Eigen::Index i = 0; i < score.rows(); ++i) {
        req.clips.push_back(ClipProfile{.clip_id = "C" + std::to_string(i)});
    }
    for (Eigen::Index j = 0; j < score.cols(); ++j) {
        req.center_sections.push_back("S" + std::to_string(j));
    }
    PairLengthMatrix table;
    for (auto& m : table.lengths) m = score;
    req.pair_lengths = table;
    req.direction    = dir;
    return req;
}

double brute_force(const Eigen::MatrixXd& score, Direction dir) {
    std::vector<Eigen::Index> perm(static_cast<std::size_t>(score.rows()));
    std::iota(perm.begin(), perm.end(), Eigen::Index{0});
    double best = dir == Direction::Minimize ? std::numeric_limits<double>::infinity()
                                             : -std::numeric_limits<double>::infinity();
    do {
        double total = 0.0;
        for (std::size_t i = 0; i < perm.size(); ++i) {
            total += score(static_cast<Eigen::Index>(i), perm[i]);
        }
        best = dir == Direction::Minimize ? std::min(best, total) : std::max(best, total);
    } while (std::next_permutation(perm.begin(), perm.end()));
    return best;
}

bool is_bijection(const Lineup& lineup, std::size_t expected_pairs) {
    std::set<std::string> clips;
    std::set<std::string> sections;
    for (const auto& p : lineup.pairs) {
        clips.insert(p.clip_id);
        sections.insert(p.center_section_id);
    }
    return lineup.pairs.size() == expected_pairs &&
           clips.size() == expected_pairs && sections.size() == expected_pairs;
}

}  // namespace

int main() {
    bool ok = true;

    // ── Property 1: per-pair lengths reach the brute-force optimum ───────────
    ok &= rc::check(
        "lineup: pairwise objective == exhaustive optimum",
        []() {
            const int n      = *rc::gen::inRange(1, 6);
            const auto score = random_scores(n);
            const auto dir   = *rc::gen::element(Direction::Minimize, Direction::Maximize);

            const auto lineup = LineupOptimizer::optimize(pairwise_request(score, dir));
            RC_ASSERT(is_bijection(lineup, static_cast<std::size_t>(n)));
            RC_ASSERT(std::abs(lineup.objective - brute_force(score, dir)) < 1e-9);
        }
    );

    // ── Property 2: interchangeable sections reach the brute-force optimum ───
    ok &= rc::check(
        "lineup: interchangeable objective == exhaustive optimum",
        []() {
            const int n   = *rc::gen::inRange(1, 6);
            const auto dir = *rc::gen::element(Direction::Minimize, Direction::Maximize);

            LineupRequest req;
            req.direction = dir;
            Eigen::MatrixXd score(n, n);
            for (int i = 0; i < n; ++i) {
                ClipProfile clip{.clip_id = "C" + std::to_string(i)};
                for (auto& v : clip.lengths) {
                    v = static_cast<double>(*rc::gen::inRange(20, 40));
                }
                score.row(i).setConstant(
                    LineupOptimizer::weighted_score(clip.lengths, req.weights));
                req.clips.push_back(clip);
                req.center_sections.push_back("S" + std::to_string(i));
            }

            const auto lineup = LineupOptimizer::optimize(req);
            RC_ASSERT(is_bijection(lineup, static_cast<std::size_t>(n)));
            RC_ASSERT(std::abs(lineup.objective - brute_force(score, dir)) < 1e-9);
        }
    );

    // ── Property 3: DropExcess always pairs min(clips, sections) ─────────────
    ok &= rc::check(
        "lineup: drop-excess pairs min(n, m) and lists the rest",
        []() {
            const int n = *rc::gen::inRange(0, 6);
            const int m = *rc::gen::inRange(0, 6);

            LineupRequest req;
            req.truncation = TruncationPolicy::DropExcess;
            for (int i = 0; i < n; ++i) {
                const double v = static_cast<double>(*rc::gen::inRange(20, 40));
                req.clips.push_back(ClipProfile{.clip_id = "C" + std::to_string(i),
                                                .lengths = {v, v, v, v}});
            }
            for (int j = 0; j < m; ++j) {
                req.center_sections.push_back("S" + std::to_string(j));
            }

            const auto k      = static_cast<std::size_t>(std::min(n, m));
            const auto lineup = LineupOptimizer::optimize(req);
            RC_ASSERT(is_bijection(lineup, k));
            RC_ASSERT(lineup.dropped_clips.size() == static_cast<std::size_t>(n) - k);
            RC_ASSERT(lineup.dropped_sections.size() == static_cast<std::size_t>(m) - k);
        }
    );

    // ── Property 4: identical requests give identical lineups ────────────────
    ok &= rc::check(
        "lineup: optimize is deterministic",
        []() {
            const int n      = *rc::gen::inRange(1, 6);
            const auto score = random_scores(n);
            const auto req   = pairwise_request(score, Direction::Minimize);

            const auto a = LineupOptimizer::optimize(req);
            const auto b = LineupOptimizer::optimize(req);
            RC_ASSERT(a.pairs.size() == b.pairs.size());
            for (std::size_t i = 0; i < a.pairs.size(); ++i) {
                RC_ASSERT(a.pairs[i].clip_id == b.pairs[i].clip_id);
            }
        }
    );

    return ok ? 0 : 1;
}
