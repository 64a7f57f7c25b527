/// @file src/lineup/lineup_optimizer.cpp
/// @brief LineupOptimizer: clip ↔ center-section assignment.

#include "chassis/lineup.hpp"
#include "chassis/constants.hpp"

#include "hungarian.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace chassis::lineup {

namespace {

using detail::UNASSIGNED;

/// Absolute difference of two sizes.
[[nodiscard]] std::size_t size_gap(std::size_t a, std::size_t b) noexcept {
    return a > b ? a - b : b - a;
}

/// id → position, rejecting duplicates.
[[nodiscard]] std::map<std::string, std::size_t, std::less<>>
index_ids(const std::vector<std::string>& ids, const char* what) {
    std::map<std::string, std::size_t, std::less<>> out;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (!out.emplace(ids[i], i).second) {
            throw std::invalid_argument(
                fmt::format("duplicate {} id '{}'", what, ids[i]));
        }
    }
    return out;
}

[[nodiscard]] std::vector<std::string> clip_id_list(const LineupRequest& request) {
    std::vector<std::string> ids;
    ids.reserve(request.clips.size());
    for (const auto& c : request.clips) ids.push_back(c.clip_id);
    return ids;
}

/// Reject malformed requests before any solving.
void validate(const LineupRequest& request) {
    const std::size_t n = request.clips.size();
    const std::size_t m = request.center_sections.size();

    (void)index_ids(clip_id_list(request), "clip");
    (void)index_ids(request.center_sections, "center section");

    if (request.pair_lengths) {
        for (Corner c : ALL_CORNERS) {
            const auto& mat = request.pair_lengths->lengths[index(c)];
            if (static_cast<std::size_t>(mat.rows()) != n ||
                static_cast<std::size_t>(mat.cols()) != m) {
                throw std::invalid_argument(fmt::format(
                    "{} pair-length table is {}x{}, request has {} clips and {} sections",
                    to_string(c), mat.rows(), mat.cols(), n, m));
            }
        }
    } else {
        for (const auto& clip : request.clips) {
            for (double len : clip.lengths) {
                if (!std::isfinite(len)) {
                    throw std::invalid_argument(fmt::format(
                        "clip '{}' has a non-finite corner length", clip.clip_id));
                }
            }
        }
    }

    if (request.truncation == TruncationPolicy::Strict && n != m) {
        throw InfeasibleLineupError(
            size_gap(n, m), n, m,
            fmt::format("{} clips cannot be paired one-to-one with {} center sections",
                        n, m));
    }
}

/// Corner lengths of clip i on section j.
[[nodiscard]] CornerArray<double>
pair_lengths(const LineupRequest& request, std::size_t i, std::size_t j) noexcept {
    if (request.pair_lengths) {
        return request.pair_lengths->at(i, j);
    }
    return request.clips[i].lengths;
}

[[nodiscard]] bool pair_allowed(const LineupRequest& request,
                                std::size_t i, std::size_t j) noexcept {
    return !request.pair_lengths || request.pair_lengths->measured(i, j);
}

[[nodiscard]] PairScore score_pair(const LineupRequest& request,
                                   std::size_t i, std::size_t j) {
    PairScore ps;
    ps.clip_id           = request.clips[i].clip_id;
    ps.center_section_id = request.center_sections[j];
    ps.lengths           = pair_lengths(request, i, j);
    for (Corner c : ALL_CORNERS) {
        ps.contribution[index(c)] = request.weights[c] * ps.lengths[index(c)];
        ps.score += ps.contribution[index(c)];
    }
    return ps;
}

/// Assemble a Lineup from a clip → section mapping (UNASSIGNED = dropped).
[[nodiscard]] Lineup assemble_lineup(const LineupRequest& request,
                                     const std::vector<std::size_t>& clip_to_section) {
    const std::size_t m = request.center_sections.size();
    std::vector<std::size_t> section_to_clip(m, UNASSIGNED);
    for (std::size_t i = 0; i < clip_to_section.size(); ++i) {
        if (clip_to_section[i] != UNASSIGNED) {
            section_to_clip[clip_to_section[i]] = i;
        }
    }

    Lineup out;
    out.direction         = request.direction;
    out.used_pair_lengths = request.pair_lengths.has_value();

    for (std::size_t j = 0; j < m; ++j) {
        if (section_to_clip[j] == UNASSIGNED) {
            out.dropped_sections.push_back(request.center_sections[j]);
            continue;
        }
        auto ps = score_pair(request, section_to_clip[j], j);
        out.objective += ps.score;
        out.pairs.push_back(std::move(ps));
    }
    for (std::size_t i = 0; i < clip_to_section.size(); ++i) {
        if (clip_to_section[i] == UNASSIGNED) {
            out.dropped_clips.push_back(request.clips[i].clip_id);
        }
    }
    return out;
}

// ─── Interchangeable sections ─────────────────────────────────────────────────

[[nodiscard]] Lineup solve_interchangeable(const LineupRequest& request) {
    const std::size_t n = request.clips.size();
    const std::size_t m = request.center_sections.size();

    std::vector<double> scores(n);
    for (std::size_t i = 0; i < n; ++i) {
        scores[i] = LineupOptimizer::weighted_score(request.clips[i].lengths, request.weights);
    }

    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    if (request.direction == Direction::Minimize) {
        std::stable_sort(order.begin(), order.end(),
                         [&](std::size_t a, std::size_t b) { return scores[a] < scores[b]; });
    } else {
        std::stable_sort(order.begin(), order.end(),
                         [&](std::size_t a, std::size_t b) { return scores[a] > scores[b]; });
    }

    // Best clips go to sections in section order; the tail is dropped.
    std::vector<std::size_t> clip_to_section(n, UNASSIGNED);
    const std::size_t k = std::min(n, m);
    for (std::size_t s = 0; s < k; ++s) {
        clip_to_section[order[s]] = s;
    }
    return assemble_lineup(request, clip_to_section);
}

// ─── Per-pair lengths ─────────────────────────────────────────────────────────

[[nodiscard]] Lineup solve_pairwise(const LineupRequest& request) {
    const std::size_t n = request.clips.size();
    const std::size_t m = request.center_sections.size();
    const std::size_t k = std::min(n, m);
    if (k == 0) {
        return assemble_lineup(request, std::vector<std::size_t>(n, UNASSIGNED));
    }

    const double sign = request.direction == Direction::Minimize ? 1.0 : -1.0;

    Eigen::MatrixXd cost(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(m));
    double max_abs = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = 0; j < m; ++j) {
            const auto r = static_cast<Eigen::Index>(i);
            const auto c = static_cast<Eigen::Index>(j);
            if (!pair_allowed(request, i, j)) {
                cost(r, c) = std::numeric_limits<double>::quiet_NaN();
                continue;
            }
            const double s = sign * LineupOptimizer::weighted_score(
                                        pair_lengths(request, i, j), request.weights);
            cost(r, c) = s;
            max_abs    = std::max(max_abs, std::abs(s));
        }
    }

    // A forbidden cell costs more than any k allowed cells can differ by, so
    // the solver only uses one when no assignment avoids it.
    const double penalty = 1.0 + 2.0 * static_cast<double>(k) * max_abs;
    cost = cost.unaryExpr([penalty](double v) { return std::isnan(v) ? penalty : v; });

    const auto clip_to_section = detail::solve_assignment(cost);

    std::size_t forbidden = 0;
    for (std::size_t i = 0; i < n; ++i) {
        if (clip_to_section[i] != UNASSIGNED && !pair_allowed(request, i, clip_to_section[i])) {
            ++forbidden;
        }
    }
    if (forbidden > 0) {
        throw InfeasibleLineupError(
            forbidden, n, m,
            fmt::format("no lineup of {} clips on {} center sections avoids unmeasured "
                        "pairs ({} would remain)",
                        n, m, forbidden));
    }
    return assemble_lineup(request, clip_to_section);
}

}  // namespace

// ─── Direction ────────────────────────────────────────────────────────────────

const char* to_string(Direction d) noexcept {
    switch (d) {
        case Direction::Minimize: return "minimize";
        case Direction::Maximize: return "maximize";
    }
    return "?";
}

// ─── CornerWeights ────────────────────────────────────────────────────────────

std::optional<CornerWeights> CornerWeights::make(const CornerArray<double>& weights) noexcept {
    bool any_positive = false;
    for (double w : weights) {
        if (!std::isfinite(w) || w < 0.0) {
            return std::nullopt;
        }
        any_positive = any_positive || w > 0.0;
    }
    if (!any_positive) {
        return std::nullopt;
    }
    return CornerWeights(weights);
}

CornerWeights CornerWeights::uniform() noexcept {
    return CornerWeights({constants::UNIFORM_CORNER_WEIGHT, constants::UNIFORM_CORNER_WEIGHT,
                          constants::UNIFORM_CORNER_WEIGHT, constants::UNIFORM_CORNER_WEIGHT});
}

// ─── PairLengthMatrix ─────────────────────────────────────────────────────────

PairLengthMatrix PairLengthMatrix::unmeasured(std::size_t clips, std::size_t sections) {
    PairLengthMatrix out;
    for (auto& mat : out.lengths) {
        mat = Eigen::MatrixXd::Constant(static_cast<Eigen::Index>(clips),
                                        static_cast<Eigen::Index>(sections),
                                        std::numeric_limits<double>::quiet_NaN());
    }
    return out;
}

CornerArray<double> PairLengthMatrix::at(std::size_t i, std::size_t j) const noexcept {
    CornerArray<double> out{};
    for (Corner c : ALL_CORNERS) {
        out[index(c)] = lengths[index(c)](static_cast<Eigen::Index>(i),
                                          static_cast<Eigen::Index>(j));
    }
    return out;
}

bool PairLengthMatrix::measured(std::size_t i, std::size_t j) const noexcept {
    const auto l = at(i, j);
    return std::all_of(l.begin(), l.end(), [](double v) { return std::isfinite(v); });
}

// ─── Lineup lookups ───────────────────────────────────────────────────────────

const PairScore* Lineup::find_section(std::string_view section_id) const noexcept {
    for (const auto& p : pairs) {
        if (p.center_section_id == section_id) return &p;
    }
    return nullptr;
}

const PairScore* Lineup::find_clip(std::string_view clip_id) const noexcept {
    for (const auto& p : pairs) {
        if (p.clip_id == clip_id) return &p;
    }
    return nullptr;
}

// ─── LineupOptimizer ──────────────────────────────────────────────────────────

double LineupOptimizer::weighted_score(const CornerArray<double>& lengths,
                                       const CornerWeights& weights) noexcept {
    double s = 0.0;
    for (Corner c : ALL_CORNERS) {
        s += weights[c] * lengths[index(c)];
    }
    return s;
}

Lineup LineupOptimizer::optimize(const LineupRequest& request) {
    validate(request);
    return request.pair_lengths ? solve_pairwise(request) : solve_interchangeable(request);
}

Lineup LineupOptimizer::evaluate(const LineupRequest& request, const Assignment& assignment) {
    validate(request);

    const std::size_t n = request.clips.size();
    const std::size_t m = request.center_sections.size();
    const auto clip_index    = index_ids(clip_id_list(request), "clip");
    const auto section_index = index_ids(request.center_sections, "center section");

    std::vector<std::size_t> clip_to_section(n, UNASSIGNED);
    std::vector<bool>        section_taken(m, false);
    std::size_t forbidden = 0;

    for (const auto& [clip, section] : assignment) {
        const auto ci = clip_index.find(clip);
        if (ci == clip_index.end()) {
            throw std::invalid_argument(fmt::format("unknown clip '{}' in lineup", clip));
        }
        const auto si = section_index.find(section);
        if (si == section_index.end()) {
            throw std::invalid_argument(
                fmt::format("unknown center section '{}' in lineup", section));
        }
        if (clip_to_section[ci->second] != UNASSIGNED) {
            throw std::invalid_argument(fmt::format("clip '{}' is assigned twice", clip));
        }
        if (section_taken[si->second]) {
            throw std::invalid_argument(
                fmt::format("center section '{}' is assigned twice", section));
        }
        clip_to_section[ci->second] = si->second;
        section_taken[si->second]   = true;
        if (!pair_allowed(request, ci->second, si->second)) {
            ++forbidden;
        }
    }

    if (assignment.size() != std::min(n, m)) {
        throw std::invalid_argument(fmt::format(
            "lineup pairs {} clips, expected {}", assignment.size(), std::min(n, m)));
    }
    if (forbidden > 0) {
        throw InfeasibleLineupError(
            forbidden, n, m,
            fmt::format("lineup uses {} unmeasured clip/section pairs", forbidden));
    }
    return assemble_lineup(request, clip_to_section);
}

std::vector<SwapCandidate>
LineupOptimizer::swap_candidates(const LineupRequest& request,
                                 const Lineup& lineup,
                                 std::string_view section_id) {
    const PairScore* current = lineup.find_section(section_id);
    if (current == nullptr) {
        throw std::invalid_argument(
            fmt::format("no clip is assigned to center section '{}'", section_id));
    }

    const auto& sections = request.center_sections;
    const auto sit = std::find(sections.begin(), sections.end(), section_id);
    if (sit == sections.end()) {
        throw std::invalid_argument(
            fmt::format("center section '{}' is not part of the request", section_id));
    }
    const auto j = static_cast<std::size_t>(sit - sections.begin());

    std::vector<SwapCandidate> out;
    for (std::size_t i = 0; i < request.clips.size(); ++i) {
        const auto& clip = request.clips[i];
        if (clip.clip_id == current->clip_id || !pair_allowed(request, i, j)) {
            continue;
        }

        SwapCandidate cand;
        cand.clip_id = clip.clip_id;
        if (const PairScore* at = lineup.find_clip(clip.clip_id)) {
            cand.assigned_section = at->center_section_id;
        }
        cand.lengths = pair_lengths(request, i, j);
        for (Corner c : ALL_CORNERS) {
            cand.delta[index(c)] = cand.lengths[index(c)] - current->lengths[index(c)];
        }
        cand.score_delta = weighted_score(cand.delta, request.weights);
        out.push_back(std::move(cand));
    }

    const bool minimize = request.direction == Direction::Minimize;
    std::stable_sort(out.begin(), out.end(),
                     [minimize](const SwapCandidate& a, const SwapCandidate& b) {
                         return minimize ? a.score_delta < b.score_delta
                                         : a.score_delta > b.score_delta;
                     });
    return out;
}

}  // namespace chassis::lineup
