/// @file src/ranking/ranking_engine.cpp
/// @brief RankingEngine: corner and aggregate damper-length rankings.
///
/// All ordering uses std::stable_sort over rows already in table order, which
/// is what keeps tied entries in their original sequence.

#include "chassis/ranking.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <utility>

namespace chassis::ranking {

namespace {

static constexpr Scope ALL_SCOPES[] = {
    Scope::LF, Scope::RF, Scope::LR, Scope::RR,
    Scope::Front, Scope::Rear, Scope::Overall,
};

[[nodiscard]] bool is_corner_scope(Scope s) noexcept {
    return s == Scope::LF || s == Scope::RF || s == Scope::LR || s == Scope::RR;
}

[[nodiscard]] Corner corner_of(Scope s) noexcept {
    switch (s) {
        case Scope::RF: return Corner::RF;
        case Scope::LR: return Corner::LR;
        case Scope::RR: return Corner::RR;
        default:        return Corner::LF;
    }
}

[[nodiscard]] bool is_valid(Scope s) noexcept {
    return std::find(std::begin(ALL_SCOPES), std::end(ALL_SCOPES), s) !=
           std::end(ALL_SCOPES);
}

/// Mean of the listed corners, `nullopt` if any is missing.
[[nodiscard]] std::optional<double>
mean_of(const CornerArray<std::optional<double>>& lengths,
        std::initializer_list<Corner> corners) noexcept {
    double sum = 0.0;
    for (Corner c : corners) {
        const auto& v = lengths[index(c)];
        if (!v) return std::nullopt;
        sum += *v;
    }
    return sum / static_cast<double>(corners.size());
}

/// Sort `entries` by value in `order`, keeping ties in place, then fill in
/// competition ranks.
void order_and_rank(std::vector<RankedEntry>& entries, SortOrder order) {
    if (order == SortOrder::Ascending) {
        std::stable_sort(entries.begin(), entries.end(),
                         [](const RankedEntry& a, const RankedEntry& b) {
                             return a.value < b.value;
                         });
    } else {
        std::stable_sort(entries.begin(), entries.end(),
                         [](const RankedEntry& a, const RankedEntry& b) {
                             return a.value > b.value;
                         });
    }

    std::vector<double> values;
    values.reserve(entries.size());
    for (const auto& e : entries) values.push_back(e.value);

    const auto ranks = RankingEngine::competition_ranks(values);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        entries[i].rank = ranks[i];
    }
}

/// Copy of `results` without the rows `filter` rejects.
[[nodiscard]] std::vector<DamperResult>
apply_filter(std::span<const DamperResult> results, const RowFilter& filter) {
    std::vector<DamperResult> kept;
    kept.reserve(results.size());
    for (const auto& r : results) {
        if (!filter || filter(r)) kept.push_back(r);
    }
    return kept;
}

}  // namespace

// ─── Scope names ──────────────────────────────────────────────────────────────

const char* to_string(Scope s) noexcept {
    switch (s) {
        case Scope::LF:      return "LF";
        case Scope::RF:      return "RF";
        case Scope::LR:      return "LR";
        case Scope::RR:      return "RR";
        case Scope::Front:   return "Front";
        case Scope::Rear:    return "Rear";
        case Scope::Overall: return "Overall";
    }
    return "?";
}

std::optional<Scope> try_parse_scope(std::string_view name) noexcept {
    for (Scope s : ALL_SCOPES) {
        const std::string_view candidate = to_string(s);
        if (candidate.size() != name.size()) continue;
        const bool same = std::equal(
            name.begin(), name.end(), candidate.begin(), [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) ==
                       std::tolower(static_cast<unsigned char>(b));
            });
        if (same) return s;
    }
    return std::nullopt;
}

Scope parse_scope(std::string_view name) {
    if (auto s = try_parse_scope(name)) {
        return *s;
    }
    throw RankingError(std::string(name));
}

Scope scope_of(Corner c) noexcept {
    switch (c) {
        case Corner::LF: return Scope::LF;
        case Corner::RF: return Scope::RF;
        case Corner::LR: return Scope::LR;
        case Corner::RR: return Scope::RR;
    }
    return Scope::LF;
}

// ─── Filters ──────────────────────────────────────────────────────────────────

RowFilter track_type_filter(std::vector<TrackType> accepted) {
    return [accepted = std::move(accepted)](const DamperResult& r) {
        return r.track_type &&
               std::find(accepted.begin(), accepted.end(), *r.track_type) != accepted.end();
    };
}

// ─── RankingEngine::scope_value ───────────────────────────────────────────────

std::optional<double>
RankingEngine::scope_value(const CornerArray<std::optional<double>>& lengths,
                           Scope scope) {
    switch (scope) {
        case Scope::LF:      return lengths[index(Corner::LF)];
        case Scope::RF:      return lengths[index(Corner::RF)];
        case Scope::LR:      return lengths[index(Corner::LR)];
        case Scope::RR:      return lengths[index(Corner::RR)];
        case Scope::Front:   return mean_of(lengths, {Corner::LF, Corner::RF});
        case Scope::Rear:    return mean_of(lengths, {Corner::LR, Corner::RR});
        case Scope::Overall: return mean_of(lengths, {Corner::LF, Corner::RF,
                                                      Corner::LR, Corner::RR});
    }
    throw RankingError(fmt::format("{}", static_cast<int>(scope)));
}

// ─── RankingEngine::competition_ranks ─────────────────────────────────────────

std::vector<std::size_t>
RankingEngine::competition_ranks(std::span<const double> sorted_values) {
    std::vector<std::size_t> ranks(sorted_values.size());
    for (std::size_t i = 0; i < sorted_values.size(); ++i) {
        if (i > 0 && sorted_values[i] == sorted_values[i - 1]) {
            ranks[i] = ranks[i - 1];
        } else {
            ranks[i] = i + 1;
        }
    }
    return ranks;
}

// ─── RankingEngine::assemble ──────────────────────────────────────────────────

std::vector<AssemblyLengths>
RankingEngine::assemble(std::span<const DamperResult> results) {
    std::vector<AssemblyLengths> units;
    std::map<std::pair<std::string, std::string>, std::size_t> slot;

    for (const auto& r : results) {
        auto key = std::make_pair(r.clip_id, r.center_section_id);
        auto it  = slot.find(key);
        if (it == slot.end()) {
            it = slot.emplace(std::move(key), units.size()).first;
            units.push_back(AssemblyLengths{
                .clip_id           = r.clip_id,
                .center_section_id = r.center_section_id,
                .length            = {},
                .track_type        = r.track_type,
                .first_row         = r.row_index,
            });
        }

        auto& unit = units[it->second];
        auto& cell = unit.length[index(r.corner)];
        if (!cell) {
            cell = r.length;
        }
        unit.first_row = std::min(unit.first_row, r.row_index);
    }
    return units;
}

// ─── RankingEngine::rank ──────────────────────────────────────────────────────

std::vector<RankedEntry>
RankingEngine::rank(std::span<const DamperResult> results,
                    Scope scope,
                    SortOrder order,
                    const RowFilter& filter) {
    if (!is_valid(scope)) {
        throw RankingError(fmt::format("{}", static_cast<int>(scope)));
    }

    const auto rows = apply_filter(results, filter);
    std::vector<RankedEntry> entries;

    if (is_corner_scope(scope)) {
        const Corner wanted = corner_of(scope);
        for (const auto& r : rows) {
            if (r.corner != wanted) continue;
            entries.push_back(RankedEntry{
                .rank              = 0,
                .clip_id           = r.clip_id,
                .center_section_id = r.center_section_id,
                .value             = r.length,
                .track_type        = r.track_type,
                .row_index         = r.row_index,
            });
        }
    } else {
        for (const auto& unit : assemble(rows)) {
            const auto v = scope_value(unit.length, scope);
            if (!v) continue;
            entries.push_back(RankedEntry{
                .rank              = 0,
                .clip_id           = unit.clip_id,
                .center_section_id = unit.center_section_id,
                .value             = *v,
                .track_type        = unit.track_type,
                .row_index         = unit.first_row,
            });
        }
    }

    order_and_rank(entries, order);
    return entries;
}

std::vector<RankedEntry>
RankingEngine::rank(std::span<const DamperResult> results,
                    std::string_view scope_name,
                    SortOrder order,
                    const RowFilter& filter) {
    return rank(results, parse_scope(scope_name), order, filter);
}

}  // namespace chassis::ranking
