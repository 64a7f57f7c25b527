/// @file src/ranking/summary.cpp
/// @brief Per-center-section and per-clip mean damper lengths.

#include "chassis/ranking.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace chassis::ranking {

namespace {

/// Running sums for one group.
struct Accumulator {
    std::string              key;
    CornerArray<double>      sum{};
    CornerArray<std::size_t> count{};
    std::size_t              rows = 0;
};

[[nodiscard]] std::optional<double>
pair_mean(const std::optional<double>& a, const std::optional<double>& b) noexcept {
    if (!a || !b) return std::nullopt;
    return 0.5 * (*a + *b);
}

}  // namespace

std::vector<GroupSummary> summarize(std::span<const DamperResult> results,
                                    GroupKey key,
                                    Scope order_by,
                                    SortOrder order,
                                    const RowFilter& filter) {
    std::vector<Accumulator> groups;
    std::map<std::string, std::size_t> slot;

    for (const auto& r : results) {
        if (filter && !filter(r)) continue;

        const std::string& k =
            key == GroupKey::CenterSection ? r.center_section_id : r.clip_id;
        auto it = slot.find(k);
        if (it == slot.end()) {
            it = slot.emplace(k, groups.size()).first;
            groups.push_back(Accumulator{.key = k});
        }
        auto& g = groups[it->second];
        g.sum[index(r.corner)]   += r.length;
        g.count[index(r.corner)] += 1;
        g.rows                   += 1;
    }

    std::vector<GroupSummary> out;
    out.reserve(groups.size());
    for (const auto& g : groups) {
        GroupSummary s;
        s.key       = g.key;
        s.row_count = g.rows;
        for (Corner c : ALL_CORNERS) {
            const std::size_t i = index(c);
            if (g.count[i] > 0) {
                s.mean_length[i] = g.sum[i] / static_cast<double>(g.count[i]);
            }
        }
        s.front   = pair_mean(s.mean_length[index(Corner::LF)], s.mean_length[index(Corner::RF)]);
        s.rear    = pair_mean(s.mean_length[index(Corner::LR)], s.mean_length[index(Corner::RR)]);
        s.overall = RankingEngine::scope_value(s.mean_length, Scope::Overall);
        out.push_back(std::move(s));
    }

    // Groups without a value for the ordering scope go last.
    std::stable_sort(out.begin(), out.end(),
                     [order_by, order](const GroupSummary& a, const GroupSummary& b) {
                         const auto va = RankingEngine::scope_value(a.mean_length, order_by);
                         const auto vb = RankingEngine::scope_value(b.mean_length, order_by);
                         if (!va || !vb) return va.has_value() && !vb.has_value();
                         return order == SortOrder::Ascending ? *va < *vb : *va > *vb;
                     });
    return out;
}

}  // namespace chassis::ranking
