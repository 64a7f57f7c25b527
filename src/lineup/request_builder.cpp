/// @file src/lineup/request_builder.cpp
/// @brief Turn calculated damper rows into lineup optimizer inputs.

#include "chassis/lineup.hpp"
#include "chassis/ranking.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <utility>

namespace chassis::lineup {

namespace {

template <typename KeyFn>
std::vector<std::string> distinct(std::span<const DamperResult> results, KeyFn key) {
    std::vector<std::string> out;
    std::set<std::string>    seen;
    for (const auto& r : results) {
        const std::string& k = key(r);
        if (seen.insert(k).second) {
            out.push_back(k);
        }
    }
    return out;
}

[[nodiscard]] std::map<std::string, std::size_t, std::less<>>
positions(std::span<const std::string> ids) {
    std::map<std::string, std::size_t, std::less<>> out;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        out.emplace(ids[i], i);
    }
    return out;
}

}  // namespace

// ─── Id lists ─────────────────────────────────────────────────────────────────

std::vector<std::string> clip_ids(std::span<const DamperResult> results) {
    return distinct(results, [](const DamperResult& r) -> const std::string& {
        return r.clip_id;
    });
}

std::vector<std::string> center_section_ids(std::span<const DamperResult> results) {
    return distinct(results, [](const DamperResult& r) -> const std::string& {
        return r.center_section_id;
    });
}

// ─── build_pair_lengths ───────────────────────────────────────────────────────

PairLengthMatrix build_pair_lengths(std::span<const DamperResult> results,
                                    std::span<const std::string> clips,
                                    std::span<const std::string> sections) {
    auto out = PairLengthMatrix::unmeasured(clips.size(), sections.size());
    const auto clip_pos    = positions(clips);
    const auto section_pos = positions(sections);

    for (const auto& r : results) {
        const auto ci = clip_pos.find(r.clip_id);
        const auto si = section_pos.find(r.center_section_id);
        if (ci == clip_pos.end() || si == section_pos.end()) {
            continue;
        }
        double& cell = out.lengths[index(r.corner)](static_cast<Eigen::Index>(ci->second),
                                                    static_cast<Eigen::Index>(si->second));
        if (std::isnan(cell)) {
            cell = r.length;
        }
    }
    return out;
}

// ─── build_clip_profiles ──────────────────────────────────────────────────────

ClipProfileSet build_clip_profiles(std::span<const DamperResult> results) {
    struct Sums {
        CornerArray<double>      sum{};
        CornerArray<std::size_t> count{};
    };

    const auto ids = clip_ids(results);
    const auto pos = positions(ids);
    std::vector<Sums> sums(ids.size());

    // One value per (clip, section, corner) before averaging across sections.
    for (const auto& unit : ranking::RankingEngine::assemble(results)) {
        auto& s = sums[pos.find(unit.clip_id)->second];
        for (Corner c : ALL_CORNERS) {
            if (const auto& v = unit.length[index(c)]) {
                s.sum[index(c)]   += *v;
                s.count[index(c)] += 1;
            }
        }
    }

    ClipProfileSet out;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        const auto& s = sums[i];
        const bool complete = std::all_of(s.count.begin(), s.count.end(),
                                          [](std::size_t n) { return n > 0; });
        if (!complete) {
            out.incomplete.push_back(ids[i]);
            continue;
        }
        ClipProfile profile{.clip_id = ids[i]};
        for (Corner c : ALL_CORNERS) {
            profile.lengths[index(c)] = s.sum[index(c)] / static_cast<double>(s.count[index(c)]);
        }
        out.profiles.push_back(std::move(profile));
    }
    return out;
}

}  // namespace chassis::lineup
