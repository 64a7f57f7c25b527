/// @file tests/ranking/test_summary.cpp
/// @brief Unit tests for per-center-section and per-clip summaries.

#include <gtest/gtest.h>
#include "chassis/ranking.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace chassis;
using namespace chassis::ranking;

namespace {

DamperResult result(std::string clip, std::string section, Corner corner,
                    double length, std::size_t row,
                    std::optional<TrackType> track = std::nullopt) {
    return DamperResult{
        .clip_id           = std::move(clip),
        .center_section_id = std::move(section),
        .corner            = corner,
        .length            = length,
        .lower_z_used      = 0.0,
        .track_type        = track,
        .row_index         = row,
    };
}

/// Two clips measured on two sections, plus a section with only a front end.
std::vector<DamperResult> grid() {
    std::vector<DamperResult> rows;
    std::size_t row = 0;
    auto add = [&](const char* clip, const char* section, double base) {
        rows.push_back(result(clip, section, Corner::LF, base + 0.0, row++, TrackType::INT));
        rows.push_back(result(clip, section, Corner::RF, base + 1.0, row++, TrackType::INT));
        rows.push_back(result(clip, section, Corner::LR, base + 2.0, row++, TrackType::INT));
        rows.push_back(result(clip, section, Corner::RR, base + 3.0, row++, TrackType::INT));
    };
    add("A", "S1", 10.0);
    add("B", "S1", 20.0);
    add("A", "S2", 4.0);
    add("B", "S2", 6.0);
    rows.push_back(result("A", "S3", Corner::LF, 1.0, row++, TrackType::ST));
    rows.push_back(result("A", "S3", Corner::RF, 1.0, row++, TrackType::ST));
    return rows;
}

}  // namespace

TEST(Summary, CenterSectionMeansPerCorner) {
    const auto rows   = grid();
    const auto groups = summarize(rows, GroupKey::CenterSection);

    ASSERT_EQ(groups.size(), 3u);
    // S2 overall = mean(5, 6, 7, 8) = 6.5; S1 overall = mean(15, 16, 17, 18) = 16.5.
    EXPECT_EQ(groups[0].key, "S2");
    EXPECT_DOUBLE_EQ(*groups[0].mean_length[index(Corner::LF)], 5.0);
    EXPECT_DOUBLE_EQ(*groups[0].overall, 6.5);
    EXPECT_DOUBLE_EQ(*groups[0].front, 5.5);
    EXPECT_DOUBLE_EQ(*groups[0].rear, 7.5);
    EXPECT_EQ(groups[0].row_count, 8u);
    EXPECT_EQ(groups[1].key, "S1");
    EXPECT_DOUBLE_EQ(*groups[1].overall, 16.5);
}

TEST(Summary, GroupWithoutOrderingValueSortsLast) {
    const auto rows   = grid();
    const auto groups = summarize(rows, GroupKey::CenterSection);

    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[2].key, "S3");
    EXPECT_FALSE(groups[2].overall.has_value());
    EXPECT_FALSE(groups[2].rear.has_value());
    EXPECT_DOUBLE_EQ(*groups[2].front, 1.0);
    EXPECT_EQ(groups[2].row_count, 2u);
}

TEST(Summary, OrderByFrontDescending) {
    const auto rows   = grid();
    const auto groups = summarize(rows, GroupKey::CenterSection, Scope::Front,
                                  SortOrder::Descending);

    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0].key, "S1");
    EXPECT_EQ(groups[1].key, "S2");
    EXPECT_EQ(groups[2].key, "S3");
}

TEST(Summary, ClipMeansAcrossSections) {
    const auto rows   = grid();
    const auto groups = summarize(rows, GroupKey::Clip, Scope::LR);

    ASSERT_EQ(groups.size(), 2u);
    // A: LR on S1 = 12, S2 = 6 -> 9. B: 22 and 8 -> 15.
    EXPECT_EQ(groups[0].key, "A");
    EXPECT_DOUBLE_EQ(*groups[0].mean_length[index(Corner::LR)], 9.0);
    EXPECT_EQ(groups[1].key, "B");
    EXPECT_DOUBLE_EQ(*groups[1].mean_length[index(Corner::LR)], 15.0);
    // A's LF includes the S3 row: mean(10, 4, 1) = 5.
    EXPECT_DOUBLE_EQ(*groups[0].mean_length[index(Corner::LF)], 5.0);
}

TEST(Summary, FilterAppliesBeforeGrouping) {
    const auto rows   = grid();
    const auto groups = summarize(rows, GroupKey::CenterSection, Scope::Overall,
                                  SortOrder::Ascending, track_type_filter({TrackType::ST}));
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].key, "S3");
}

TEST(Summary, EmptyInputGivesNoGroups) {
    EXPECT_TRUE(summarize(std::vector<DamperResult>{}, GroupKey::Clip).empty());
}
