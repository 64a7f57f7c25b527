/// @file tests/lineup/test_request_builder.cpp
/// @brief Unit tests for building lineup inputs from damper results.

#include <gtest/gtest.h>
#include "chassis/lineup.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace chassis;
using namespace chassis::lineup;

namespace {

DamperResult result(std::string clip, std::string section, Corner corner,
                    double length, std::size_t row) {
    return DamperResult{
        .clip_id           = std::move(clip),
        .center_section_id = std::move(section),
        .corner            = corner,
        .length            = length,
        .lower_z_used      = 0.0,
        .track_type        = std::nullopt,
        .row_index         = row,
    };
}

void add_assembly(std::vector<DamperResult>& rows, const char* clip, const char* section,
                  double lf, double rf, double lr, double rr) {
    const std::size_t r = rows.size();
    rows.push_back(result(clip, section, Corner::LF, lf, r));
    rows.push_back(result(clip, section, Corner::RF, rf, r + 1));
    rows.push_back(result(clip, section, Corner::LR, lr, r + 2));
    rows.push_back(result(clip, section, Corner::RR, rr, r + 3));
}

}  // namespace

TEST(RequestBuilder, IdsInFirstAppearanceOrder) {
    std::vector<DamperResult> rows;
    add_assembly(rows, "B", "S2", 1, 1, 1, 1);
    add_assembly(rows, "A", "S2", 1, 1, 1, 1);
    add_assembly(rows, "B", "S1", 1, 1, 1, 1);

    const std::vector<std::string> clips    = {"B", "A"};
    const std::vector<std::string> sections = {"S2", "S1"};
    EXPECT_EQ(clip_ids(rows), clips);
    EXPECT_EQ(center_section_ids(rows), sections);
}

TEST(RequestBuilder, PairLengthsFillMeasuredCellsOnly) {
    std::vector<DamperResult> rows;
    add_assembly(rows, "A", "S1", 10, 11, 12, 13);
    add_assembly(rows, "B", "S2", 20, 21, 22, 23);

    const auto clips    = clip_ids(rows);
    const auto sections = center_section_ids(rows);
    const auto table    = build_pair_lengths(rows, clips, sections);

    EXPECT_EQ(table.clip_count(), 2u);
    EXPECT_EQ(table.section_count(), 2u);
    EXPECT_TRUE(table.measured(0, 0));
    EXPECT_TRUE(table.measured(1, 1));
    EXPECT_FALSE(table.measured(0, 1));
    EXPECT_FALSE(table.measured(1, 0));
    EXPECT_DOUBLE_EQ(table.at(0, 0)[index(Corner::LR)], 12.0);
    EXPECT_DOUBLE_EQ(table.at(1, 1)[index(Corner::RR)], 23.0);
    EXPECT_TRUE(std::isnan(table.at(0, 1)[index(Corner::LF)]));
}

TEST(RequestBuilder, PairLengthsKeepFirstRowOnDuplicate) {
    std::vector<DamperResult> rows;
    add_assembly(rows, "A", "S1", 10, 11, 12, 13);
    rows.push_back(result("A", "S1", Corner::LF, 99.0, rows.size()));

    const std::vector<std::string> clips    = {"A"};
    const std::vector<std::string> sections = {"S1"};
    const auto table = build_pair_lengths(rows, clips, sections);
    EXPECT_DOUBLE_EQ(table.at(0, 0)[index(Corner::LF)], 10.0);
}

TEST(RequestBuilder, PairLengthsIgnoreIdsOutsideTheLists) {
    std::vector<DamperResult> rows;
    add_assembly(rows, "A", "S1", 10, 11, 12, 13);
    add_assembly(rows, "Z", "S1", 1, 1, 1, 1);

    const std::vector<std::string> clips    = {"A"};
    const std::vector<std::string> sections = {"S1"};
    const auto table = build_pair_lengths(rows, clips, sections);
    EXPECT_EQ(table.clip_count(), 1u);
    EXPECT_DOUBLE_EQ(table.at(0, 0)[index(Corner::RF)], 11.0);
}

TEST(RequestBuilder, ClipProfilesAverageAcrossSections) {
    std::vector<DamperResult> rows;
    add_assembly(rows, "A", "S1", 10, 20, 30, 40);
    add_assembly(rows, "A", "S2", 12, 22, 32, 42);
    add_assembly(rows, "B", "S1", 5, 5, 5, 5);

    const auto set = build_clip_profiles(rows);
    ASSERT_EQ(set.profiles.size(), 2u);
    EXPECT_TRUE(set.incomplete.empty());
    EXPECT_EQ(set.profiles[0].clip_id, "A");
    EXPECT_DOUBLE_EQ(set.profiles[0].lengths[index(Corner::LF)], 11.0);
    EXPECT_DOUBLE_EQ(set.profiles[0].lengths[index(Corner::RR)], 41.0);
    EXPECT_EQ(set.profiles[1].clip_id, "B");
    EXPECT_DOUBLE_EQ(set.profiles[1].lengths[index(Corner::LR)], 5.0);
}

TEST(RequestBuilder, ClipMissingACornerIsIncomplete) {
    std::vector<DamperResult> rows;
    add_assembly(rows, "A", "S1", 10, 20, 30, 40);
    rows.push_back(result("B", "S1", Corner::LF, 1.0, rows.size()));
    rows.push_back(result("B", "S1", Corner::RF, 1.0, rows.size()));

    const auto set = build_clip_profiles(rows);
    ASSERT_EQ(set.profiles.size(), 1u);
    EXPECT_EQ(set.profiles[0].clip_id, "A");
    ASSERT_EQ(set.incomplete.size(), 1u);
    EXPECT_EQ(set.incomplete[0], "B");
}

TEST(RequestBuilder, ProfilesFeedTheOptimizer) {
    std::vector<DamperResult> rows;
    add_assembly(rows, "A", "S1", 10, 10, 10, 10);
    add_assembly(rows, "B", "S2", 7.5, 7.5, 7.5, 7.5);

    LineupRequest req;
    req.clips           = build_clip_profiles(rows).profiles;
    req.center_sections = center_section_ids(rows);
    const auto lineup   = LineupOptimizer::optimize(req);

    EXPECT_DOUBLE_EQ(lineup.objective, 17.5);
    EXPECT_EQ(lineup.find_section("S1")->clip_id, "B");
}
