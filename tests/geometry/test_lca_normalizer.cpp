/// @file tests/geometry/test_lca_normalizer.cpp
/// @brief Unit tests for LcaNormalizer (median LCA z-heights).

#include <gtest/gtest.h>
#include "chassis/geometry.hpp"

#include <limits>
#include <string>
#include <vector>

using namespace chassis;
using namespace chassis::geometry;

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

Configuration with_lower_z(Corner corner, double z, std::size_t row) {
    return Configuration{
        .clip_id           = "C" + std::to_string(row),
        .center_section_id = "S1",
        .corner            = corner,
        .upper             = MountPoint{{0.0, 0.0, 20.0}, MountRole::Upper},
        .lower             = MountPoint{{0.0, 0.0, z}, MountRole::LowerControlArm},
        .offset            = 1.0,
        .track_type        = std::nullopt,
        .row_index         = row,
    };
}

}  // namespace

// ─── median ───────────────────────────────────────────────────────────────────

TEST(LcaNormalizer, MedianOddCount) {
    EXPECT_DOUBLE_EQ(*LcaNormalizer::median({3.0, 1.0, 2.0}), 2.0);
}

TEST(LcaNormalizer, MedianEvenCountAveragesMiddlePair) {
    EXPECT_DOUBLE_EQ(*LcaNormalizer::median({4.0, 1.0, 3.0, 2.0}), 2.5);
}

TEST(LcaNormalizer, MedianSingleValue) {
    EXPECT_DOUBLE_EQ(*LcaNormalizer::median({7.5}), 7.5);
}

TEST(LcaNormalizer, MedianEmptyIsNullopt) {
    EXPECT_FALSE(LcaNormalizer::median({}).has_value());
}

// ─── compute ──────────────────────────────────────────────────────────────────

TEST(LcaNormalizer, PerCornerMedians) {
    const std::vector<Configuration> table = {
        with_lower_z(Corner::LF, 1.0, 0),
        with_lower_z(Corner::LF, 3.0, 1),
        with_lower_z(Corner::LF, 2.0, 2),
        with_lower_z(Corner::LR, 8.0, 3),
        with_lower_z(Corner::LR, 6.0, 4),
        with_lower_z(Corner::RF, 10.0, 5),
    };
    const auto m = LcaNormalizer::compute(table);

    EXPECT_EQ(m.scope, MedianScope::PerCorner);
    ASSERT_TRUE(m.z[index(Corner::LF)].has_value());
    EXPECT_DOUBLE_EQ(*m.z[index(Corner::LF)], 2.0);
    ASSERT_TRUE(m.z[index(Corner::LR)].has_value());
    EXPECT_DOUBLE_EQ(*m.z[index(Corner::LR)], 7.0);
    // A single sample is not enough.
    EXPECT_FALSE(m.z[index(Corner::RF)].has_value());
    EXPECT_FALSE(m.z[index(Corner::RR)].has_value());
}

TEST(LcaNormalizer, GlobalMedianPoolsEveryCorner) {
    const std::vector<Configuration> table = {
        with_lower_z(Corner::LF, 1.0, 0),
        with_lower_z(Corner::RF, 2.0, 1),
        with_lower_z(Corner::LR, 3.0, 2),
        with_lower_z(Corner::RR, 10.0, 3),
    };
    const auto m = LcaNormalizer::compute(table, MedianScope::Global);

    EXPECT_EQ(m.scope, MedianScope::Global);
    for (Corner c : ALL_CORNERS) {
        ASSERT_TRUE(m.z[index(c)].has_value()) << to_string(c);
        EXPECT_DOUBLE_EQ(*m.z[index(c)], 2.5);
    }
}

TEST(LcaNormalizer, NonFiniteZIsIgnored) {
    const std::vector<Configuration> table = {
        with_lower_z(Corner::LF, 1.0, 0),
        with_lower_z(Corner::LF, NaN, 1),
        with_lower_z(Corner::LF, 5.0, 2),
    };
    const auto m = LcaNormalizer::compute(table);
    ASSERT_TRUE(m.z[index(Corner::LF)].has_value());
    EXPECT_DOUBLE_EQ(*m.z[index(Corner::LF)], 3.0);
}

TEST(LcaNormalizer, ComputeDoesNotModifyTable) {
    const std::vector<Configuration> table = {
        with_lower_z(Corner::LF, 1.0, 0),
        with_lower_z(Corner::LF, 5.0, 1),
    };
    (void)LcaNormalizer::compute(table);
    EXPECT_DOUBLE_EQ(table[0].lower.z(), 1.0);
    EXPECT_DOUBLE_EQ(table[1].lower.z(), 5.0);
}

// ─── effective_z ──────────────────────────────────────────────────────────────

TEST(LcaNormalizer, EffectiveZWithoutMediansIsRaw) {
    const auto cfg = with_lower_z(Corner::RR, 4.25, 0);
    EXPECT_DOUBLE_EQ(LcaNormalizer::effective_z(cfg, nullptr), 4.25);
}

TEST(LcaNormalizer, EffectiveZFallsBackWhenCornerHasNoMedian) {
    LcaMedians m;
    m.z[index(Corner::LF)] = 9.0;
    EXPECT_DOUBLE_EQ(LcaNormalizer::effective_z(with_lower_z(Corner::LF, 1.0, 0), &m), 9.0);
    EXPECT_DOUBLE_EQ(LcaNormalizer::effective_z(with_lower_z(Corner::RF, 1.0, 1), &m), 1.0);
}
