/// @file tests/core/test_types.cpp
/// @brief Unit tests for shared value types and the error taxonomy.

#include <gtest/gtest.h>
#include "chassis/types.hpp"
#include "chassis/errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

using namespace chassis;

// ─── Corner ───────────────────────────────────────────────────────────────────

TEST(Types, CornerNamesRoundTrip) {
    for (Corner c : ALL_CORNERS) {
        const auto parsed = parse_corner(to_string(c));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, c);
    }
}

TEST(Types, ParseCornerIgnoresCaseAndBlanks) {
    EXPECT_EQ(parse_corner(" lf "), Corner::LF);
    EXPECT_EQ(parse_corner("Rr"), Corner::RR);
    EXPECT_FALSE(parse_corner("LX").has_value());
    EXPECT_FALSE(parse_corner("").has_value());
}

TEST(Types, CornerSides) {
    EXPECT_TRUE(is_front(Corner::LF));
    EXPECT_TRUE(is_front(Corner::RF));
    EXPECT_FALSE(is_front(Corner::LR));
    EXPECT_TRUE(is_left(Corner::LR));
    EXPECT_FALSE(is_left(Corner::RR));
    EXPECT_EQ(index(Corner::RR), 3u);
}

// ─── TrackType ────────────────────────────────────────────────────────────────

TEST(Types, TrackTypeParsing) {
    EXPECT_EQ(parse_track_type("INT"), TrackType::INT);
    EXPECT_EQ(parse_track_type("utility"), TrackType::Utility);
    EXPECT_EQ(parse_track_type("BACKUP"), TrackType::Backup);
    EXPECT_FALSE(parse_track_type("oval").has_value());
    EXPECT_STREQ(to_string(TrackType::SSW), "SSW");
}

// ─── MountPoint ───────────────────────────────────────────────────────────────

TEST(Types, MountPointFiniteness) {
    const MountPoint good{{1.0, 2.0, 3.0}, MountRole::Upper};
    const MountPoint bad{{1.0, std::nan(""), 3.0}, MountRole::LowerControlArm};
    EXPECT_TRUE(good.is_finite());
    EXPECT_FALSE(bad.is_finite());
    EXPECT_DOUBLE_EQ(good.z(), 3.0);
}

// ─── Errors ───────────────────────────────────────────────────────────────────

TEST(Errors, GeometryErrorMessage) {
    const GeometryError e{
        .row_index         = 3,
        .clip_id           = "C01",
        .center_section_id = "S02",
        .corner            = Corner::LF,
        .field             = GeometryField::Offset,
        .message           = "offset is missing or non-numeric",
    };
    EXPECT_EQ(e.to_string(), "row 3 (C01/S02/LF): offset is missing or non-numeric");
    EXPECT_STREQ(to_string(GeometryField::UpperMount), "upper mount");
}

TEST(Errors, RankingErrorCarriesScopeName) {
    const RankingError e("Sideways");
    EXPECT_EQ(e.scope_name(), "Sideways");
    EXPECT_NE(std::string(e.what()).find("'Sideways'"), std::string::npos);
    const std::invalid_argument& base = e;
    EXPECT_NE(std::string(base.what()).find("Overall"), std::string::npos);
}

TEST(Errors, InfeasibleLineupErrorCarriesCounts) {
    const InfeasibleLineupError e(2, 5, 3, "5 clips cannot be paired with 3 center sections");
    EXPECT_EQ(e.unmatched_count(), 2u);
    EXPECT_EQ(e.clip_count(), 5u);
    EXPECT_EQ(e.section_count(), 3u);
    EXPECT_STREQ(e.what(), "5 clips cannot be paired with 3 center sections");
}
