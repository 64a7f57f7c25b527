#pragma once

/// @file include/chassis/data_writer.hpp
/// @brief CSV export of damper lengths and rankings.
///
/// # Module: DataWriter
///
/// ## Responsibility
/// Format computed results as CSV text with a header line, one record per
/// result. Ids are written as loaded; an id containing a comma, quote or
/// line break is quoted with doubled quotes. Untagged rows have an empty
/// `track_type` cell.
///
/// ## NOT Responsible For
/// - Writing files (callers stream the text where they need it)

#include "chassis/types.hpp"
#include "chassis/ranking.hpp"

#include <span>
#include <string>
#include <string_view>

namespace chassis::core {

class DataWriter {
public:
    /// `row,clip,center_section,corner,length,lower_z_used,track_type`
    [[nodiscard]] static std::string
    results_csv(std::span<const DamperResult> results);

    /// `rank,clip,center_section,<scope>,track_type`
    [[nodiscard]] static std::string
    ranking_csv(std::span<const ranking::RankedEntry> entries, ranking::Scope scope);

    /// Quote `cell` if it contains a separator, quote or line break.
    [[nodiscard]] static std::string escape(std::string_view cell);
};

}  // namespace chassis::core
