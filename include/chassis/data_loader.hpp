#pragma once

/// @file include/chassis/data_loader.hpp
/// @brief CSV loader for long-format suspension survey tables.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV text into `Configuration` rows, one row per (clip, center
/// section, corner). Column names come from a `ColumnMapping`, so a survey
/// export with its own headers can be read without editing the file.
///
/// ## Expected CSV Format
/// ```
/// clip,center_section,corner,upper_x,upper_y,upper_z,lower_x,lower_y,lower_z,offset,track_type
/// C01,S01,LF,10.0,20.0,30.0,10.5,5.0,8.0,12.1,INT
/// ```
/// The first non-blank, non-comment line is the header. Blank lines and
/// lines whose first non-blank character is `#` are skipped. A leading UTF-8
/// byte-order mark is ignored.
///
/// ## Row handling
/// - Empty clip / center-section ids or an unknown corner: row rejected
///   and counted
/// - Non-numeric or empty coordinate: loaded as NaN (the calculator then
///   reports a `GeometryError` for that row)
/// - No offset column: the corner's default offset is used
/// - No track-type column, empty cell or unknown tag: untagged
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when the file cannot be opened
/// - Does not modify any file or external state

#include "chassis/types.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace chassis::core {

// ─── ColumnMapping ────────────────────────────────────────────────────────────

/// Header names of each input column.
struct ColumnMapping {
    using Xyz = std::array<std::string, 3>;

    std::string clip           = "clip";
    std::string center_section = "center_section";
    std::string corner         = "corner";
    Xyz         upper          = {"upper_x", "upper_y", "upper_z"};
    Xyz         lower          = {"lower_x", "lower_y", "lower_z"};

    /// When both are set the lower point is the midpoint of the LCA front and
    /// rear pivots and `lower` is ignored.
    std::optional<Xyz> lca_front;
    std::optional<Xyz> lca_rear;

    /// Optional columns; `nullopt` (or absent from the header) means defaults.
    std::optional<std::string> offset     = "offset";
    std::optional<std::string> track_type = "track_type";

    /// Default mapping with `lca_front_{x,y,z}` / `lca_rear_{x,y,z}` pivots.
    [[nodiscard]] static ColumnMapping with_lca_pivots();
};

// ─── LoadResult ───────────────────────────────────────────────────────────────

struct LoadResult {
    std::vector<Configuration> rows;             ///< Accepted rows; row_index = position here
    std::size_t                rejected_rows = 0;
    std::vector<std::string>   missing_columns;  ///< Required headers not found

    [[nodiscard]] bool ok() const noexcept { return missing_columns.empty(); }
};

// ─── DataLoader ───────────────────────────────────────────────────────────────

class DataLoader {
public:
    /// Load a configuration table from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - A result with `missing_columns` set and no rows if the header lacks a
    ///   required column
    [[nodiscard]] static std::optional<LoadResult>
    load_csv(const std::string& filepath,
             const ColumnMapping& mapping = ColumnMapping{}) noexcept;

    /// Parse a CSV-formatted string (same format as `load_csv`).
    [[nodiscard]] static LoadResult
    parse_csv_string(const std::string& csv_content,
                     const ColumnMapping& mapping = ColumnMapping{}) noexcept;

    /// Parse one numeric cell. Empty or malformed text gives NaN.
    [[nodiscard]] static double parse_number(const std::string& cell) noexcept;

    /// Split a CSV line on commas, trimming surrounding whitespace. Quoted
    /// fields are not supported.
    [[nodiscard]] static std::vector<std::string> split_fields(const std::string& line);
};

}  // namespace chassis::core
