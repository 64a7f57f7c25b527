/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for suspension survey tables.

#include "chassis/data_loader.hpp"
#include "chassis/constants.hpp"
#include "chassis/geometry.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <string_view>
#include <utility>

namespace chassis::core {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/// Spreadsheet "CSV UTF-8" exports start with a byte-order mark.
constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

/// Resolved column positions for one header.
struct ColumnIndex {
    std::size_t                clip;
    std::size_t                center_section;
    std::size_t                corner;
    std::array<std::size_t, 3> upper;
    std::array<std::size_t, 3> lower;        ///< Unused when pivots are set
    std::array<std::size_t, 3> lca_front;
    std::array<std::size_t, 3> lca_rear;
    bool                       pivots = false;
    std::optional<std::size_t> offset;
    std::optional<std::size_t> track_type;
    std::size_t                max_required = 0;
};

/// Locate every mapped column in `header`; names that cannot be found are
/// appended to `missing`.
ColumnIndex resolve(const std::vector<std::string>& header,
                    const ColumnMapping& mapping,
                    std::vector<std::string>& missing) {
    std::map<std::string, std::size_t> pos;
    for (std::size_t i = 0; i < header.size(); ++i) {
        pos.emplace(header[i], i);
    }

    ColumnIndex idx{};
    auto required = [&](const std::string& name) -> std::size_t {
        const auto it = pos.find(name);
        if (it == pos.end()) {
            missing.push_back(name);
            return 0;
        }
        idx.max_required = std::max(idx.max_required, it->second);
        return it->second;
    };
    auto required_xyz = [&](const ColumnMapping::Xyz& names) {
        return std::array<std::size_t, 3>{required(names[0]), required(names[1]),
                                          required(names[2])};
    };
    auto optional_col = [&](const std::optional<std::string>& name) -> std::optional<std::size_t> {
        if (!name) return std::nullopt;
        const auto it = pos.find(*name);
        if (it == pos.end()) return std::nullopt;
        return it->second;
    };

    idx.clip           = required(mapping.clip);
    idx.center_section = required(mapping.center_section);
    idx.corner         = required(mapping.corner);
    idx.upper          = required_xyz(mapping.upper);
    if (mapping.lca_front && mapping.lca_rear) {
        idx.pivots    = true;
        idx.lca_front = required_xyz(*mapping.lca_front);
        idx.lca_rear  = required_xyz(*mapping.lca_rear);
    } else {
        idx.lower = required_xyz(mapping.lower);
    }
    idx.offset     = optional_col(mapping.offset);
    idx.track_type = optional_col(mapping.track_type);
    return idx;
}

[[nodiscard]] Eigen::Vector3d point(const std::vector<std::string>& fields,
                                    const std::array<std::size_t, 3>& cols) noexcept {
    return Eigen::Vector3d(DataLoader::parse_number(fields[cols[0]]),
                           DataLoader::parse_number(fields[cols[1]]),
                           DataLoader::parse_number(fields[cols[2]]));
}

/// Build one Configuration, or `nullopt` if the row must be rejected.
[[nodiscard]] std::optional<Configuration>
parse_row(const std::vector<std::string>& fields,
          const ColumnIndex& idx,
          std::size_t row_index) noexcept {
    if (fields.size() <= idx.max_required) {
        return std::nullopt;
    }

    const std::string& clip    = fields[idx.clip];
    const std::string& section = fields[idx.center_section];
    if (clip.empty() || section.empty()) {
        return std::nullopt;
    }
    const auto corner = parse_corner(fields[idx.corner]);
    if (!corner) {
        return std::nullopt;
    }

    const Eigen::Vector3d lower =
        idx.pivots ? geometry::lca_midpoint(point(fields, idx.lca_front),
                                            point(fields, idx.lca_rear))
                   : point(fields, idx.lower);

    double offset = constants::DEFAULT_Y_OFFSETS[index(*corner)];
    if (idx.offset) {
        offset = *idx.offset < fields.size() ? DataLoader::parse_number(fields[*idx.offset])
                                             : NaN;
    }

    std::optional<TrackType> track;
    if (idx.track_type && *idx.track_type < fields.size()) {
        track = parse_track_type(fields[*idx.track_type]);
    }

    return Configuration{
        .clip_id           = clip,
        .center_section_id = section,
        .corner            = *corner,
        .upper             = MountPoint{point(fields, idx.upper), MountRole::Upper},
        .lower             = MountPoint{lower, MountRole::LowerControlArm},
        .offset            = offset,
        .track_type        = track,
        .row_index         = row_index,
    };
}

}  // namespace

// ─── ColumnMapping::with_lca_pivots ───────────────────────────────────────────

ColumnMapping ColumnMapping::with_lca_pivots() {
    ColumnMapping m;
    m.lca_front = Xyz{"lca_front_x", "lca_front_y", "lca_front_z"};
    m.lca_rear  = Xyz{"lca_rear_x", "lca_rear_y", "lca_rear_z"};
    return m;
}

// ─── DataLoader::split_fields ─────────────────────────────────────────────────

std::vector<std::string> DataLoader::split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true) {
        const std::size_t comma = line.find(',', start);
        std::string token = line.substr(start, comma == std::string::npos
                                                   ? std::string::npos
                                                   : comma - start);
        const auto first = token.find_first_not_of(" \t\r\n");
        const auto last  = token.find_last_not_of(" \t\r\n");
        fields.push_back(first == std::string::npos
                             ? std::string{}
                             : token.substr(first, last - first + 1));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return fields;
}

// ─── DataLoader::parse_number ─────────────────────────────────────────────────

double DataLoader::parse_number(const std::string& cell) noexcept {
    if (cell.empty()) {
        return NaN;
    }
    errno = 0;
    char* end = nullptr;
    const double val = std::strtod(cell.c_str(), &end);
    if (end != cell.c_str() + cell.size()) {
        return NaN;  // trailing garbage
    }
    if (errno == ERANGE && std::isinf(val)) {
        return NaN;  // overflow; underflow to a subnormal is kept
    }
    return val;
}

// ─── DataLoader::parse_csv_string ─────────────────────────────────────────────

LoadResult DataLoader::parse_csv_string(const std::string& csv_content,
                                        const ColumnMapping& mapping) noexcept {
    LoadResult out;
    std::istringstream stream(csv_content);
    std::string line;
    std::optional<ColumnIndex> idx;

    while (std::getline(stream, line)) {
        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!idx && line.compare(0, UTF8_BOM.size(), UTF8_BOM) == 0) {
            line.erase(0, UTF8_BOM.size());
        }
        const auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        if (!idx) {
            // First non-empty, non-comment line is the header.
            idx = resolve(split_fields(line), mapping, out.missing_columns);
            if (!out.missing_columns.empty()) {
                return out;
            }
            continue;
        }

        auto cfg = parse_row(split_fields(line), *idx, out.rows.size());
        if (cfg) {
            out.rows.push_back(std::move(*cfg));
        } else {
            ++out.rejected_rows;
        }
    }

    return out;
}

// ─── DataLoader::load_csv ─────────────────────────────────────────────────────

std::optional<LoadResult>
DataLoader::load_csv(const std::string& filepath, const ColumnMapping& mapping) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str(), mapping);
}

}  // namespace chassis::core
