/// @file src/core/data_writer.cpp
/// @brief CSV export of damper lengths and rankings.

#include "chassis/data_writer.hpp"

#include <fmt/format.h>

#include <iterator>
#include <optional>

namespace chassis::core {

namespace {

[[nodiscard]] std::string_view track_cell(const std::optional<TrackType>& t) noexcept {
    return t ? std::string_view(to_string(*t)) : std::string_view{};
}

}  // namespace

std::string DataWriter::escape(std::string_view cell) {
    if (cell.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(cell);
    }
    std::string out = "\"";
    for (char c : cell) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string DataWriter::results_csv(std::span<const DamperResult> results) {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf),
                   "row,clip,center_section,corner,length,lower_z_used,track_type\n");
    for (const auto& r : results) {
        // Lengths use the shortest round-trip representation.
        fmt::format_to(std::back_inserter(buf), "{},{},{},{},{},{},{}\n",
                       r.row_index, escape(r.clip_id), escape(r.center_section_id),
                       to_string(r.corner), r.length, r.lower_z_used,
                       track_cell(r.track_type));
    }
    return fmt::to_string(buf);
}

std::string DataWriter::ranking_csv(std::span<const ranking::RankedEntry> entries,
                                    ranking::Scope scope) {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), "rank,clip,center_section,{},track_type\n",
                   ranking::to_string(scope));
    for (const auto& e : entries) {
        fmt::format_to(std::back_inserter(buf), "{},{},{},{},{}\n",
                       e.rank, escape(e.clip_id), escape(e.center_section_id),
                       e.value, track_cell(e.track_type));
    }
    return fmt::to_string(buf);
}

}  // namespace chassis::core
