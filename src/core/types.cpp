/// @file src/core/types.cpp
/// @brief Name conversions for Corner and TrackType.

#include "chassis/types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace chassis {

namespace {

/// Case-insensitive ASCII comparison.
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char l, char r) {
               return std::tolower(static_cast<unsigned char>(l)) ==
                      std::tolower(static_cast<unsigned char>(r));
           });
}

/// Strip leading/trailing blanks.
[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

// ─── Corner ───────────────────────────────────────────────────────────────────

const char* to_string(Corner c) noexcept {
    switch (c) {
        case Corner::LF: return "LF";
        case Corner::RF: return "RF";
        case Corner::LR: return "LR";
        case Corner::RR: return "RR";
    }
    return "?";
}

std::optional<Corner> parse_corner(std::string_view name) noexcept {
    const auto t = trim(name);
    for (Corner c : ALL_CORNERS) {
        if (iequals(t, to_string(c))) {
            return c;
        }
    }
    return std::nullopt;
}

// ─── TrackType ────────────────────────────────────────────────────────────────

const char* to_string(TrackType t) noexcept {
    switch (t) {
        case TrackType::INT:     return "INT";
        case TrackType::ST:      return "ST";
        case TrackType::RC:      return "RC";
        case TrackType::Utility: return "Utility";
        case TrackType::SSW:     return "SSW";
        case TrackType::Backup:  return "Backup";
    }
    return "?";
}

std::optional<TrackType> parse_track_type(std::string_view name) noexcept {
    static constexpr TrackType ALL[] = {
        TrackType::INT, TrackType::ST,  TrackType::RC,
        TrackType::Utility, TrackType::SSW, TrackType::Backup,
    };
    const auto t = trim(name);
    for (TrackType tt : ALL) {
        if (iequals(t, to_string(tt))) {
            return tt;
        }
    }
    return std::nullopt;
}

}  // namespace chassis
