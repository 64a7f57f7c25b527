#pragma once

/// @file include/chassis/types.hpp
/// @brief Shared value types for the chassis damper / lineup system.
///
/// Every module includes this file. It defines the corner and track-type
/// enumerations, the mount-point coordinate type and the Configuration row
/// that the loader produces and the calculator consumes.

#include <Eigen/Dense>

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace chassis {

// ─── Corner ───────────────────────────────────────────────────────────────────

/// The four suspension positions. The underlying value is the index used by
/// every per-corner array in the system.
enum class Corner : std::size_t {
    LF = 0,  ///< Left front
    RF = 1,  ///< Right front
    LR = 2,  ///< Left rear
    RR = 3,  ///< Right rear
};

/// Number of corners on a car.
static constexpr std::size_t CORNER_COUNT = 4;

/// All corners in index order.
static constexpr std::array<Corner, CORNER_COUNT> ALL_CORNERS = {
    Corner::LF, Corner::RF, Corner::LR, Corner::RR,
};

/// Per-corner value container indexed by `index(Corner)`.
template <typename T>
using CornerArray = std::array<T, CORNER_COUNT>;

[[nodiscard]] constexpr std::size_t index(Corner c) noexcept {
    return static_cast<std::size_t>(c);
}

[[nodiscard]] constexpr bool is_front(Corner c) noexcept {
    return c == Corner::LF || c == Corner::RF;
}

[[nodiscard]] constexpr bool is_left(Corner c) noexcept {
    return c == Corner::LF || c == Corner::LR;
}

/// "LF", "RF", "LR" or "RR".
[[nodiscard]] const char* to_string(Corner c) noexcept;

/// Parse a corner name (case-insensitive). Returns `nullopt` for anything
/// other than LF / RF / LR / RR.
[[nodiscard]] std::optional<Corner> parse_corner(std::string_view name) noexcept;

// ─── TrackType ────────────────────────────────────────────────────────────────

/// Externally assigned track category. Opaque to the calculator and the
/// optimizer; used only as a filter key.
enum class TrackType {
    INT,
    ST,
    RC,
    Utility,
    SSW,
    Backup,
};

[[nodiscard]] const char* to_string(TrackType t) noexcept;

/// Parse a track-type tag (case-insensitive). Returns `nullopt` if unknown.
[[nodiscard]] std::optional<TrackType> parse_track_type(std::string_view name) noexcept;

// ─── MountPoint ───────────────────────────────────────────────────────────────

/// Semantic role of a measured mount point.
enum class MountRole {
    Upper,            ///< Upper damper mount on the clip
    LowerControlArm,  ///< Lower damper mount on the lower control arm
};

/// A measured 3D coordinate. Components are NaN when the source cell was
/// missing or non-numeric; the calculator reports such rows.
struct MountPoint {
    Eigen::Vector3d position;
    MountRole       role;

    [[nodiscard]] double x() const noexcept { return position.x(); }
    [[nodiscard]] double y() const noexcept { return position.y(); }
    [[nodiscard]] double z() const noexcept { return position.z(); }

    /// True if all three components are finite.
    [[nodiscard]] bool is_finite() const noexcept {
        return position.allFinite();
    }
};

// ─── Configuration ────────────────────────────────────────────────────────────

/// One row of source data: one corner of one clip measured on one center
/// section. Created by the loader; never modified afterwards.
struct Configuration {
    std::string              clip_id;
    std::string              center_section_id;
    Corner                   corner;
    MountPoint               upper;
    MountPoint               lower;
    double                   offset;      ///< Outboard Y distance of the lower damper mount
    std::optional<TrackType> track_type;  ///< External tag, if supplied
    std::size_t              row_index;   ///< Position in the loaded table
};

// ─── DamperResult ─────────────────────────────────────────────────────────────

/// A successfully computed damper length, keyed back to its source row.
struct DamperResult {
    std::string              clip_id;
    std::string              center_section_id;
    Corner                   corner;
    double                   length;         ///< Damper length (>= 0)
    double                   lower_z_used;   ///< LCA z that entered the distance formula
    std::optional<TrackType> track_type;
    std::size_t              row_index;
};

}  // namespace chassis
