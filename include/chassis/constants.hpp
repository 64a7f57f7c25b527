#pragma once

#include "chassis/types.hpp"

#include <cstddef>

/// @file include/chassis/constants.hpp
/// @brief Geometry defaults and numerical tolerances for the chassis system.

namespace chassis::constants {

// ─── Lower Damper Mount Offsets ───────────────────────────────────────────────

/// Default outboard Y offsets of the lower damper mount from the LCA point,
/// indexed by corner (LF, RF, LR, RR). Used when the column mapping has no
/// offset column.
static constexpr CornerArray<double> DEFAULT_Y_OFFSETS = {12.1, 12.6, 14.5, 15.6};

// ─── Lineup Weights ───────────────────────────────────────────────────────────

/// Uniform corner weight (each corner contributes a quarter of the score).
static constexpr double UNIFORM_CORNER_WEIGHT = 0.25;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

/// Minimum number of finite z samples for a corner before LCA normalization
/// has any effect. Below this the raw z is kept.
static constexpr std::size_t MIN_MEDIAN_SAMPLES = 2;

// ─── Output ───────────────────────────────────────────────────────────────────

/// Decimal places used when printing damper lengths.
static constexpr int LENGTH_PRINT_PRECISION = 4;

}  // namespace chassis::constants
