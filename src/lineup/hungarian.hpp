#pragma once
/**
 * @file  hungarian.hpp
 * @brief Rectangular minimum-cost assignment (Kuhn–Munkres, potentials form)
 *
 * Module:  src/lineup/
 *
 * Responsibility
 * --------------
 * Given an R × C cost matrix, choose min(R, C) cells, no two in the same row
 * or column, with the smallest total cost. Runs in O(min² · max).
 *
 * Design Constraints
 * ------------------
 *   • Costs must be finite; callers encode forbidden cells as a large
 *     finite penalty.
 *   • Deterministic: equal-cost alternatives resolve the same way every run.
 *
 * NOT Responsible For
 * -------------------
 *   • Maximization (negate the matrix)
 *   • Deciding which cells are forbidden
 */

#include <Eigen/Dense>

#include <cstddef>
#include <limits>
#include <vector>

namespace chassis::lineup::detail {

/// Marker for a row left without a column (only when rows > cols).
inline constexpr std::size_t UNASSIGNED = std::numeric_limits<std::size_t>::max();

/**
 * @brief Solve the assignment problem for `cost`.
 *
 * @return One entry per row: the chosen column, or UNASSIGNED.
 * @throws std::invalid_argument if any cost is non-finite.
 */
[[nodiscard]] std::vector<std::size_t> solve_assignment(const Eigen::MatrixXd& cost);

/// Total cost of an assignment returned by solve_assignment.
[[nodiscard]] double assignment_cost(const Eigen::MatrixXd& cost,
                                     const std::vector<std::size_t>& row_to_col) noexcept;

}  // namespace chassis::lineup::detail
