/**
 * @file  hungarian.cpp
 * @brief Kuhn–Munkres with row/column potentials for rectangular matrices.
 */

#include "hungarian.hpp"

#include <stdexcept>

namespace chassis::lineup::detail {

namespace {

/// Core solver for rows ≤ cols. Potentials, `p` and `way` are 1-based; `a` is read 0-based.
std::vector<std::size_t> solve_wide(const Eigen::MatrixXd& a) {
    const auto n = static_cast<std::size_t>(a.rows());
    const auto m = static_cast<std::size_t>(a.cols());
    constexpr double INF = std::numeric_limits<double>::infinity();

    std::vector<double>      u(n + 1, 0.0);
    std::vector<double>      v(m + 1, 0.0);
    std::vector<std::size_t> p(m + 1, 0);    // p[j]: row matched to column j (1-based, 0 = none)
    std::vector<std::size_t> way(m + 1, 0);

    for (std::size_t i = 1; i <= n; ++i) {
        p[0] = i;
        std::size_t j0 = 0;
        std::vector<double> minv(m + 1, INF);
        std::vector<bool>   used(m + 1, false);

        // Grow an alternating tree from row i until a free column is reached.
        do {
            used[j0] = true;
            const std::size_t i0 = p[j0];
            double      delta = INF;
            std::size_t j1    = 0;

            for (std::size_t j = 1; j <= m; ++j) {
                if (used[j]) continue;
                const double cur = a(static_cast<Eigen::Index>(i0 - 1),
                                     static_cast<Eigen::Index>(j - 1)) - u[i0] - v[j];
                if (cur < minv[j]) {
                    minv[j] = cur;
                    way[j]  = j0;
                }
                if (minv[j] < delta) {
                    delta = minv[j];
                    j1    = j;
                }
            }

            for (std::size_t j = 0; j <= m; ++j) {
                if (used[j]) {
                    u[p[j]] += delta;
                    v[j]    -= delta;
                } else {
                    minv[j] -= delta;
                }
            }
            j0 = j1;
        } while (p[j0] != 0);

        // Flip the augmenting path.
        do {
            const std::size_t j1 = way[j0];
            p[j0] = p[j1];
            j0    = j1;
        } while (j0 != 0);
    }

    std::vector<std::size_t> row_to_col(n, UNASSIGNED);
    for (std::size_t j = 1; j <= m; ++j) {
        if (p[j] != 0) {
            row_to_col[p[j] - 1] = j - 1;
        }
    }
    return row_to_col;
}

}  // namespace

// ─── solve_assignment ─────────────────────────────────────────────────────────

std::vector<std::size_t> solve_assignment(const Eigen::MatrixXd& cost) {
    if (!cost.allFinite()) {
        throw std::invalid_argument("assignment cost matrix has non-finite entries");
    }
    const auto rows = static_cast<std::size_t>(cost.rows());
    const auto cols = static_cast<std::size_t>(cost.cols());
    if (rows == 0 || cols == 0) {
        return std::vector<std::size_t>(rows, UNASSIGNED);
    }
    if (rows <= cols) {
        return solve_wide(cost);
    }

    // Tall matrix: solve the transpose and invert the mapping.
    const Eigen::MatrixXd transposed = cost.transpose();
    const auto col_to_row = solve_wide(transposed);
    std::vector<std::size_t> row_to_col(rows, UNASSIGNED);
    for (std::size_t c = 0; c < col_to_row.size(); ++c) {
        if (col_to_row[c] != UNASSIGNED) {
            row_to_col[col_to_row[c]] = c;
        }
    }
    return row_to_col;
}

// ─── assignment_cost ──────────────────────────────────────────────────────────

double assignment_cost(const Eigen::MatrixXd& cost,
                       const std::vector<std::size_t>& row_to_col) noexcept {
    double total = 0.0;
    for (std::size_t r = 0; r < row_to_col.size(); ++r) {
        if (row_to_col[r] == UNASSIGNED) continue;
        total += cost(static_cast<Eigen::Index>(r),
                      static_cast<Eigen::Index>(row_to_col[r]));
    }
    return total;
}

}  // namespace chassis::lineup::detail
