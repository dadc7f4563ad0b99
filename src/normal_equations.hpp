/**
 * @file normal_equations.hpp
 * @brief Guarded LDLT solve of small least-squares normal equations
 */

#pragma once

#include "sitecal/errors.hpp"
#include <Eigen/Cholesky>
#include <string>

namespace sitecal {

/**
 * @brief Solve (A^T A) x = A^T b
 *
 * LDLT with symmetric pivoting puts zero pivots last and does not report
 * them through info(), so the pivot spread is checked explicitly.
 *
 * @param threshold  Minimum accepted min/max pivot ratio and reciprocal condition number
 * @param what       Names the system in the error message
 * @throws NumericError if the system is singular, near-singular or the solution is not finite
 */
template <int N>
Eigen::Matrix<double, N, 1> solveNormalEquations(
    const Eigen::Matrix<double, N, N>& AtA,
    const Eigen::Matrix<double, N, 1>& Atb,
    double threshold,
    const std::string& what
) {
    Eigen::LDLT<Eigen::Matrix<double, N, N>> ldlt(AtA);
    if (ldlt.info() != Eigen::Success) {
        throw NumericError(what + " normal equations could not be factorized");
    }

    const Eigen::Matrix<double, N, 1> pivots = ldlt.vectorD().cwiseAbs();
    const double max_pivot = pivots.maxCoeff();
    const double pivot_ratio = (max_pivot > 0.0) ? pivots.minCoeff() / max_pivot : 0.0;
    const double rcond = (max_pivot > 0.0) ? ldlt.rcond() : 0.0;

    if (pivot_ratio < threshold || rcond < threshold) {
        throw NumericError(what + " normal equations are singular (pivot ratio=" +
                           std::to_string(pivot_ratio) + ", rcond=" +
                           std::to_string(rcond) + ")");
    }

    Eigen::Matrix<double, N, 1> x = ldlt.solve(Atb);
    if (!x.allFinite()) {
        throw NumericError(what + " normal equations produced a non-finite solution");
    }
    return x;
}

} // namespace sitecal
