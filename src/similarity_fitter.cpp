/**
 * @file similarity_fitter.cpp
 * @brief Implementation of the 2D similarity least-squares fit
 */

#include "sitecal/similarity_fitter.hpp"
#include "sitecal/errors.hpp"
#include "normal_equations.hpp"
#include <iostream>
#include <sstream>

namespace sitecal {

Eigen::Vector2d centroidOf(const std::vector<Eigen::Vector2d>& points) {
    Eigen::Vector2d centroid = Eigen::Vector2d::Zero();
    if (points.empty()) {
        return centroid;
    }
    for (const auto& pt : points) {
        centroid += pt;
    }
    return centroid / static_cast<double>(points.size());
}

SimilarityFitter::SimilarityFitter(const Config& config)
    : cfg_(config) {}

HorizontalParameters SimilarityFitter::fitHorizontal(
    const std::vector<Eigen::Vector2d>& projected,
    const std::vector<Eigen::Vector2d>& local
) const {
    if (projected.size() != local.size()) {
        throw InputError("Horizontal fit needs one local position per projected position");
    }
    if (projected.size() < 3) {
        throw InputError("Horizontal fit needs at least 3 points, got " +
                         std::to_string(projected.size()));
    }

    const Eigen::Vector2d c_proj = centroidOf(projected);
    const Eigen::Vector2d c_local = centroidOf(local);

    // Stacked design: rows [E', -N'] -> e' then rows [N', E'] -> n'
    const Eigen::Index n = static_cast<Eigen::Index>(projected.size());
    Eigen::MatrixXd A(2 * n, 2);
    Eigen::VectorXd L(2 * n);
    for (Eigen::Index i = 0; i < n; ++i) {
        Eigen::Vector2d p = projected[i] - c_proj;
        Eigen::Vector2d q = local[i] - c_local;

        A(i, 0) = p.x();
        A(i, 1) = -p.y();
        L(i) = q.x();

        A(n + i, 0) = p.y();
        A(n + i, 1) = p.x();
        L(n + i) = q.y();
    }

    // Normal equations: A^T A x = A^T L
    Eigen::Matrix2d AtA = A.transpose() * A;
    Eigen::Vector2d AtL = A.transpose() * L;

    Eigen::Vector2d ab = solveNormalEquations<2>(AtA, AtL, cfg_.singular_rcond_threshold, "Horizontal");

    HorizontalParameters params;
    params.a = ab(0);
    params.b = ab(1);
    params.translation_easting = c_local.x() - params.a * c_proj.x() + params.b * c_proj.y();
    params.translation_northing = c_local.y() - params.b * c_proj.x() - params.a * c_proj.y();

    // Local points without spread collapse the fit to a = b = 0
    if (!(params.scaleFactor() > cfg_.min_scale_factor)) {
        std::ostringstream msg;
        msg << "Horizontal fit degenerated: scale factor " << params.scaleFactor()
            << " is not above " << cfg_.min_scale_factor
            << "; check that the local coordinates are not all at the same position";
        throw NumericError(msg.str());
    }

    if (cfg_.verbose) {
        std::cout << "[SimilarityFitter] a=" << params.a << " b=" << params.b
                  << " tE=" << params.translation_easting
                  << " tN=" << params.translation_northing << "\n";
    }

    return params;
}

} // namespace sitecal
