/**
 * @file vertical_fitter.cpp
 * @brief Implementation of the inclined-plane fit
 */

#include "sitecal/vertical_fitter.hpp"
#include "sitecal/similarity_fitter.hpp"
#include "sitecal/errors.hpp"
#include "normal_equations.hpp"
#include <iostream>

namespace sitecal {

VerticalFitter::VerticalFitter(const Config& config)
    : cfg_(config) {}

VerticalParameters VerticalFitter::fitVertical(
    const std::vector<Eigen::Vector2d>& projected,
    const std::vector<double>& local_heights,
    const std::vector<double>& global_heights
) const {
    if (projected.size() != local_heights.size() || projected.size() != global_heights.size()) {
        throw InputError("Vertical fit needs one local and one global height per position");
    }
    if (projected.size() < 3) {
        throw InputError("Vertical fit needs at least 3 points, got " +
                         std::to_string(projected.size()));
    }

    const Eigen::Vector2d c_proj = centroidOf(projected);

    // Columns [1, N', E']
    const Eigen::Index n = static_cast<Eigen::Index>(projected.size());
    Eigen::MatrixXd A(n, 3);
    Eigen::VectorXd z(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        Eigen::Vector2d p = projected[i] - c_proj;
        A(i, 0) = 1.0;
        A(i, 1) = p.y();
        A(i, 2) = p.x();
        z(i) = local_heights[i] - global_heights[i];
    }

    Eigen::Matrix3d AtA = A.transpose() * A;
    Eigen::Vector3d Atz = A.transpose() * z;

    Eigen::Vector3d x = solveNormalEquations<3>(AtA, Atz, cfg_.singular_rcond_threshold, "Vertical");

    VerticalParameters params;
    params.constant = x(0);
    params.slope_north = x(1);
    params.slope_east = x(2);
    params.origin_easting = c_proj.x();
    params.origin_northing = c_proj.y();

    if (cfg_.verbose) {
        std::cout << "[VerticalFitter] C=" << params.constant
                  << " Sn=" << params.slope_north
                  << " Se=" << params.slope_east << "\n";
    }

    return params;
}

} // namespace sitecal
