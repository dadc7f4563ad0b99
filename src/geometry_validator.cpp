/**
 * @file geometry_validator.cpp
 * @brief Implementation of the collinearity gate
 */

#include "sitecal/geometry_validator.hpp"
#include "sitecal/errors.hpp"
#include <Eigen/Eigenvalues>
#include <algorithm>
#include <iostream>
#include <sstream>

namespace sitecal {

GeometryValidator::GeometryValidator(const Config& config)
    : cfg_(config) {}

CollinearityCheck GeometryValidator::checkCollinearity(
    const std::vector<ProjectedPoint>& points
) const {
    CollinearityCheck result;
    if (points.empty()) {
        return result;
    }

    Eigen::Vector2d centroid = Eigen::Vector2d::Zero();
    for (const auto& pt : points) {
        centroid += pt.xy();
    }
    centroid /= static_cast<double>(points.size());

    // Population covariance
    Eigen::Matrix2d cov = Eigen::Matrix2d::Zero();
    for (const auto& pt : points) {
        Eigen::Vector2d d = pt.xy() - centroid;
        cov += d * d.transpose();
    }
    cov /= static_cast<double>(points.size());

    Eigen::SelfAdjointEigenSolver<Eigen::Matrix2d> solver(cov, Eigen::EigenvaluesOnly);
    if (solver.info() != Eigen::Success) {
        return result;
    }

    // Round-off can push the small eigenvalue of a perfect line below zero
    result.eigenvalues = solver.eigenvalues().cwiseMax(0.0);
    double max_eig = result.eigenvalues(1);
    double min_eig = result.eigenvalues(0);

    result.ratio = (max_eig > 0.0) ? (min_eig / max_eig) : 0.0;
    result.passed = result.ratio >= cfg_.collinearity_ratio_threshold;
    return result;
}

CollinearityCheck GeometryValidator::validate(const std::vector<ProjectedPoint>& points) const {
    CollinearityCheck check = checkCollinearity(points);

    if (cfg_.verbose) {
        std::cout << "[GeometryValidator] eigenvalues=(" << check.eigenvalues(0) << ", "
                  << check.eigenvalues(1) << ") ratio=" << check.ratio << "\n";
    }

    if (!check.passed) {
        std::ostringstream msg;
        msg << "Control points are collinear or coincident: covariance eigenvalue ratio "
            << check.ratio << " is below " << cfg_.collinearity_ratio_threshold
            << "; add points that spread across both directions of the site";
        throw GeometryError(msg.str(), check.ratio);
    }
    return check;
}

} // namespace sitecal
