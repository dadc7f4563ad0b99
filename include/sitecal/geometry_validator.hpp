/**
 * @file geometry_validator.hpp
 * @brief Collinearity gate on the control point cloud
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include <Eigen/Dense>
#include <vector>

namespace sitecal {

/**
 * @brief Outcome of the eigenvalue-ratio test
 */
struct CollinearityCheck {
    Eigen::Vector2d eigenvalues = Eigen::Vector2d::Zero();  ///< Ascending
    double ratio = 0.0;   ///< min / max eigenvalue (0 if max is 0)
    bool passed = false;
};

/**
 * @brief Rejects point configurations that are effectively one-dimensional
 *
 * A 4-parameter similarity needs spread in two independent directions.
 * The test uses the population covariance of (easting, northing) about
 * the centroid and fails when min/max eigenvalue < threshold.
 */
class GeometryValidator {
public:
    explicit GeometryValidator(const Config& config);

    /**
     * @brief Compute the eigenvalue ratio without throwing
     */
    CollinearityCheck checkCollinearity(const std::vector<ProjectedPoint>& points) const;

    /**
     * @brief Run the check and throw on failure
     * @return Passing check result
     * @throws GeometryError carrying the computed ratio
     */
    CollinearityCheck validate(const std::vector<ProjectedPoint>& points) const;

private:
    const Config& cfg_;
};

} // namespace sitecal
