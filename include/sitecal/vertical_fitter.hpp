/**
 * @file vertical_fitter.hpp
 * @brief Inclined-plane height correction fit
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include <Eigen/Dense>
#include <vector>

namespace sitecal {

/**
 * @brief Least-squares inclined plane for the height discrepancy
 *
 * Zerr = h_local - h_global is modeled as
 *   Zerr = C + Sn * N' + Se * E'
 * with (E', N') the projected positions centered on their centroid, the
 * same centering as the horizontal fit.
 */
class VerticalFitter {
public:
    explicit VerticalFitter(const Config& config);

    /**
     * @brief Fit (C, Sn, Se)
     *
     * @param projected Projected global positions
     * @param local_heights Local elevations, same order
     * @param global_heights Ellipsoidal heights, same order
     * @throws InputError on size mismatch or fewer than 3 points
     * @throws NumericError if the 3x3 normal equations are singular
     */
    VerticalParameters fitVertical(
        const std::vector<Eigen::Vector2d>& projected,
        const std::vector<double>& local_heights,
        const std::vector<double>& global_heights
    ) const;

private:
    const Config& cfg_;
};

} // namespace sitecal
