/**
 * @file similarity_fitter.hpp
 * @brief 4-parameter 2D similarity fit on centered coordinates
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include <Eigen/Dense>
#include <vector>

namespace sitecal {

/**
 * @brief Centroid of a set of planar positions
 */
Eigen::Vector2d centroidOf(const std::vector<Eigen::Vector2d>& points);

/**
 * @brief Least-squares similarity from projected to local coordinates
 *
 * Model (per point, centered on each set's centroid):
 *   e' = a*E' - b*N'
 *   n' = b*E' + a*N'
 * Translations are recovered from the centroids afterwards:
 *   tE = Ec' - a*Ec + b*Nc,  tN = Nc' - b*Ec - a*Nc
 *
 * Centering keeps the normal equations well conditioned for large
 * absolute coordinates such as UTM eastings.
 */
class SimilarityFitter {
public:
    explicit SimilarityFitter(const Config& config);

    /**
     * @brief Fit (a, b, tE, tN)
     *
     * @param projected Projected global positions
     * @param local Local grid positions, same order as @p projected
     * @throws InputError if the sizes differ or fewer than 3 points are given
     * @throws NumericError if the normal equations are singular
     */
    HorizontalParameters fitHorizontal(
        const std::vector<Eigen::Vector2d>& projected,
        const std::vector<Eigen::Vector2d>& local
    ) const;

private:
    const Config& cfg_;
};

} // namespace sitecal
