/**
 * @file residual_analyzer.hpp
 * @brief Residuals and fit-quality statistics
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include <vector>

namespace sitecal {

/**
 * @brief Residuals of every matched point plus summary statistics
 */
struct ResidualSummary {
    std::vector<Residual> residuals;
    FitStatistics statistics;
};

/**
 * @brief Applies fitted parameters back to the control points
 *
 * dE = e - E_pred, dN = n - N_pred, dH = Zerr - Zerr_pred
 * RMS(h) = sqrt(mean(dE^2 + dN^2)), RMS(v) = sqrt(mean(dH^2))
 */
class ResidualAnalyzer {
public:
    explicit ResidualAnalyzer(const Config& config);

    /**
     * @brief Compute per-point residuals and statistics
     *
     * @param projected Projected control points
     * @param records Matched records, same order and identifiers as @p projected
     * @param params Fitted parameters
     * @throws InputError if the two lists do not line up
     */
    ResidualSummary computeResiduals(
        const std::vector<ProjectedPoint>& projected,
        const std::vector<PointRecord>& records,
        const TransformParameters& params
    ) const;

    /**
     * @brief Summary statistics for an existing residual list
     */
    static FitStatistics summarize(const std::vector<Residual>& residuals);

private:
    const Config& cfg_;
};

} // namespace sitecal
