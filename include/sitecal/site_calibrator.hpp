/**
 * @file site_calibrator.hpp
 * @brief Site calibration pipeline (integrates all components)
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include "projection_config.hpp"
#include <memory>
#include <vector>

namespace sitecal {

// Forward declarations
class PointMatcher;
class ProjectionEngine;
class GeometryValidator;
class SimilarityFitter;
class VerticalFitter;
class ResidualAnalyzer;

/**
 * @brief Global-to-local site calibration
 *
 * Pipeline: match -> project -> collinearity gate -> horizontal and
 * vertical fits -> residuals. Every call is independent; the calibrator
 * keeps no state between runs.
 *
 * Example usage:
 * ```cpp
 * SiteCalibrator calibrator;
 * FitReport report = calibrator.calibrate(global_points, local_points, UtmProjection{});
 * printf("RMS: %.3f m\n", report.statistics.rms_horizontal);
 *
 * // Carry new GNSS points into the site grid
 * auto grid = calibrator.transform(report, new_points);
 * ```
 */
class SiteCalibrator {
public:
    explicit SiteCalibrator(const Config& config = Config());
    ~SiteCalibrator();

    /**
     * @brief Run a full calibration
     *
     * All global points are projected (the Default origin is the first
     * global point in the given order); only matched points enter the fits.
     *
     * @throws InputError, ProjectionError, GeometryError, NumericError
     */
    FitReport calibrate(
        const std::vector<GlobalPoint>& global_points,
        const std::vector<LocalPoint>& local_points,
        const ProjectionConfig& projection
    ) const;

    /**
     * @brief Apply a fitted calibration to global points
     *
     * Projects through the stored projection definition, applies the
     * similarity, and sets elevation = h_global + predicted Zerr.
     *
     * @throws InputError, ProjectionError
     */
    std::vector<TransformedPoint> transform(
        const FitReport& report,
        const std::vector<GlobalPoint>& global_points
    ) const;

    /**
     * @brief Get configuration
     */
    const Config& config() const { return cfg_; }

private:
    // Stored by value; components keep a reference to it.
    Config cfg_;

    std::unique_ptr<PointMatcher> matcher_;
    std::unique_ptr<ProjectionEngine> projection_;
    std::unique_ptr<GeometryValidator> validator_;
    std::unique_ptr<SimilarityFitter> horizontal_fitter_;
    std::unique_ptr<VerticalFitter> vertical_fitter_;
    std::unique_ptr<ResidualAnalyzer> analyzer_;
};

} // namespace sitecal
