/**
 * @file data_types.hpp
 * @brief Core data structures for control points, parameters and fit results
 */

#pragma once

#include "common.hpp"
#include "projection_config.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

namespace sitecal {

/**
 * @brief Geodetic position of a control point
 */
struct GeodeticCoordinate {
    double latitude = 0.0;            ///< degrees
    double longitude = 0.0;           ///< degrees
    double ellipsoidal_height = 0.0;  ///< meters
};

/**
 * @brief Position of a control point in the local site grid
 */
struct LocalCoordinate {
    double easting = 0.0;    ///< meters
    double northing = 0.0;   ///< meters
    double elevation = 0.0;  ///< meters
};

/**
 * @brief One row of the global (GNSS) point file
 */
struct GlobalPoint {
    PointId id;
    GeodeticCoordinate geodetic;
};

/**
 * @brief One row of the local (site grid) point file
 */
struct LocalPoint {
    PointId id;
    LocalCoordinate local;
};

/**
 * @brief Control point observed in both systems
 */
struct PointRecord {
    PointId id;
    GeodeticCoordinate geodetic;
    LocalCoordinate local;
};

/**
 * @brief Global point after projection to the intermediate plane
 */
struct ProjectedPoint {
    PointId id;
    double easting = 0.0;   ///< meters
    double northing = 0.0;  ///< meters

    Eigen::Vector2d xy() const { return Eigen::Vector2d(easting, northing); }
};

/**
 * @brief 4-parameter 2D similarity: local = [a -b; b a] * projected + t
 */
struct HorizontalParameters {
    double a = 1.0;
    double b = 0.0;
    double translation_easting = 0.0;   ///< tE (meters)
    double translation_northing = 0.0;  ///< tN (meters)

    double rotationRadians() const { return std::atan2(b, a); }
    double rotationDegrees() const { return rotationRadians() * kRadToDeg; }
    double scaleFactor() const { return std::sqrt(a * a + b * b); }

    /// Scale deviation from unity in parts per million
    double scalePpm() const { return (scaleFactor() - 1.0) * 1e6; }

    /**
     * @brief Apply the similarity to a projected position
     */
    Eigen::Vector2d apply(double easting, double northing) const {
        return Eigen::Vector2d(
            a * easting - b * northing + translation_easting,
            b * easting + a * northing + translation_northing
        );
    }
};

/**
 * @brief Inclined-plane height correction
 *
 * Zerr = h_local - h_global = constant + slope_north * N' + slope_east * E'
 * where E' = E - origin_easting, N' = N - origin_northing are centered on
 * the projected control point centroid.
 */
struct VerticalParameters {
    double constant = 0.0;         ///< meters
    double slope_north = 0.0;      ///< meters per meter
    double slope_east = 0.0;       ///< meters per meter
    double origin_easting = 0.0;   ///< projected centroid Ec
    double origin_northing = 0.0;  ///< projected centroid Nc

    /**
     * @brief Predicted Zerr at a projected position
     */
    double correctionAt(double easting, double northing) const {
        return constant
            + slope_north * (northing - origin_northing)
            + slope_east * (easting - origin_easting);
    }
};

/**
 * @brief Complete fitted transformation
 */
struct TransformParameters {
    HorizontalParameters horizontal;
    VerticalParameters vertical;
};

/**
 * @brief Per-point misclosure after applying the fitted parameters
 */
struct Residual {
    PointId id;
    double delta_easting = 0.0;    ///< measured - predicted (meters)
    double delta_northing = 0.0;   ///< measured - predicted (meters)
    double delta_elevation = 0.0;  ///< Zerr - predicted Zerr (meters)

    double horizontal() const {
        return std::sqrt(delta_easting * delta_easting + delta_northing * delta_northing);
    }
};

/**
 * @brief Summary statistics over all residuals
 */
struct FitStatistics {
    double rms_horizontal = 0.0;  ///< sqrt(mean(dE^2 + dN^2))
    double rms_vertical = 0.0;    ///< sqrt(mean(dH^2))

    // Extended statistics for the report
    PointId worst_point;
    double worst_horizontal = 0.0;
    PointId best_point;
    double best_horizontal = 0.0;
    double std_easting = 0.0;     ///< Sample standard deviation of dE
    double std_northing = 0.0;
    double std_elevation = 0.0;
    double percentile99_horizontal = 0.0;

    std::string toString() const {
        char buffer[128];
        snprintf(buffer, sizeof(buffer), "RMS(h)=%.4fm RMS(v)=%.4fm worst=%s",
                 rms_horizontal, rms_vertical, worst_point.c_str());
        return std::string(buffer);
    }
};

/**
 * @brief Everything a calibration run produces
 */
struct FitReport {
    ProjectionConfig projection;
    TransverseMercatorDefinition projection_definition;

    TransformParameters parameters;
    std::vector<Residual> residuals;
    FitStatistics statistics;

    double collinearity_ratio = 0.0;
    std::vector<ProjectedPoint> projected_points;  ///< Matched points, global file order
    std::vector<PointId> unmatched_global;
    std::vector<PointId> unmatched_local;

    ProjectionMethod method() const { return methodOf(projection); }
};

/**
 * @brief Global point carried through a fitted calibration
 */
struct TransformedPoint {
    PointId id;
    double projected_easting = 0.0;
    double projected_northing = 0.0;
    double easting = 0.0;
    double northing = 0.0;
    double elevation = 0.0;
};

} // namespace sitecal
