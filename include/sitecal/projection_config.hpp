/**
 * @file projection_config.hpp
 * @brief Projection method selection and resolved Transverse Mercator definitions
 */

#pragma once

#include "common.hpp"
#include <optional>
#include <string>
#include <variant>

namespace sitecal {

/**
 * @brief Local TM centered on the first global point (no user parameters)
 */
struct DefaultProjection {};

/**
 * @brief UTM with optional forced zone and hemisphere
 */
struct UtmProjection {
    std::optional<int> zone;               ///< 1..60, derived from mean longitude if unset
    std::optional<Hemisphere> hemisphere;  ///< Derived from mean latitude if unset
};

/**
 * @brief User-parameterized Local Transverse Mercator
 */
struct LtmProjection {
    double central_meridian = 0.0;    ///< degrees
    double latitude_of_origin = 0.0;  ///< degrees
    double false_easting = 0.0;       ///< meters
    double false_northing = 0.0;      ///< meters
    double scale_factor = 1.0;
};

using ProjectionConfig = std::variant<DefaultProjection, UtmProjection, LtmProjection>;

/**
 * @brief Method tag of a projection config
 */
inline ProjectionMethod methodOf(const ProjectionConfig& config) {
    if (std::holds_alternative<UtmProjection>(config)) {
        return ProjectionMethod::UTM;
    }
    if (std::holds_alternative<LtmProjection>(config)) {
        return ProjectionMethod::LTM;
    }
    return ProjectionMethod::DEFAULT;
}

/**
 * @brief Fully resolved Transverse Mercator projection
 *
 * Produced by ProjectionEngine::resolve() from a ProjectionConfig and the
 * input points. Applying a calibration to new points goes through this
 * definition so the data-derived origin of the Default method is reused.
 */
struct TransverseMercatorDefinition {
    ProjectionMethod method = ProjectionMethod::DEFAULT;

    double latitude_of_origin = 0.0;  ///< degrees
    double central_meridian = 0.0;    ///< degrees
    double scale_factor = 1.0;
    double false_easting = 0.0;       ///< meters
    double false_northing = 0.0;      ///< meters
    std::string ellipsoid = "WGS84";

    std::optional<int> utm_zone;
    std::optional<Hemisphere> utm_hemisphere;

    /**
     * @brief PROJ string for the forward conversion (+proj=tmerc ...)
     */
    std::string toProjString() const;

    /**
     * @brief Human-readable summary, e.g. "UTM zone 18 south"
     */
    std::string describe() const;
};

/**
 * @brief Read the optional "projection" object of a JSON config file
 *
 * @return std::nullopt if the file has no "projection" object
 * @throws InputError if the file cannot be read or parsed
 * @throws ProjectionError on an unknown method or missing LTM parameters
 */
std::optional<ProjectionConfig> loadProjectionConfig(const std::string& path);

} // namespace sitecal
