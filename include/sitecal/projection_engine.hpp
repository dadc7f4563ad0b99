/**
 * @file projection_engine.hpp
 * @brief Geodetic to planar projection (Default, UTM, LTM) backed by PROJ
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include "projection_config.hpp"
#include <vector>

namespace sitecal {

/**
 * @brief Maps geodetic coordinates to Transverse Mercator easting/northing
 *
 * Stateless between calls: every call builds its own PROJ context and
 * operation and releases them before returning, so one engine may be
 * used from several threads.
 *
 * Usage:
 * @code
 * ProjectionEngine engine(config);
 * auto projected = engine.project(global_points, UtmProjection{});
 * @endcode
 */
class ProjectionEngine {
public:
    explicit ProjectionEngine(const Config& config);

    /**
     * @brief Project points with a method config
     *
     * The Default origin is the FIRST point of @p points in caller order.
     *
     * @throws ProjectionError on empty input or invalid parameters
     */
    std::vector<ProjectedPoint> project(
        const std::vector<GlobalPoint>& points,
        const ProjectionConfig& config
    ) const;

    /**
     * @brief Project points through an already resolved definition
     */
    std::vector<ProjectedPoint> projectWith(
        const TransverseMercatorDefinition& definition,
        const std::vector<GlobalPoint>& points
    ) const;

    /**
     * @brief Resolve a config against the input points
     *
     * Derives the Default origin and the UTM zone/hemisphere.
     *
     * @throws ProjectionError on empty input or invalid parameters
     */
    TransverseMercatorDefinition resolve(
        const std::vector<GlobalPoint>& points,
        const ProjectionConfig& config
    ) const;

    /**
     * @brief UTM zone for a longitude: floor((lon + 180) / 6) + 1, clamped to [1, 60]
     */
    static int utmZoneForLongitude(double longitude_deg);

    /**
     * @brief Central meridian of a UTM zone: -183 + 6 * zone
     */
    static double utmCentralMeridian(int zone);

private:
    const Config& cfg_;
};

} // namespace sitecal
