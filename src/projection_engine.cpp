/**
 * @file projection_engine.cpp
 * @brief Implementation of ProjectionEngine on top of the PROJ C API
 */

#include "sitecal/projection_engine.hpp"
#include "sitecal/errors.hpp"
#include <proj.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>

namespace sitecal {

namespace {

struct ContextDeleter {
    void operator()(PJ_CONTEXT* ctx) const { proj_context_destroy(ctx); }
};

struct OperationDeleter {
    void operator()(PJ* pj) const { proj_destroy(pj); }
};

using ContextHandle = std::unique_ptr<PJ_CONTEXT, ContextDeleter>;
using OperationHandle = std::unique_ptr<PJ, OperationDeleter>;

std::string projErrorText(PJ_CONTEXT* ctx, int code) {
    const char* text = proj_context_errno_string(ctx, code);
    if (text == nullptr) {
        return "PROJ error " + std::to_string(code);
    }
    return text;
}

void requireFinite(double value, const std::string& name) {
    if (!std::isfinite(value)) {
        throw ProjectionError("LTM parameter '" + name + "' must be a finite number");
    }
}

} // namespace

ProjectionEngine::ProjectionEngine(const Config& config)
    : cfg_(config) {}

int ProjectionEngine::utmZoneForLongitude(double longitude_deg) {
    int zone = static_cast<int>(std::floor((longitude_deg + 180.0) / 6.0)) + 1;
    return std::clamp(zone, 1, 60);
}

double ProjectionEngine::utmCentralMeridian(int zone) {
    return -183.0 + 6.0 * zone;
}

TransverseMercatorDefinition ProjectionEngine::resolve(
    const std::vector<GlobalPoint>& points,
    const ProjectionConfig& config
) const {
    if (points.empty()) {
        throw ProjectionError("Cannot resolve a projection without input points");
    }

    TransverseMercatorDefinition def;
    def.method = methodOf(config);
    def.ellipsoid = cfg_.ellipsoid;

    if (const auto* utm = std::get_if<UtmProjection>(&config)) {
        double sum_lon = 0.0;
        double sum_lat = 0.0;
        for (const auto& pt : points) {
            sum_lon += pt.geodetic.longitude;
            sum_lat += pt.geodetic.latitude;
        }
        double mean_lon = sum_lon / points.size();
        double mean_lat = sum_lat / points.size();

        int zone = utmZoneForLongitude(mean_lon);
        if (utm->zone) {
            if (*utm->zone < 1 || *utm->zone > 60) {
                throw ProjectionError("UTM zone must be in [1, 60], got " + std::to_string(*utm->zone));
            }
            zone = *utm->zone;
        }
        Hemisphere hemisphere = (mean_lat >= 0.0) ? Hemisphere::NORTH : Hemisphere::SOUTH;
        if (utm->hemisphere) {
            hemisphere = *utm->hemisphere;
        }

        def.latitude_of_origin = 0.0;
        def.central_meridian = utmCentralMeridian(zone);
        def.scale_factor = 0.9996;
        def.false_easting = 500000.0;
        def.false_northing = (hemisphere == Hemisphere::SOUTH) ? 10000000.0 : 0.0;
        def.utm_zone = zone;
        def.utm_hemisphere = hemisphere;

        if (cfg_.verbose) {
            std::cout << "[ProjectionEngine] " << def.describe()
                      << " (mean lon=" << mean_lon << ", mean lat=" << mean_lat << ")\n";
        }
    } else if (const auto* ltm = std::get_if<LtmProjection>(&config)) {
        requireFinite(ltm->central_meridian, "central_meridian");
        requireFinite(ltm->latitude_of_origin, "latitude_of_origin");
        requireFinite(ltm->false_easting, "false_easting");
        requireFinite(ltm->false_northing, "false_northing");
        requireFinite(ltm->scale_factor, "scale_factor");
        if (ltm->scale_factor <= 0.0) {
            throw ProjectionError("LTM scale factor must be positive");
        }
        if (std::abs(ltm->latitude_of_origin) > 90.0) {
            throw ProjectionError("LTM latitude of origin must be within [-90, 90]");
        }

        def.latitude_of_origin = ltm->latitude_of_origin;
        def.central_meridian = ltm->central_meridian;
        def.scale_factor = ltm->scale_factor;
        def.false_easting = ltm->false_easting;
        def.false_northing = ltm->false_northing;
    } else {
        // Origin is the first point as given, not the lexicographically first id
        const GlobalPoint& origin = points.front();
        def.latitude_of_origin = origin.geodetic.latitude;
        def.central_meridian = origin.geodetic.longitude;
        def.scale_factor = 1.0;
        def.false_easting = 0.0;
        def.false_northing = 0.0;

        if (cfg_.verbose) {
            std::cout << "[ProjectionEngine] Default origin at point '" << origin.id << "'\n";
        }
    }

    return def;
}

std::vector<ProjectedPoint> ProjectionEngine::project(
    const std::vector<GlobalPoint>& points,
    const ProjectionConfig& config
) const {
    return projectWith(resolve(points, config), points);
}

std::vector<ProjectedPoint> ProjectionEngine::projectWith(
    const TransverseMercatorDefinition& definition,
    const std::vector<GlobalPoint>& points
) const {
    ContextHandle ctx(proj_context_create());
    if (!ctx) {
        throw ProjectionError("Could not create PROJ context");
    }
    proj_log_level(ctx.get(), PJ_LOG_NONE);

    const std::string proj_string = definition.toProjString();
    OperationHandle op(proj_create(ctx.get(), proj_string.c_str()));
    if (!op) {
        throw ProjectionError("Invalid projection '" + proj_string + "': " +
                              projErrorText(ctx.get(), proj_context_errno(ctx.get())));
    }

    // A bare +proj=tmerc operation consumes radians
    const bool angular = proj_angular_input(op.get(), PJ_FWD) != 0;

    std::vector<ProjectedPoint> projected;
    projected.reserve(points.size());

    for (const auto& pt : points) {
        double lon = pt.geodetic.longitude;
        double lat = pt.geodetic.latitude;
        if (angular) {
            lon = proj_torad(lon);
            lat = proj_torad(lat);
        }

        PJ_COORD out = proj_trans(op.get(), PJ_FWD, proj_coord(lon, lat, 0.0, 0.0));
        if (!std::isfinite(out.xy.x) || !std::isfinite(out.xy.y)) {
            throw ProjectionError("Could not project point '" + pt.id + "': " +
                                  projErrorText(ctx.get(), proj_errno(op.get())));
        }

        ProjectedPoint p;
        p.id = pt.id;
        p.easting = out.xy.x;
        p.northing = out.xy.y;
        projected.push_back(p);
    }

    return projected;
}

} // namespace sitecal
