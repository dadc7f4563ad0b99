/**
 * @file point_matcher.cpp
 * @brief Implementation of identifier matching and input validation
 */

#include "sitecal/point_matcher.hpp"
#include "sitecal/errors.hpp"
#include <cmath>
#include <iostream>
#include <unordered_map>
#include <unordered_set>

namespace sitecal {

namespace {

void requireUniqueIds(const std::vector<PointId>& ids, const std::string& set_name) {
    std::unordered_set<PointId> seen;
    for (const auto& id : ids) {
        if (id.empty()) {
            throw InputError("Empty point identifier in " + set_name + " points");
        }
        if (!seen.insert(id).second) {
            throw InputError("Duplicate point identifier '" + id + "' in " + set_name + " points");
        }
    }
}

void requireFinite(double value, const PointId& id, const char* field) {
    if (!std::isfinite(value)) {
        throw InputError("Point '" + id + "' has a non-finite " + field);
    }
}

} // namespace

PointMatcher::PointMatcher(const Config& config)
    : cfg_(config) {}

void PointMatcher::validateGlobal(const std::vector<GlobalPoint>& points) {
    std::vector<PointId> ids;
    ids.reserve(points.size());
    for (const auto& pt : points) {
        ids.push_back(pt.id);
        requireFinite(pt.geodetic.latitude, pt.id, "latitude");
        requireFinite(pt.geodetic.longitude, pt.id, "longitude");
        requireFinite(pt.geodetic.ellipsoidal_height, pt.id, "ellipsoidal height");
        if (std::abs(pt.geodetic.latitude) > 90.0) {
            throw InputError("Point '" + pt.id + "' has latitude outside [-90, 90]");
        }
        if (std::abs(pt.geodetic.longitude) > 180.0) {
            throw InputError("Point '" + pt.id + "' has longitude outside [-180, 180]");
        }
    }
    requireUniqueIds(ids, "global");
}

void PointMatcher::validateLocal(const std::vector<LocalPoint>& points) {
    std::vector<PointId> ids;
    ids.reserve(points.size());
    for (const auto& pt : points) {
        ids.push_back(pt.id);
        requireFinite(pt.local.easting, pt.id, "easting");
        requireFinite(pt.local.northing, pt.id, "northing");
        requireFinite(pt.local.elevation, pt.id, "elevation");
    }
    requireUniqueIds(ids, "local");
}

MatchResult PointMatcher::match(
    const std::vector<GlobalPoint>& global_points,
    const std::vector<LocalPoint>& local_points
) const {
    validateGlobal(global_points);
    validateLocal(local_points);

    std::unordered_map<PointId, const LocalPoint*> local_by_id;
    for (const auto& pt : local_points) {
        local_by_id[pt.id] = &pt;
    }

    MatchResult result;
    std::unordered_set<PointId> matched_ids;
    for (const auto& g : global_points) {
        auto it = local_by_id.find(g.id);
        if (it == local_by_id.end()) {
            result.unmatched_global.push_back(g.id);
            continue;
        }
        PointRecord rec;
        rec.id = g.id;
        rec.geodetic = g.geodetic;
        rec.local = it->second->local;
        result.records.push_back(rec);
        matched_ids.insert(g.id);
    }
    for (const auto& l : local_points) {
        if (matched_ids.count(l.id) == 0) {
            result.unmatched_local.push_back(l.id);
        }
    }

    if (static_cast<int>(result.records.size()) < cfg_.min_matched_points) {
        throw InputError("Found only " + std::to_string(result.records.size()) +
                         " common points. Minimum " + std::to_string(cfg_.min_matched_points) +
                         " are required.");
    }

    if (cfg_.verbose) {
        std::cout << "[PointMatcher] " << result.records.size() << " matched, "
                  << result.unmatched_global.size() << " global-only, "
                  << result.unmatched_local.size() << " local-only\n";
    }

    return result;
}

} // namespace sitecal
