/**
 * @file point_matcher.hpp
 * @brief Pairs global and local control points by identifier
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include <vector>

namespace sitecal {

/**
 * @brief Matched set plus the identifiers that found no partner
 */
struct MatchResult {
    std::vector<PointRecord> records;      ///< Global file order
    std::vector<PointId> unmatched_global;
    std::vector<PointId> unmatched_local;
};

class PointMatcher {
public:
    explicit PointMatcher(const Config& config);

    /**
     * @brief Match by exact identifier equality
     *
     * @throws InputError on duplicate or empty identifiers, non-finite or
     *         out-of-range coordinates, or fewer than min_matched_points matches
     */
    MatchResult match(
        const std::vector<GlobalPoint>& global_points,
        const std::vector<LocalPoint>& local_points
    ) const;

    /**
     * @brief Validate the global collection on its own
     *
     * Used before projecting points that are not part of a calibration.
     */
    static void validateGlobal(const std::vector<GlobalPoint>& points);

    /**
     * @brief Validate the local collection on its own
     */
    static void validateLocal(const std::vector<LocalPoint>& points);

private:
    const Config& cfg_;
};

} // namespace sitecal
