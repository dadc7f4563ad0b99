/**
 * @file site_calibrator.cpp
 * @brief Implementation of the site calibration pipeline
 */

#include "sitecal/site_calibrator.hpp"
#include "sitecal/point_matcher.hpp"
#include "sitecal/projection_engine.hpp"
#include "sitecal/geometry_validator.hpp"
#include "sitecal/similarity_fitter.hpp"
#include "sitecal/vertical_fitter.hpp"
#include "sitecal/residual_analyzer.hpp"
#include <iostream>
#include <unordered_map>

namespace sitecal {

SiteCalibrator::SiteCalibrator(const Config& config)
    : cfg_(config) {

    // Components reference the member copy, not the parameter
    matcher_ = std::make_unique<PointMatcher>(cfg_);
    projection_ = std::make_unique<ProjectionEngine>(cfg_);
    validator_ = std::make_unique<GeometryValidator>(cfg_);
    horizontal_fitter_ = std::make_unique<SimilarityFitter>(cfg_);
    vertical_fitter_ = std::make_unique<VerticalFitter>(cfg_);
    analyzer_ = std::make_unique<ResidualAnalyzer>(cfg_);
}

SiteCalibrator::~SiteCalibrator() = default;

FitReport SiteCalibrator::calibrate(
    const std::vector<GlobalPoint>& global_points,
    const std::vector<LocalPoint>& local_points,
    const ProjectionConfig& projection
) const {
    // Input errors surface before any projection is attempted
    MatchResult matched = matcher_->match(global_points, local_points);

    TransverseMercatorDefinition definition = projection_->resolve(global_points, projection);
    std::vector<ProjectedPoint> all_projected = projection_->projectWith(definition, global_points);

    std::unordered_map<PointId, const ProjectedPoint*> projected_by_id;
    for (const auto& p : all_projected) {
        projected_by_id[p.id] = &p;
    }

    std::vector<ProjectedPoint> projected;
    std::vector<Eigen::Vector2d> projected_xy;
    std::vector<Eigen::Vector2d> local_xy;
    std::vector<double> local_heights;
    std::vector<double> global_heights;
    projected.reserve(matched.records.size());
    projected_xy.reserve(matched.records.size());
    local_xy.reserve(matched.records.size());
    local_heights.reserve(matched.records.size());
    global_heights.reserve(matched.records.size());

    for (const auto& rec : matched.records) {
        const ProjectedPoint& p = *projected_by_id.at(rec.id);
        projected.push_back(p);
        projected_xy.push_back(p.xy());
        local_xy.emplace_back(rec.local.easting, rec.local.northing);
        local_heights.push_back(rec.local.elevation);
        global_heights.push_back(rec.geodetic.ellipsoidal_height);
    }

    CollinearityCheck geometry = validator_->validate(projected);

    FitReport report;
    report.projection = projection;
    report.projection_definition = definition;
    report.collinearity_ratio = geometry.ratio;
    report.parameters.horizontal = horizontal_fitter_->fitHorizontal(projected_xy, local_xy);
    report.parameters.vertical = vertical_fitter_->fitVertical(projected_xy, local_heights, global_heights);

    ResidualSummary summary = analyzer_->computeResiduals(projected, matched.records, report.parameters);
    report.residuals = std::move(summary.residuals);
    report.statistics = summary.statistics;
    report.projected_points = std::move(projected);
    report.unmatched_global = std::move(matched.unmatched_global);
    report.unmatched_local = std::move(matched.unmatched_local);

    if (cfg_.verbose) {
        std::cout << "[SiteCalibrator] " << definition.describe() << ", "
                  << report.residuals.size() << " points, rotation="
                  << report.parameters.horizontal.rotationDegrees() << " deg, scale="
                  << report.parameters.horizontal.scaleFactor() << "\n";
    }

    return report;
}

std::vector<TransformedPoint> SiteCalibrator::transform(
    const FitReport& report,
    const std::vector<GlobalPoint>& global_points
) const {
    PointMatcher::validateGlobal(global_points);

    std::vector<ProjectedPoint> projected =
        projection_->projectWith(report.projection_definition, global_points);

    const HorizontalParameters& h = report.parameters.horizontal;
    const VerticalParameters& v = report.parameters.vertical;

    std::vector<TransformedPoint> result;
    result.reserve(projected.size());
    for (size_t i = 0; i < projected.size(); ++i) {
        const ProjectedPoint& p = projected[i];
        Eigen::Vector2d grid = h.apply(p.easting, p.northing);

        TransformedPoint t;
        t.id = p.id;
        t.projected_easting = p.easting;
        t.projected_northing = p.northing;
        t.easting = grid.x();
        t.northing = grid.y();
        // Zerr = h_local - h_global
        t.elevation = global_points[i].geodetic.ellipsoidal_height + v.correctionAt(p.easting, p.northing);
        result.push_back(t);
    }
    return result;
}

} // namespace sitecal
