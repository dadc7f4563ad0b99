/**
 * @file residual_analyzer.cpp
 * @brief Implementation of residual computation and statistics
 */

#include "sitecal/residual_analyzer.hpp"
#include "sitecal/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace sitecal {

namespace {

double sampleStdDev(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    double mean = 0.0;
    for (double v : values) {
        mean += v;
    }
    mean /= values.size();

    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / (values.size() - 1));
}

/// Linear interpolation between order statistics
double percentile(std::vector<double> values, double q) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    double pos = q * (values.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(pos));
    size_t hi = std::min(lo + 1, values.size() - 1);
    double frac = pos - lo;
    return values[lo] + frac * (values[hi] - values[lo]);
}

} // namespace

ResidualAnalyzer::ResidualAnalyzer(const Config& config)
    : cfg_(config) {}

ResidualSummary ResidualAnalyzer::computeResiduals(
    const std::vector<ProjectedPoint>& projected,
    const std::vector<PointRecord>& records,
    const TransformParameters& params
) const {
    if (projected.size() != records.size()) {
        throw InputError("Residual analysis needs one record per projected point");
    }

    ResidualSummary summary;
    summary.residuals.reserve(records.size());

    for (size_t i = 0; i < records.size(); ++i) {
        const ProjectedPoint& p = projected[i];
        const PointRecord& rec = records[i];
        if (p.id != rec.id) {
            throw InputError("Projected point '" + p.id + "' does not match record '" + rec.id + "'");
        }

        Eigen::Vector2d predicted = params.horizontal.apply(p.easting, p.northing);
        double z_err = rec.local.elevation - rec.geodetic.ellipsoidal_height;
        double z_pred = params.vertical.correctionAt(p.easting, p.northing);

        Residual r;
        r.id = rec.id;
        r.delta_easting = rec.local.easting - predicted.x();
        r.delta_northing = rec.local.northing - predicted.y();
        r.delta_elevation = z_err - z_pred;
        summary.residuals.push_back(r);
    }

    summary.statistics = summarize(summary.residuals);

    if (cfg_.verbose) {
        std::cout << "[ResidualAnalyzer] " << summary.statistics.toString() << "\n";
    }

    return summary;
}

FitStatistics ResidualAnalyzer::summarize(const std::vector<Residual>& residuals) {
    FitStatistics stats;
    if (residuals.empty()) {
        return stats;
    }

    std::vector<double> de, dn, dh, horizontal;
    de.reserve(residuals.size());
    dn.reserve(residuals.size());
    dh.reserve(residuals.size());
    horizontal.reserve(residuals.size());

    double sum_h = 0.0;
    double sum_v = 0.0;
    size_t worst = 0;
    size_t best = 0;

    for (size_t i = 0; i < residuals.size(); ++i) {
        const Residual& r = residuals[i];
        sum_h += r.delta_easting * r.delta_easting + r.delta_northing * r.delta_northing;
        sum_v += r.delta_elevation * r.delta_elevation;

        de.push_back(r.delta_easting);
        dn.push_back(r.delta_northing);
        dh.push_back(r.delta_elevation);
        horizontal.push_back(r.horizontal());

        // Strict comparisons keep the first point on ties
        if (horizontal[i] > horizontal[worst]) {
            worst = i;
        }
        if (horizontal[i] < horizontal[best]) {
            best = i;
        }
    }

    double n = static_cast<double>(residuals.size());
    stats.rms_horizontal = std::sqrt(sum_h / n);
    stats.rms_vertical = std::sqrt(sum_v / n);

    stats.worst_point = residuals[worst].id;
    stats.worst_horizontal = horizontal[worst];
    stats.best_point = residuals[best].id;
    stats.best_horizontal = horizontal[best];

    stats.std_easting = sampleStdDev(de);
    stats.std_northing = sampleStdDev(dn);
    stats.std_elevation = sampleStdDev(dh);
    stats.percentile99_horizontal = percentile(horizontal, 0.99);

    return stats;
}

} // namespace sitecal
