/**
 * @file example_simple.cpp
 * @brief Simple example showing basic site calibration usage
 */

#include <sitecal/errors.hpp>
#include <sitecal/projection_engine.hpp>
#include <sitecal/site_calibrator.hpp>
#include <iostream>
#include <cmath>

using namespace sitecal;

int main() {
    std::cout << "=== Site Calibration Simple Example ===" << std::endl;
    std::cout << std::endl;

    // Known site grid relation (what the calibration should recover)
    const double rotation_deg = 30.0;
    const double scale = 1.0002;
    const double t_east = 1000.0, t_north = 5000.0;
    const double height_shift = 25.0;

    HorizontalParameters truth;
    truth.a = scale * std::cos(rotation_deg * kDegToRad);
    truth.b = scale * std::sin(rotation_deg * kDegToRad);
    truth.translation_easting = t_east;
    truth.translation_northing = t_north;

    // Simulate GNSS observations on a 3x3 grid (~200 m spacing)
    std::cout << "Simulating control points..." << std::endl;
    std::vector<GlobalPoint> global_points;
    for (int row = 0; row < 3; row++) {
        for (int col = 0; col < 3; col++) {
            GlobalPoint p;
            p.id = "CP" + std::to_string(row * 3 + col + 1);
            p.geodetic.latitude = -33.40 + row * 0.0018;
            p.geodetic.longitude = -70.50 + col * 0.0021;
            p.geodetic.ellipsoidal_height = 600.0 + row * 3.0 - col * 1.5;
            global_points.push_back(p);
        }
    }

    // Project with the same definition the Default method will derive
    // (origin on the first point) and apply the known relation
    Config config;
    ProjectionEngine engine(config);
    TransverseMercatorDefinition definition = engine.resolve(global_points, DefaultProjection{});
    std::vector<ProjectedPoint> projected = engine.projectWith(definition, global_points);

    std::vector<LocalPoint> local_points;
    for (size_t i = 0; i < projected.size(); i++) {
        Eigen::Vector2d grid = truth.apply(projected[i].easting, projected[i].northing);

        LocalPoint p;
        p.id = projected[i].id;
        p.local.easting = grid.x();
        p.local.northing = grid.y();
        p.local.elevation = global_points[i].geodetic.ellipsoidal_height + height_shift;
        local_points.push_back(p);
    }
    std::cout << "  " << global_points.size() << " points, origin at "
              << definition.describe() << std::endl;

    // Calibrate
    std::cout << "\n--- CALIBRATION ---" << std::endl;
    SiteCalibrator calibrator(config);
    FitReport report;
    try {
        report = calibrator.calibrate(global_points, local_points, DefaultProjection{});
    } catch (const CalibrationError& e) {
        std::cerr << "Calibration failed: " << e.what() << std::endl;
        return 1;
    }

    const HorizontalParameters& h = report.parameters.horizontal;
    std::cout << "Rotation: " << h.rotationDegrees() << " deg (expected " << rotation_deg << ")" << std::endl;
    std::cout << "Scale:    " << h.scaleFactor() << " (expected " << scale << ")" << std::endl;
    std::cout << "tE, tN:   " << h.translation_easting << ", " << h.translation_northing << std::endl;
    std::cout << "Vertical shift: " << report.parameters.vertical.constant
              << " m (expected " << height_shift << ")" << std::endl;
    std::cout << report.statistics.toString() << std::endl;

    // Carry a new GNSS point into the site grid
    std::cout << "\n--- TRANSFORM ---" << std::endl;
    GlobalPoint stakeout;
    stakeout.id = "NEW1";
    stakeout.geodetic.latitude = -33.3990;
    stakeout.geodetic.longitude = -70.4985;
    stakeout.geodetic.ellipsoidal_height = 602.0;

    auto transformed = calibrator.transform(report, {stakeout});
    for (const auto& t : transformed) {
        std::cout << t.id << ": E=" << t.easting << " N=" << t.northing
                  << " H=" << t.elevation << std::endl;
    }

    std::cout << "\n=== Example Complete ===" << std::endl;
    return 0;
}
