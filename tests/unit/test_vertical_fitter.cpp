/**
 * @file test_vertical_fitter.cpp
 * @brief Unit tests for the inclined-plane height correction
 */

#include <sitecal/vertical_fitter.hpp>
#include <sitecal/similarity_fitter.hpp>
#include <sitecal/errors.hpp>
#include <gtest/gtest.h>

#include <vector>

namespace sitecal {
namespace {

class VerticalFitterTest : public ::testing::Test {
protected:
    Config config_;
    VerticalFitter fitter_{config_};

    std::vector<Eigen::Vector2d> projected_ = {
        {345100.0, 6300200.0},
        {345420.0, 6300150.0},
        {345300.0, 6300610.0},
        {344980.0, 6300540.0},
        {345210.0, 6300390.0},
    };
};

TEST_F(VerticalFitterTest, RecoversNoiselessPlane) {
    const double C = -28.75, Sn = 2.0e-5, Se = -1.5e-5;
    Eigen::Vector2d c = centroidOf(projected_);

    std::vector<double> global_h, local_h;
    for (size_t i = 0; i < projected_.size(); ++i) {
        double h = 550.0 + static_cast<double>(i);
        Eigen::Vector2d d = projected_[i] - c;
        global_h.push_back(h);
        local_h.push_back(h + C + Sn * d.y() + Se * d.x());
    }

    VerticalParameters fit = fitter_.fitVertical(projected_, local_h, global_h);
    EXPECT_NEAR(fit.constant, C, 1e-9);
    EXPECT_NEAR(fit.slope_north, Sn, 1e-11);
    EXPECT_NEAR(fit.slope_east, Se, 1e-11);
    EXPECT_NEAR(fit.origin_easting, c.x(), 1e-9);
    EXPECT_NEAR(fit.origin_northing, c.y(), 1e-9);

    for (size_t i = 0; i < projected_.size(); ++i) {
        double predicted = fit.correctionAt(projected_[i].x(), projected_[i].y());
        EXPECT_NEAR(predicted, local_h[i] - global_h[i], 1e-9);
    }
}

TEST_F(VerticalFitterTest, ConstantShiftHasZeroSlopes) {
    std::vector<double> global_h = {100, 110, 120, 130, 140};
    std::vector<double> local_h = {75, 85, 95, 105, 115};

    VerticalParameters fit = fitter_.fitVertical(projected_, local_h, global_h);
    EXPECT_NEAR(fit.constant, -25.0, 1e-9);
    EXPECT_NEAR(fit.slope_north, 0.0, 1e-12);
    EXPECT_NEAR(fit.slope_east, 0.0, 1e-12);
}

TEST_F(VerticalFitterTest, ConstantIsCorrectionAtCentroid) {
    std::vector<double> global_h = {10, 20, 30, 40, 50};
    std::vector<double> local_h = {12, 19, 33, 41, 48};

    VerticalParameters fit = fitter_.fitVertical(projected_, local_h, global_h);
    EXPECT_NEAR(fit.correctionAt(fit.origin_easting, fit.origin_northing), fit.constant, 1e-12);
}

TEST_F(VerticalFitterTest, CollinearPositionsAreSingular) {
    std::vector<Eigen::Vector2d> line = {{0, 0}, {1, 1}, {2, 2}, {3, 3}};
    std::vector<double> heights = {1, 2, 3, 4};
    EXPECT_THROW(fitter_.fitVertical(line, heights, heights), NumericError);
}

TEST_F(VerticalFitterTest, SizeMismatchThrows) {
    std::vector<double> short_h = {1, 2};
    std::vector<double> heights = {1, 2, 3, 4, 5};
    EXPECT_THROW(fitter_.fitVertical(projected_, short_h, heights), InputError);
    EXPECT_THROW(fitter_.fitVertical(projected_, heights, short_h), InputError);
}

}  // namespace
}  // namespace sitecal
