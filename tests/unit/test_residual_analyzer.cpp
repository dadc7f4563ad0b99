/**
 * @file test_residual_analyzer.cpp
 * @brief Unit tests for residuals and fit statistics
 */

#include <sitecal/residual_analyzer.hpp>
#include <sitecal/errors.hpp>
#include <gtest/gtest.h>

#include <cmath>
#include <vector>

namespace sitecal {
namespace {

Residual MakeResidual(const std::string& id, double de, double dn, double dh) {
    Residual r;
    r.id = id;
    r.delta_easting = de;
    r.delta_northing = dn;
    r.delta_elevation = dh;
    return r;
}

PointRecord MakeRecord(const std::string& id, double e, double n, double local_h, double global_h) {
    PointRecord rec;
    rec.id = id;
    rec.local.easting = e;
    rec.local.northing = n;
    rec.local.elevation = local_h;
    rec.geodetic.ellipsoidal_height = global_h;
    return rec;
}

ProjectedPoint MakeProjected(const std::string& id, double e, double n) {
    ProjectedPoint p;
    p.id = id;
    p.easting = e;
    p.northing = n;
    return p;
}

// ============================================================================
// summarize()
// ============================================================================

TEST(ResidualStatisticsTest, RmsWorstBestAndPercentile) {
    std::vector<Residual> residuals = {
        MakeResidual("P1", 3.0, 4.0, 0.1),   // |h| = 5
        MakeResidual("P2", 0.0, 0.0, -0.2),  // |h| = 0
        MakeResidual("P3", 0.6, 0.8, 0.1),   // |h| = 1
    };

    FitStatistics s = ResidualAnalyzer::summarize(residuals);
    EXPECT_NEAR(s.rms_horizontal, std::sqrt(26.0 / 3.0), 1e-12);
    EXPECT_NEAR(s.rms_vertical, std::sqrt(0.06 / 3.0), 1e-12);

    EXPECT_EQ(s.worst_point, "P1");
    EXPECT_NEAR(s.worst_horizontal, 5.0, 1e-12);
    EXPECT_EQ(s.best_point, "P2");
    EXPECT_NEAR(s.best_horizontal, 0.0, 1e-12);

    // Sorted magnitudes {0, 1, 5}: position 0.99 * 2 = 1.98
    EXPECT_NEAR(s.percentile99_horizontal, 1.0 + 0.98 * 4.0, 1e-12);
}

TEST(ResidualStatisticsTest, SampleStandardDeviation) {
    std::vector<Residual> residuals = {
        MakeResidual("P1", 3.0, 1.0, 2.0),
        MakeResidual("P2", 0.0, 1.0, 4.0),
        MakeResidual("P3", 0.6, 1.0, 6.0),
    };

    FitStatistics s = ResidualAnalyzer::summarize(residuals);
    // dE mean 1.2, squared deviations 3.24 + 1.44 + 0.36, n - 1 = 2
    EXPECT_NEAR(s.std_easting, std::sqrt(5.04 / 2.0), 1e-12);
    EXPECT_NEAR(s.std_northing, 0.0, 1e-12);
    EXPECT_NEAR(s.std_elevation, 2.0, 1e-12);
}

TEST(ResidualStatisticsTest, TiesKeepFirstPoint) {
    std::vector<Residual> residuals = {
        MakeResidual("A", 1.0, 0.0, 0.0),
        MakeResidual("B", 0.0, 1.0, 0.0),
        MakeResidual("C", -1.0, 0.0, 0.0),
    };

    FitStatistics s = ResidualAnalyzer::summarize(residuals);
    EXPECT_EQ(s.worst_point, "A");
    EXPECT_EQ(s.best_point, "A");
}

TEST(ResidualStatisticsTest, EmptyInputGivesZeroStatistics) {
    FitStatistics s = ResidualAnalyzer::summarize({});
    EXPECT_EQ(s.rms_horizontal, 0.0);
    EXPECT_EQ(s.rms_vertical, 0.0);
    EXPECT_TRUE(s.worst_point.empty());
}

// ============================================================================
// computeResiduals()
// ============================================================================

class ResidualAnalyzerTest : public ::testing::Test {
protected:
    Config config_;
    ResidualAnalyzer analyzer_{config_};
};

TEST_F(ResidualAnalyzerTest, MeasuredMinusPredicted) {
    TransformParameters params;
    params.horizontal.translation_easting = 100.0;
    params.horizontal.translation_northing = 200.0;
    params.vertical.constant = -30.0;

    std::vector<ProjectedPoint> projected = {
        MakeProjected("P1", 0.0, 0.0),
        MakeProjected("P2", 10.0, 0.0),
        MakeProjected("P3", 0.0, 10.0),
    };
    // P2 sits 2 cm east of its prediction, P3 1 cm low
    std::vector<PointRecord> records = {
        MakeRecord("P1", 100.0, 200.0, 520.0, 550.0),
        MakeRecord("P2", 110.02, 200.0, 530.0, 560.0),
        MakeRecord("P3", 100.0, 210.0, 539.99, 570.0),
    };

    ResidualSummary summary = analyzer_.computeResiduals(projected, records, params);
    ASSERT_EQ(summary.residuals.size(), 3u);

    EXPECT_NEAR(summary.residuals[0].delta_easting, 0.0, 1e-9);
    EXPECT_NEAR(summary.residuals[0].delta_elevation, 0.0, 1e-9);
    EXPECT_NEAR(summary.residuals[1].delta_easting, 0.02, 1e-9);
    EXPECT_NEAR(summary.residuals[1].delta_northing, 0.0, 1e-9);
    EXPECT_NEAR(summary.residuals[2].delta_elevation, -0.01, 1e-9);

    EXPECT_EQ(summary.statistics.worst_point, "P2");
    EXPECT_NEAR(summary.statistics.rms_horizontal, std::sqrt(0.0004 / 3.0), 1e-9);
}

TEST_F(ResidualAnalyzerTest, PerfectFitHasZeroRms) {
    TransformParameters params;
    params.horizontal.a = 0.0;
    params.horizontal.b = 1.0;

    std::vector<ProjectedPoint> projected = {
        MakeProjected("P1", 1.0, 0.0),
        MakeProjected("P2", 0.0, 1.0),
        MakeProjected("P3", 1.0, 1.0),
    };
    std::vector<PointRecord> records = {
        MakeRecord("P1", 0.0, 1.0, 5.0, 5.0),
        MakeRecord("P2", -1.0, 0.0, 5.0, 5.0),
        MakeRecord("P3", -1.0, 1.0, 5.0, 5.0),
    };

    ResidualSummary summary = analyzer_.computeResiduals(projected, records, params);
    EXPECT_NEAR(summary.statistics.rms_horizontal, 0.0, 1e-12);
    EXPECT_NEAR(summary.statistics.rms_vertical, 0.0, 1e-12);
}

TEST_F(ResidualAnalyzerTest, MismatchedInputsThrow) {
    TransformParameters params;
    std::vector<ProjectedPoint> projected = {MakeProjected("P1", 0, 0), MakeProjected("P2", 1, 0)};
    std::vector<PointRecord> one = {MakeRecord("P1", 0, 0, 0, 0)};
    EXPECT_THROW(analyzer_.computeResiduals(projected, one, params), InputError);

    std::vector<PointRecord> swapped = {MakeRecord("P2", 0, 0, 0, 0), MakeRecord("P1", 0, 0, 0, 0)};
    EXPECT_THROW(analyzer_.computeResiduals(projected, swapped, params), InputError);
}

}  // namespace
}  // namespace sitecal
