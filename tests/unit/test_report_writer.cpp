/**
 * @file test_report_writer.cpp
 * @brief Unit tests for the Markdown report and calibration JSON
 */

#include <sitecal/report_writer.hpp>
#include <sitecal/residual_analyzer.hpp>
#include <sitecal/errors.hpp>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

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

/// Hand-built UTM report with two residuals and unmatched points
FitReport MakeReport() {
    FitReport report;
    UtmProjection utm;
    utm.hemisphere = Hemisphere::SOUTH;
    report.projection = utm;

    report.projection_definition.method = ProjectionMethod::UTM;
    report.projection_definition.central_meridian = -69.0;
    report.projection_definition.scale_factor = 0.9996;
    report.projection_definition.false_easting = 500000.0;
    report.projection_definition.false_northing = 10000000.0;
    report.projection_definition.utm_zone = 19;
    report.projection_definition.utm_hemisphere = Hemisphere::SOUTH;

    report.parameters.horizontal.a = 0.97;
    report.parameters.horizontal.b = 0.25;
    report.parameters.horizontal.translation_easting = -341234.5678;
    report.parameters.horizontal.translation_northing = -6298765.4321;
    report.parameters.vertical.constant = -28.75;
    report.parameters.vertical.slope_north = 2e-5;
    report.parameters.vertical.slope_east = -1e-5;
    report.parameters.vertical.origin_easting = 345000.0;
    report.parameters.vertical.origin_northing = 6300000.0;

    report.residuals = {
        MakeResidual("CP1", 0.001, -0.002, 0.0005),
        MakeResidual("CP2", -0.003, 0.004, -0.001),
    };
    report.statistics = ResidualAnalyzer::summarize(report.residuals);
    report.collinearity_ratio = 0.42;
    report.unmatched_global = {"BASE"};
    report.unmatched_local = {"BM7"};
    return report;
}

// ============================================================================
// Markdown
// ============================================================================

TEST(MarkdownReportTest, ContainsSectionsAndMillimetreResiduals) {
    Config config;
    std::string md = renderMarkdownReport(MakeReport(), config, "2024-01-02 03:04:05");

    EXPECT_EQ(md.rfind("# Site Calibration Report\n", 0), 0u);
    EXPECT_NE(md.find("Report generated on: 2024-01-02 03:04:05"), std::string::npos);
    EXPECT_NE(md.find("## Calibration Method: UTM"), std::string::npos);
    EXPECT_NE(md.find("UTM zone 19 south"), std::string::npos);
    EXPECT_NE(md.find("| Point | dE (mm) | dN (mm) | dH (mm) |"), std::string::npos);
    EXPECT_NE(md.find("| CP1 | 1.0 | -2.0 | 0.5 |"), std::string::npos);
    EXPECT_NE(md.find("| CP2 | -3.0 | 4.0 | -1.0 |"), std::string::npos);
    EXPECT_NE(md.find("**Worst Point:** `CP2` (Error: 5.0 mm)"), std::string::npos);
    EXPECT_NE(md.find("**Best Point:** `CP1`"), std::string::npos);
    EXPECT_NE(md.find("99th Percentile"), std::string::npos);
    EXPECT_NE(md.find("**Global only:** `BASE`"), std::string::npos);
    EXPECT_NE(md.find("**Local only:** `BM7`"), std::string::npos);
}

TEST(MarkdownReportTest, UsesConfiguredTitle) {
    Config config;
    config.report_title = "Mine Site North Calibration";
    std::string md = renderMarkdownReport(MakeReport(), config, "now");
    EXPECT_EQ(md.rfind("# Mine Site North Calibration\n", 0), 0u);
}

TEST(MarkdownReportTest, OmitsUnmatchedSectionWhenAllMatched) {
    FitReport report = MakeReport();
    report.unmatched_global.clear();
    report.unmatched_local.clear();
    std::string md = renderMarkdownReport(report, Config(), "now");
    EXPECT_EQ(md.find("Unmatched Points"), std::string::npos);
}

TEST(MarkdownReportTest, TimestampFormat) {
    std::string ts = currentTimestamp();
    ASSERT_EQ(ts.size(), 19u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], ' ');
    EXPECT_EQ(ts[13], ':');
}

// ============================================================================
// Calibration JSON
// ============================================================================

TEST(CalibrationJsonTest, ReloadRestoresTransformInputs) {
    FitReport original = MakeReport();
    FitReport loaded = parseCalibrationJson(calibrationToJson(original), "calibration.json");

    EXPECT_EQ(loaded.method(), ProjectionMethod::UTM);
    EXPECT_EQ(*loaded.projection_definition.utm_zone, 19);
    EXPECT_EQ(*loaded.projection_definition.utm_hemisphere, Hemisphere::SOUTH);
    EXPECT_DOUBLE_EQ(loaded.projection_definition.false_northing, 10000000.0);
    EXPECT_EQ(loaded.projection_definition.toProjString(),
              original.projection_definition.toProjString());

    EXPECT_DOUBLE_EQ(loaded.parameters.horizontal.a, 0.97);
    EXPECT_DOUBLE_EQ(loaded.parameters.horizontal.translation_northing, -6298765.4321);
    EXPECT_DOUBLE_EQ(loaded.parameters.vertical.slope_east, -1e-5);
    EXPECT_DOUBLE_EQ(loaded.parameters.vertical.origin_northing, 6300000.0);

    ASSERT_EQ(loaded.residuals.size(), 2u);
    EXPECT_EQ(loaded.statistics.worst_point, "CP2");
    EXPECT_EQ(loaded.unmatched_local, original.unmatched_local);
}

TEST(CalibrationJsonTest, ProjectionSectionIsOptional) {
    std::string text = R"({
        "projection_definition": {
            "method": "ltm", "latitude_of_origin": 0, "central_meridian": -70.5,
            "scale_factor": 1.0, "false_easting": 500000, "false_northing": 10000000
        },
        "parameters": {
            "horizontal": {"a": 1, "b": 0, "tE": 0, "tN": 0},
            "vertical": {"vertical_shift": 0, "slope_north": 0, "slope_east": 0,
                         "centroid_north": 0, "centroid_east": 0}
        }
    })";
    FitReport loaded = parseCalibrationJson(text, "calibration.json");
    EXPECT_EQ(loaded.method(), ProjectionMethod::LTM);
    EXPECT_TRUE(loaded.residuals.empty());
}

TEST(CalibrationJsonTest, MalformedDocumentThrows) {
    EXPECT_THROW(parseCalibrationJson("{not json", "c.json"), InputError);
    EXPECT_THROW(parseCalibrationJson("{}", "c.json"), InputError);
    EXPECT_THROW(parseCalibrationJson("[1, 2]", "c.json"), InputError);
}

TEST(CalibrationJsonTest, MissingParameterThrows) {
    FitReport report = MakeReport();
    std::string text = calibrationToJson(report);
    std::string broken = text;
    broken.replace(broken.find("\"tE\""), 4, "\"tX\"");
    EXPECT_THROW(parseCalibrationJson(broken, "c.json"), InputError);
}

TEST(CalibrationJsonTest, ReadsFromFile) {
    fs::path path = fs::temp_directory_path() / "sitecal_calibration_test.json";
    {
        std::ofstream out(path);
        out << calibrationToJson(MakeReport());
    }
    FitReport loaded = readCalibrationJson(path.string());
    EXPECT_DOUBLE_EQ(loaded.parameters.horizontal.b, 0.25);
    fs::remove(path);

    EXPECT_THROW(readCalibrationJson(path.string()), InputError);
}

}  // namespace
}  // namespace sitecal
