/**
 * @file report_writer.cpp
 * @brief Markdown report and calibration JSON
 */

#include "sitecal/report_writer.hpp"
#include "sitecal/errors.hpp"
#include "sitecal/residual_analyzer.hpp"
#include "json_helpers.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <sstream>

using json = nlohmann::json;

namespace sitecal {

namespace {

std::string formatDouble(const char* fmt, double value) {
    char buffer[64];
    snprintf(buffer, sizeof(buffer), fmt, value);
    return std::string(buffer);
}

std::string mm(double meters) {
    return formatDouble("%.1f", meters * 1000.0);
}

std::string joinIds(const std::vector<PointId>& ids) {
    std::string out;
    for (const auto& id : ids) {
        out += (out.empty() ? "`" : ", `") + id + "`";
    }
    return out;
}

} // namespace

std::string currentTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buffer);
}

std::string renderMarkdownReport(const FitReport& report, const Config& config,
                                 const std::string& timestamp) {
    const HorizontalParameters& h = report.parameters.horizontal;
    const VerticalParameters& v = report.parameters.vertical;
    const FitStatistics& s = report.statistics;

    std::string method = toString(report.method());
    for (auto& c : method) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    std::ostringstream md;
    md << "# " << config.report_title << "\n";
    md << "Report generated on: " << timestamp << "\n\n";

    md << "## Calibration Method: " << method << "\n\n";
    md << "- **Projection:** " << report.projection_definition.describe() << "\n";
    md << "- **PROJ definition:** `" << report.projection_definition.toProjString() << "`\n";
    md << "- **Control points:** " << report.residuals.size() << "\n";
    md << "- **Collinearity ratio:** " << formatDouble("%.6g", report.collinearity_ratio) << "\n\n";

    md << "### Horizontal Parameters\n";
    md << "- **a:** `" << formatDouble("%.12f", h.a) << "`\n";
    md << "- **b:** `" << formatDouble("%.12f", h.b) << "`\n";
    md << "- **tE:** `" << formatDouble("%.4f", h.translation_easting) << "` m\n";
    md << "- **tN:** `" << formatDouble("%.4f", h.translation_northing) << "` m\n";
    md << "- **Rotation:** " << formatDouble("%.8f", h.rotationDegrees()) << " deg\n";
    md << "- **Scale factor:** " << formatDouble("%.10f", h.scaleFactor())
       << " (" << formatDouble("%.2f", h.scalePpm()) << " ppm)\n\n";

    md << "### Vertical Parameters\n";
    md << "- **Vertical shift:** `" << formatDouble("%.4f", v.constant) << "` m\n";
    md << "- **Slope north:** `" << formatDouble("%.4e", v.slope_north) << "`\n";
    md << "- **Slope east:** `" << formatDouble("%.4e", v.slope_east) << "`\n";
    md << "- **Centroid:** E " << formatDouble("%.4f", v.origin_easting)
       << ", N " << formatDouble("%.4f", v.origin_northing) << "\n\n";

    md << "### Residuals (mm)\n";
    md << "| Point | dE (mm) | dN (mm) | dH (mm) |\n";
    md << "|:------|--------:|--------:|--------:|\n";
    for (const auto& r : report.residuals) {
        md << "| " << r.id << " | " << mm(r.delta_easting) << " | "
           << mm(r.delta_northing) << " | " << mm(r.delta_elevation) << " |\n";
    }
    md << "\n";

    md << "### Statistics\n";
    md << "- **RMS horizontal:** " << mm(s.rms_horizontal) << " mm\n";
    md << "- **RMS vertical:** " << mm(s.rms_vertical) << " mm\n";
    md << "- **Worst Point:** `" << s.worst_point << "` (Error: " << mm(s.worst_horizontal) << " mm)\n";
    md << "- **Best Point:** `" << s.best_point << "` (Error: " << mm(s.best_horizontal) << " mm)\n";
    md << "- **Standard Deviations (mm):**\n";
    md << "  - `dE`: " << mm(s.std_easting) << " mm\n";
    md << "  - `dN`: " << mm(s.std_northing) << " mm\n";
    md << "  - `dH`: " << mm(s.std_elevation) << " mm\n";
    md << "- **99th Percentile of Horizontal Errors:** " << mm(s.percentile99_horizontal) << " mm\n";

    if (!report.unmatched_global.empty() || !report.unmatched_local.empty()) {
        md << "\n### Unmatched Points\n";
        if (!report.unmatched_global.empty()) {
            md << "- **Global only:** " << joinIds(report.unmatched_global) << "\n";
        }
        if (!report.unmatched_local.empty()) {
            md << "- **Local only:** " << joinIds(report.unmatched_local) << "\n";
        }
    }

    return md.str();
}

std::string calibrationToJson(const FitReport& report) {
    const HorizontalParameters& h = report.parameters.horizontal;
    const VerticalParameters& v = report.parameters.vertical;
    const FitStatistics& s = report.statistics;

    json j;
    j["method"] = toString(report.method());
    j["projection"] = projectionConfigToJson(report.projection);
    j["projection_definition"] = definitionToJson(report.projection_definition);

    j["parameters"]["horizontal"] = {
        {"a", h.a},
        {"b", h.b},
        {"tE", h.translation_easting},
        {"tN", h.translation_northing},
        {"rotation_deg", h.rotationDegrees()},
        {"scale", h.scaleFactor()},
        {"scale_ppm", h.scalePpm()}
    };
    j["parameters"]["vertical"] = {
        {"vertical_shift", v.constant},
        {"slope_north", v.slope_north},
        {"slope_east", v.slope_east},
        {"centroid_north", v.origin_northing},
        {"centroid_east", v.origin_easting}
    };

    j["residuals"] = json::array();
    for (const auto& r : report.residuals) {
        j["residuals"].push_back({
            {"Point", r.id},
            {"dE", r.delta_easting},
            {"dN", r.delta_northing},
            {"dH", r.delta_elevation}
        });
    }

    j["statistics"] = {
        {"rms_horizontal", s.rms_horizontal},
        {"rms_vertical", s.rms_vertical},
        {"worst_point", s.worst_point},
        {"worst_horizontal", s.worst_horizontal},
        {"best_point", s.best_point},
        {"best_horizontal", s.best_horizontal},
        {"std_dE", s.std_easting},
        {"std_dN", s.std_northing},
        {"std_dH", s.std_elevation},
        {"percentile99_horizontal", s.percentile99_horizontal}
    };

    j["collinearity_ratio"] = report.collinearity_ratio;
    j["unmatched_global"] = report.unmatched_global;
    j["unmatched_local"] = report.unmatched_local;

    return j.dump(2) + "\n";
}

namespace {

/// Projection config equivalent to a resolved definition
ProjectionConfig configFromDefinition(const TransverseMercatorDefinition& def) {
    switch (def.method) {
        case ProjectionMethod::UTM:
            return UtmProjection{def.utm_zone, def.utm_hemisphere};
        case ProjectionMethod::LTM: {
            LtmProjection ltm;
            ltm.central_meridian = def.central_meridian;
            ltm.latitude_of_origin = def.latitude_of_origin;
            ltm.false_easting = def.false_easting;
            ltm.false_northing = def.false_northing;
            ltm.scale_factor = def.scale_factor;
            return ltm;
        }
        case ProjectionMethod::DEFAULT:
        default:
            return DefaultProjection{};
    }
}

FitReport calibrationFromJson(const json& j, const std::string& source) {
    FitReport report;
    try {
        report.projection_definition = definitionFromJson(j.at("projection_definition"));
        if (j.contains("projection")) {
            report.projection = projectionConfigFromJson(j.at("projection"));
        } else {
            report.projection = configFromDefinition(report.projection_definition);
        }

        const json& h = j.at("parameters").at("horizontal");
        report.parameters.horizontal.a = h.at("a").get<double>();
        report.parameters.horizontal.b = h.at("b").get<double>();
        report.parameters.horizontal.translation_easting = h.at("tE").get<double>();
        report.parameters.horizontal.translation_northing = h.at("tN").get<double>();

        const json& v = j.at("parameters").at("vertical");
        report.parameters.vertical.constant = v.at("vertical_shift").get<double>();
        report.parameters.vertical.slope_north = v.at("slope_north").get<double>();
        report.parameters.vertical.slope_east = v.at("slope_east").get<double>();
        report.parameters.vertical.origin_northing = v.at("centroid_north").get<double>();
        report.parameters.vertical.origin_easting = v.at("centroid_east").get<double>();

        for (const auto& r : j.value("residuals", json::array())) {
            Residual residual;
            residual.id = r.at("Point").get<std::string>();
            residual.delta_easting = r.at("dE").get<double>();
            residual.delta_northing = r.at("dN").get<double>();
            residual.delta_elevation = r.at("dH").get<double>();
            report.residuals.push_back(residual);
        }

        report.collinearity_ratio = j.value("collinearity_ratio", 0.0);
        report.unmatched_global = j.value("unmatched_global", std::vector<PointId>());
        report.unmatched_local = j.value("unmatched_local", std::vector<PointId>());
    } catch (const json::exception& e) {
        throw InputError("Invalid calibration file " + source + ": " + e.what());
    }

    if (report.parameters.horizontal.scaleFactor() <= 0.0) {
        throw InputError("Invalid calibration file " + source + ": zero scale factor");
    }

    report.statistics = ResidualAnalyzer::summarize(report.residuals);
    return report;
}

} // namespace

FitReport parseCalibrationJson(const std::string& text, const std::string& source) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        throw InputError("Malformed JSON in " + source + ": " + e.what());
    }
    return calibrationFromJson(j, source);
}

FitReport readCalibrationJson(const std::string& path) {
    return calibrationFromJson(readJsonFile(path), path);
}

} // namespace sitecal
