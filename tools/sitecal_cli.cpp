/**
 * @file sitecal_cli.cpp
 * @brief Command line front end for site calibration
 *
 * Commands:
 *   local2global  Fit a calibration from matched global/local control points
 *   transform     Apply a stored calibration to global points
 *   version       Print the tool version
 */

#include "sitecal/config.hpp"
#include "sitecal/csv_io.hpp"
#include "sitecal/errors.hpp"
#include "sitecal/projection_config.hpp"
#include "sitecal/report_writer.hpp"
#include "sitecal/site_calibrator.hpp"

#include <cstdio>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef SITECAL_VERSION
#define SITECAL_VERSION "0.0.0"
#endif

using namespace sitecal;

namespace {

// Exit codes
constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitInput = 2;
constexpr int kExitProjection = 3;
constexpr int kExitGeometry = 4;
constexpr int kExitNumeric = 5;

/**
 * @brief Malformed command line
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message)
        : std::runtime_error(message) {}
};

struct Local2GlobalOptions {
    std::string global_csv;
    std::string local_csv;
    std::string config_path;
    std::string output_report = "calibration_report.md";
    std::string output_csv;
    std::string output_json;

    std::optional<std::string> method;
    std::optional<double> central_meridian;
    std::optional<double> latitude_of_origin;
    std::optional<double> false_easting;
    std::optional<double> false_northing;
    std::optional<double> scale_factor;
    std::optional<int> utm_zone;
    std::optional<std::string> utm_hemisphere;

    bool verbose = false;
};

struct TransformOptions {
    std::string calibration;
    std::string global_csv;
    std::string output_csv;
};

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " <command> [options]\n\n"
              << "Commands:\n"
              << "  local2global   Compute a site calibration from control points\n"
              << "  transform      Apply a saved calibration to global points\n"
              << "  version        Print version\n\n"
              << "local2global options:\n"
              << "  --global-csv <path>          Point,Latitude,Longitude,EllipsoidalHeight (required)\n"
              << "  --local-csv <path>           Point,Easting,Northing,Elevation (required)\n"
              << "  --method <name>              default | utm | ltm (default: default)\n"
              << "  --central-meridian <deg>     LTM central meridian\n"
              << "  --latitude-of-origin <deg>   LTM latitude of origin\n"
              << "  --false-easting <m>          LTM false easting\n"
              << "  --false-northing <m>         LTM false northing\n"
              << "  --scale-factor <k>           LTM scale factor\n"
              << "  --utm-zone <n>               Force UTM zone (1-60)\n"
              << "  --utm-hemisphere <h>         Force UTM hemisphere (north | south)\n"
              << "  --config <path>              JSON config (tunables and \"projection\")\n"
              << "  --output-report <path>       Markdown report (default: calibration_report.md)\n"
              << "  --output-csv <path>          Transformed global points\n"
              << "  --output-json <path>         Calibration for later 'transform' runs\n"
              << "  --verbose                    Print pipeline progress\n\n"
              << "transform options:\n"
              << "  --calibration <path>         JSON written by local2global --output-json (required)\n"
              << "  --global-csv <path>          Points to transform (required)\n"
              << "  --output-csv <path>          Output CSV (required)\n\n"
              << "Example:\n"
              << "  " << prog << " local2global --global-csv gnss.csv --local-csv site.csv --method utm\n"
              << "  " << prog << " local2global --global-csv gnss.csv --local-csv site.csv --method ltm \\\n"
              << "      --central-meridian -70.5 --latitude-of-origin 0 --false-easting 500000 \\\n"
              << "      --false-northing 10000000 --scale-factor 1.0\n";
}

double parseDouble(const std::string& flag, const std::string& text) {
    try {
        size_t pos = 0;
        double value = std::stod(text, &pos);
        if (pos == text.size()) {
            return value;
        }
    } catch (const std::logic_error&) {
        // fall through to the usage error below
    }
    throw UsageError("Invalid number for " + flag + ": '" + text + "'");
}

int parseInt(const std::string& flag, const std::string& text) {
    try {
        size_t pos = 0;
        int value = std::stoi(text, &pos);
        if (pos == text.size()) {
            return value;
        }
    } catch (const std::logic_error&) {
        // fall through to the usage error below
    }
    throw UsageError("Invalid integer for " + flag + ": '" + text + "'");
}

Local2GlobalOptions parseLocal2Global(int argc, char* argv[]) {
    Local2GlobalOptions opts;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--global-csv" && has_value) {
            opts.global_csv = argv[++i];
        } else if (arg == "--local-csv" && has_value) {
            opts.local_csv = argv[++i];
        } else if (arg == "--method" && has_value) {
            opts.method = argv[++i];
        } else if (arg == "--central-meridian" && has_value) {
            opts.central_meridian = parseDouble(arg, argv[++i]);
        } else if (arg == "--latitude-of-origin" && has_value) {
            opts.latitude_of_origin = parseDouble(arg, argv[++i]);
        } else if (arg == "--false-easting" && has_value) {
            opts.false_easting = parseDouble(arg, argv[++i]);
        } else if (arg == "--false-northing" && has_value) {
            opts.false_northing = parseDouble(arg, argv[++i]);
        } else if (arg == "--scale-factor" && has_value) {
            opts.scale_factor = parseDouble(arg, argv[++i]);
        } else if (arg == "--utm-zone" && has_value) {
            opts.utm_zone = parseInt(arg, argv[++i]);
        } else if (arg == "--utm-hemisphere" && has_value) {
            opts.utm_hemisphere = argv[++i];
        } else if (arg == "--config" && has_value) {
            opts.config_path = argv[++i];
        } else if (arg == "--output-report" && has_value) {
            opts.output_report = argv[++i];
        } else if (arg == "--output-csv" && has_value) {
            opts.output_csv = argv[++i];
        } else if (arg == "--output-json" && has_value) {
            opts.output_json = argv[++i];
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw UsageError("Unknown argument: " + arg);
        }
    }

    if (opts.global_csv.empty()) {
        throw UsageError("--global-csv is required");
    }
    if (opts.local_csv.empty()) {
        throw UsageError("--local-csv is required");
    }
    return opts;
}

TransformOptions parseTransform(int argc, char* argv[]) {
    TransformOptions opts;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--calibration" && has_value) {
            opts.calibration = argv[++i];
        } else if (arg == "--global-csv" && has_value) {
            opts.global_csv = argv[++i];
        } else if (arg == "--output-csv" && has_value) {
            opts.output_csv = argv[++i];
        } else {
            throw UsageError("Unknown argument: " + arg);
        }
    }

    if (opts.calibration.empty() || opts.global_csv.empty() || opts.output_csv.empty()) {
        throw UsageError("--calibration, --global-csv and --output-csv are required");
    }
    return opts;
}

/**
 * @brief Combine the config file "projection" section with command line flags
 *
 * Flags win over the file. LTM needs all five parameters after merging.
 */
ProjectionConfig resolveProjection(const Local2GlobalOptions& opts,
                                   const std::optional<ProjectionConfig>& from_file) {
    ProjectionMethod method = ProjectionMethod::DEFAULT;
    if (opts.method) {
        method = parseProjectionMethod(*opts.method);
    } else if (from_file) {
        method = methodOf(*from_file);
    }

    switch (method) {
        case ProjectionMethod::UTM: {
            UtmProjection utm;
            if (from_file) {
                if (const auto* base = std::get_if<UtmProjection>(&*from_file)) {
                    utm = *base;
                }
            }
            if (opts.utm_zone) {
                utm.zone = opts.utm_zone;
            }
            if (opts.utm_hemisphere) {
                utm.hemisphere = parseHemisphere(*opts.utm_hemisphere);
            }
            return utm;
        }
        case ProjectionMethod::LTM: {
            std::optional<double> cm = opts.central_meridian;
            std::optional<double> lat0 = opts.latitude_of_origin;
            std::optional<double> fe = opts.false_easting;
            std::optional<double> fn = opts.false_northing;
            std::optional<double> k = opts.scale_factor;
            if (from_file) {
                if (const auto* base = std::get_if<LtmProjection>(&*from_file)) {
                    if (!cm) cm = base->central_meridian;
                    if (!lat0) lat0 = base->latitude_of_origin;
                    if (!fe) fe = base->false_easting;
                    if (!fn) fn = base->false_northing;
                    if (!k) k = base->scale_factor;
                }
            }

            std::string missing;
            auto require = [&missing](const std::optional<double>& v, const char* flag) {
                if (!v) {
                    missing += (missing.empty() ? "" : ", ") + std::string(flag);
                }
            };
            require(cm, "--central-meridian");
            require(lat0, "--latitude-of-origin");
            require(fe, "--false-easting");
            require(fn, "--false-northing");
            require(k, "--scale-factor");
            if (!missing.empty()) {
                throw ProjectionError("LTM method requires: " + missing);
            }

            LtmProjection ltm;
            ltm.central_meridian = *cm;
            ltm.latitude_of_origin = *lat0;
            ltm.false_easting = *fe;
            ltm.false_northing = *fn;
            ltm.scale_factor = *k;
            return ltm;
        }
        case ProjectionMethod::DEFAULT:
        default:
            return DefaultProjection{};
    }
}

void printSummary(const FitReport& report) {
    const HorizontalParameters& h = report.parameters.horizontal;
    const FitStatistics& s = report.statistics;

    printf("\n=== Calibration ===\n");
    printf("Projection:     %s\n", report.projection_definition.describe().c_str());
    printf("Points:         %zu\n", report.residuals.size());
    printf("Rotation:       %.6f deg\n", h.rotationDegrees());
    printf("Scale:          %.9f (%.2f ppm)\n", h.scaleFactor(), h.scalePpm());
    printf("RMS horizontal: %.4f m\n", s.rms_horizontal);
    printf("RMS vertical:   %.4f m\n", s.rms_vertical);
    printf("Worst point:    %s (%.4f m)\n", s.worst_point.c_str(), s.worst_horizontal);

    if (!report.unmatched_global.empty() || !report.unmatched_local.empty()) {
        std::cerr << "WARNING: " << report.unmatched_global.size()
                  << " global and " << report.unmatched_local.size()
                  << " local points have no counterpart\n";
    }
}

int runLocal2Global(const Local2GlobalOptions& opts) {
    Config config;
    std::optional<ProjectionConfig> file_projection;
    if (!opts.config_path.empty()) {
        config = loadConfig(opts.config_path);
        file_projection = loadProjectionConfig(opts.config_path);
    }
    if (opts.verbose) {
        config.verbose = true;
    }

    ProjectionConfig projection = resolveProjection(opts, file_projection);

    std::cout << "Loading global points from: " << opts.global_csv << "\n";
    std::vector<GlobalPoint> global_points = readGlobalCsv(opts.global_csv);
    std::cout << "Loading local points from: " << opts.local_csv << "\n";
    std::vector<LocalPoint> local_points = readLocalCsv(opts.local_csv);
    std::cout << "Loaded " << global_points.size() << " global and "
              << local_points.size() << " local points\n";

    SiteCalibrator calibrator(config);
    FitReport report = calibrator.calibrate(global_points, local_points, projection);

    // Everything is rendered before the first byte is written
    std::vector<OutputFile> outputs;
    outputs.push_back({opts.output_report, renderMarkdownReport(report, config, currentTimestamp())});
    if (!opts.output_csv.empty()) {
        outputs.push_back({opts.output_csv,
                           formatTransformedCsv(calibrator.transform(report, global_points))});
    }
    if (!opts.output_json.empty()) {
        outputs.push_back({opts.output_json, calibrationToJson(report)});
    }
    writeOutputFiles(outputs);

    printSummary(report);
    for (const auto& out : outputs) {
        std::cout << "Wrote " << out.path << "\n";
    }
    return kExitOk;
}

int runTransform(const TransformOptions& opts) {
    std::cout << "Loading calibration from: " << opts.calibration << "\n";
    FitReport report = readCalibrationJson(opts.calibration);
    std::vector<GlobalPoint> global_points = readGlobalCsv(opts.global_csv);

    SiteCalibrator calibrator;
    std::vector<TransformedPoint> transformed = calibrator.transform(report, global_points);
    writeOutputFiles({{opts.output_csv, formatTransformedCsv(transformed)}});

    std::cout << "Transformed " << transformed.size() << " points ("
              << report.projection_definition.describe() << ")\n";
    std::cout << "Wrote " << opts.output_csv << "\n";
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return kExitUsage;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        printUsage(argv[0]);
        return kExitOk;
    }

    try {
        if (command == "local2global") {
            return runLocal2Global(parseLocal2Global(argc, argv));
        } else if (command == "transform") {
            return runTransform(parseTransform(argc, argv));
        } else if (command == "version" || command == "--version") {
            std::cout << "sitecal " << SITECAL_VERSION << "\n";
            return kExitOk;
        }
        throw UsageError("Unknown command: " + command);
    } catch (const UsageError& e) {
        std::cerr << "ERROR: " << e.what() << "\n\n";
        printUsage(argv[0]);
        return kExitUsage;
    } catch (const InputError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return kExitInput;
    } catch (const ProjectionError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return kExitProjection;
    } catch (const GeometryError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return kExitGeometry;
    } catch (const NumericError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return kExitNumeric;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return kExitUsage;
    }
}
