/**
 * @file config.cpp
 * @brief JSON configuration loading
 */

#include "sitecal/config.hpp"
#include "sitecal/errors.hpp"
#include "json_helpers.hpp"
#include <fstream>

using json = nlohmann::json;

namespace sitecal {

namespace {

double requireNumber(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        throw ProjectionError(std::string("Missing required LTM parameter '") + key + "'");
    }
    if (!j.at(key).is_number()) {
        throw ProjectionError(std::string("LTM parameter '") + key + "' must be a number");
    }
    return j.at(key).get<double>();
}

} // namespace

json readJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw InputError("Cannot open JSON file: " + path);
    }
    try {
        json j;
        file >> j;
        return j;
    } catch (const json::exception& e) {
        throw InputError("Malformed JSON in " + path + ": " + e.what());
    }
}

Config loadConfig(const std::string& path) {
    json j = readJsonFile(path);
    if (!j.is_object()) {
        throw InputError("Config file must contain a JSON object: " + path);
    }

    Config config;
    try {
        config.min_matched_points = j.value("min_matched_points", config.min_matched_points);
        config.collinearity_ratio_threshold =
            j.value("collinearity_ratio_threshold", config.collinearity_ratio_threshold);
        config.singular_rcond_threshold =
            j.value("singular_rcond_threshold", config.singular_rcond_threshold);
        config.min_scale_factor = j.value("min_scale_factor", config.min_scale_factor);
        config.ellipsoid = j.value("ellipsoid", config.ellipsoid);
        config.report_title = j.value("report_title", config.report_title);
        config.verbose = j.value("verbose", config.verbose);
    } catch (const json::exception& e) {
        throw InputError("Invalid value in config " + path + ": " + e.what());
    }

    if (config.min_matched_points < 3) {
        throw InputError("min_matched_points must be at least 3");
    }
    if (config.collinearity_ratio_threshold < 0.0 || config.collinearity_ratio_threshold >= 1.0) {
        throw InputError("collinearity_ratio_threshold must be in [0, 1)");
    }
    if (!(config.min_scale_factor > 0.0)) {
        throw InputError("min_scale_factor must be positive");
    }
    return config;
}

std::optional<ProjectionConfig> loadProjectionConfig(const std::string& path) {
    json j = readJsonFile(path);
    if (!j.is_object() || !j.contains("projection")) {
        return std::nullopt;
    }
    return projectionConfigFromJson(j.at("projection"));
}

ProjectionConfig projectionConfigFromJson(const json& j) {
    if (!j.is_object()) {
        throw ProjectionError("\"projection\" must be a JSON object");
    }

    std::string tag = "default";
    if (j.contains("method")) {
        if (!j.at("method").is_string()) {
            throw ProjectionError("\"method\" must be a string");
        }
        tag = j.at("method").get<std::string>();
    }

    switch (parseProjectionMethod(tag)) {
        case ProjectionMethod::UTM: {
            UtmProjection utm;
            if (j.contains("utm_zone") && !j.at("utm_zone").is_null()) {
                if (!j.at("utm_zone").is_number_integer()) {
                    throw ProjectionError("\"utm_zone\" must be an integer");
                }
                utm.zone = j.at("utm_zone").get<int>();
            }
            if (j.contains("utm_hemisphere") && !j.at("utm_hemisphere").is_null()) {
                if (!j.at("utm_hemisphere").is_string()) {
                    throw ProjectionError("\"utm_hemisphere\" must be a string");
                }
                utm.hemisphere = parseHemisphere(j.at("utm_hemisphere").get<std::string>());
            }
            return utm;
        }
        case ProjectionMethod::LTM: {
            LtmProjection ltm;
            ltm.central_meridian = requireNumber(j, "central_meridian");
            ltm.latitude_of_origin = requireNumber(j, "latitude_of_origin");
            ltm.false_easting = requireNumber(j, "false_easting");
            ltm.false_northing = requireNumber(j, "false_northing");
            ltm.scale_factor = requireNumber(j, "scale_factor");
            return ltm;
        }
        case ProjectionMethod::DEFAULT:
        default:
            return DefaultProjection{};
    }
}

json projectionConfigToJson(const ProjectionConfig& config) {
    json j;
    j["method"] = toString(methodOf(config));
    if (const auto* utm = std::get_if<UtmProjection>(&config)) {
        j["utm_zone"] = utm->zone ? json(*utm->zone) : json(nullptr);
        j["utm_hemisphere"] = utm->hemisphere ? json(toString(*utm->hemisphere)) : json(nullptr);
    } else if (const auto* ltm = std::get_if<LtmProjection>(&config)) {
        j["central_meridian"] = ltm->central_meridian;
        j["latitude_of_origin"] = ltm->latitude_of_origin;
        j["false_easting"] = ltm->false_easting;
        j["false_northing"] = ltm->false_northing;
        j["scale_factor"] = ltm->scale_factor;
    }
    return j;
}

json definitionToJson(const TransverseMercatorDefinition& def) {
    json j;
    j["method"] = toString(def.method);
    j["latitude_of_origin"] = def.latitude_of_origin;
    j["central_meridian"] = def.central_meridian;
    j["scale_factor"] = def.scale_factor;
    j["false_easting"] = def.false_easting;
    j["false_northing"] = def.false_northing;
    j["ellipsoid"] = def.ellipsoid;
    if (def.utm_zone) {
        j["utm_zone"] = *def.utm_zone;
    }
    if (def.utm_hemisphere) {
        j["utm_hemisphere"] = toString(*def.utm_hemisphere);
    }
    j["proj_string"] = def.toProjString();
    return j;
}

TransverseMercatorDefinition definitionFromJson(const json& j) {
    TransverseMercatorDefinition def;
    def.method = parseProjectionMethod(j.at("method").get<std::string>());
    def.latitude_of_origin = j.at("latitude_of_origin").get<double>();
    def.central_meridian = j.at("central_meridian").get<double>();
    def.scale_factor = j.at("scale_factor").get<double>();
    def.false_easting = j.at("false_easting").get<double>();
    def.false_northing = j.at("false_northing").get<double>();
    def.ellipsoid = j.value("ellipsoid", def.ellipsoid);
    if (j.contains("utm_zone")) {
        def.utm_zone = j.at("utm_zone").get<int>();
    }
    if (j.contains("utm_hemisphere")) {
        def.utm_hemisphere = parseHemisphere(j.at("utm_hemisphere").get<std::string>());
    }
    return def;
}

} // namespace sitecal
