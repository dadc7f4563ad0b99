/**
 * @file json_helpers.hpp
 * @brief nlohmann/json conversions shared by config loading and calibration files
 */

#pragma once

#include "sitecal/projection_config.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace sitecal {

/**
 * @brief Parse a file into a JSON document
 * @throws InputError if the file cannot be opened or parsed
 */
nlohmann::json readJsonFile(const std::string& path);

/**
 * @brief Build a ProjectionConfig from {"method": ..., ...}
 * @throws ProjectionError on unknown method, bad types or missing LTM keys
 */
ProjectionConfig projectionConfigFromJson(const nlohmann::json& j);

nlohmann::json projectionConfigToJson(const ProjectionConfig& config);

nlohmann::json definitionToJson(const TransverseMercatorDefinition& def);

TransverseMercatorDefinition definitionFromJson(const nlohmann::json& j);

} // namespace sitecal
