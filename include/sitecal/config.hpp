/**
 * @file config.hpp
 * @brief Calibration configuration parameters
 */

#pragma once

#include <string>

namespace sitecal {

/**
 * @brief Calibration configuration with all tunable parameters
 *
 * Values are passed explicitly to every component; nothing is read from
 * process-wide state.
 */
struct Config {
    // --- Input ---
    int min_matched_points = 3;       ///< Minimum common identifiers

    // --- Geometry gate ---
    double collinearity_ratio_threshold = 1e-4;  ///< min/max covariance eigenvalue ratio

    // --- Least squares ---
    double singular_rcond_threshold = 1e-12;     ///< Reciprocal condition number floor
    double min_scale_factor = 1e-6;              ///< Fitted horizontal scale must exceed this

    // --- Projection ---
    std::string ellipsoid = "WGS84";  ///< PROJ ellipsoid name (+ellps=)

    // --- Reporting ---
    std::string report_title = "Site Calibration Report";

    // --- Logging ---
    bool verbose = false;             ///< Print component progress to stdout
};

/**
 * @brief Load tunables from a JSON file
 *
 * Keys mirror the Config fields; missing keys keep their defaults.
 *
 * @throws InputError if the file cannot be read or has wrongly typed values
 */
Config loadConfig(const std::string& path);

} // namespace sitecal
