/**
 * @file common.hpp
 * @brief Common types, enums, and utilities for site calibration
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <optional>

namespace sitecal {

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Geodetic-to-planar projection strategy
 */
enum class ProjectionMethod {
    DEFAULT,  ///< Local Transverse Mercator centered on the first point
    UTM,      ///< Universal Transverse Mercator, zone derived from the data
    LTM       ///< Local Transverse Mercator with user parameters
};

/**
 * @brief UTM hemisphere
 */
enum class Hemisphere {
    NORTH,
    SOUTH
};

// ============================================================================
// String conversions
// ============================================================================

inline std::string toString(ProjectionMethod method) {
    switch (method) {
        case ProjectionMethod::DEFAULT: return "default";
        case ProjectionMethod::UTM: return "utm";
        case ProjectionMethod::LTM: return "ltm";
        default: return "unknown";
    }
}

inline std::string toString(Hemisphere hemisphere) {
    switch (hemisphere) {
        case Hemisphere::NORTH: return "north";
        case Hemisphere::SOUTH: return "south";
        default: return "unknown";
    }
}

/**
 * @brief Parse a method tag ("default", "utm", "ltm")
 * @throws ProjectionError for any other tag
 */
ProjectionMethod parseProjectionMethod(const std::string& tag);

/**
 * @brief Parse a hemisphere tag ("north", "south", "n", "s")
 * @throws ProjectionError for any other tag
 */
Hemisphere parseHemisphere(const std::string& tag);

// ============================================================================
// Type aliases and constants
// ============================================================================

using PointId = std::string;

constexpr double kPi = 3.14159265358979323846;
constexpr double kDegToRad = kPi / 180.0;
constexpr double kRadToDeg = 180.0 / kPi;

} // namespace sitecal
