/**
 * @file projection_config.cpp
 * @brief Method tags and PROJ string formatting for resolved projections
 */

#include "sitecal/projection_config.hpp"
#include "sitecal/errors.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <locale>
#include <sstream>

namespace sitecal {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

ProjectionMethod parseProjectionMethod(const std::string& tag) {
    const std::string key = toLower(tag);
    if (key == "default") {
        return ProjectionMethod::DEFAULT;
    }
    if (key == "utm") {
        return ProjectionMethod::UTM;
    }
    if (key == "ltm") {
        return ProjectionMethod::LTM;
    }
    throw ProjectionError("Unknown projection method: '" + tag + "' (expected default, utm or ltm)");
}

Hemisphere parseHemisphere(const std::string& tag) {
    const std::string key = toLower(tag);
    if (key == "north" || key == "n") {
        return Hemisphere::NORTH;
    }
    if (key == "south" || key == "s") {
        return Hemisphere::SOUTH;
    }
    throw ProjectionError("Unknown hemisphere: '" + tag + "' (expected north or south)");
}

std::string TransverseMercatorDefinition::toProjString() const {
    // Classic locale and round-trip precision so the string is reproducible
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::setprecision(17)
       << "+proj=tmerc"
       << " +lat_0=" << latitude_of_origin
       << " +lon_0=" << central_meridian
       << " +k=" << scale_factor
       << " +x_0=" << false_easting
       << " +y_0=" << false_northing
       << " +ellps=" << ellipsoid
       << " +units=m +no_defs";
    return ss.str();
}

std::string TransverseMercatorDefinition::describe() const {
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    switch (method) {
        case ProjectionMethod::UTM:
            ss << "UTM zone " << utm_zone.value_or(0) << " "
               << toString(utm_hemisphere.value_or(Hemisphere::NORTH));
            break;
        case ProjectionMethod::LTM:
            ss << "LTM (central meridian " << std::setprecision(10) << central_meridian << ")";
            break;
        case ProjectionMethod::DEFAULT:
        default:
            ss << std::fixed << std::setprecision(8)
               << "Local TM at (" << latitude_of_origin << ", " << central_meridian << ")";
            break;
    }
    return ss.str();
}

} // namespace sitecal
