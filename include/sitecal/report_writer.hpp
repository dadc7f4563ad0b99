/**
 * @file report_writer.hpp
 * @brief Markdown report rendering and calibration (de)serialization
 */

#pragma once

#include "config.hpp"
#include "data_types.hpp"
#include <string>

namespace sitecal {

/**
 * @brief Render the calibration report as Markdown
 *
 * Residuals and derived statistics are listed in millimetres.
 *
 * @param report     Result of SiteCalibrator::calibrate()
 * @param config     Supplies the report title
 * @param timestamp  Printed as the generation time
 */
std::string renderMarkdownReport(const FitReport& report, const Config& config,
                                 const std::string& timestamp);

/**
 * @brief Local time as "YYYY-MM-DD HH:MM:SS"
 */
std::string currentTimestamp();

/**
 * @brief Serialize a calibration to a JSON document (pretty-printed)
 */
std::string calibrationToJson(const FitReport& report);

/**
 * @brief Parse a calibration previously written by calibrationToJson()
 *
 * Restores the projection, its resolved definition, the parameters and
 * the residuals; statistics are recomputed from the residuals.
 *
 * @throws InputError if the text is not a valid calibration document
 * @throws ProjectionError if the stored projection cannot be parsed
 */
FitReport parseCalibrationJson(const std::string& text, const std::string& source);

/**
 * @brief Read a calibration file written by calibrationToJson()
 * @throws InputError, ProjectionError
 */
FitReport readCalibrationJson(const std::string& path);

} // namespace sitecal
