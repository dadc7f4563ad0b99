/**
 * @file csv_io.hpp
 * @brief Control point CSV reading and transformed coordinate output
 */

#pragma once

#include "common.hpp"
#include "data_types.hpp"
#include <istream>
#include <string>
#include <vector>

namespace sitecal {

/**
 * @brief Read global points (columns Point, Latitude, Longitude, EllipsoidalHeight)
 * @throws InputError on missing file or columns, or unparsable values
 */
std::vector<GlobalPoint> readGlobalCsv(const std::string& path);

/**
 * @brief Read local points (columns Point, Easting, Northing, Elevation)
 * @throws InputError on missing file or columns, or unparsable values
 */
std::vector<LocalPoint> readLocalCsv(const std::string& path);

/**
 * @brief Stream variants; @p source names the input in error messages
 */
std::vector<GlobalPoint> parseGlobalCsv(std::istream& in, const std::string& source);
std::vector<LocalPoint> parseLocalCsv(std::istream& in, const std::string& source);

/**
 * @brief Render transformed points as CSV text
 *
 * Header: Point,ProjectedEasting,ProjectedNorthing,Easting,Northing,Elevation
 */
std::string formatTransformedCsv(const std::vector<TransformedPoint>& points);

/**
 * @brief Output file path and its full content
 */
struct OutputFile {
    std::string path;
    std::string content;
};

/**
 * @brief Write all files or none
 *
 * Every file is first written to "<path>.tmp"; the temporaries are renamed
 * into place only once all of them were written successfully. A file being
 * replaced is kept as "<path>.bak" until every rename succeeded, so a
 * failure restores the previous state of every target.
 *
 * @throws std::runtime_error if a path appears twice or any file cannot be written
 */
void writeOutputFiles(const std::vector<OutputFile>& files);

} // namespace sitecal
