/**
 * @file csv_io.cpp
 * @brief Implementation of control point CSV I/O
 */

#include "sitecal/csv_io.hpp"
#include "sitecal/errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <locale>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace sitecal {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

/// Split one CSV record; double quotes may wrap a field and "" escapes a quote
std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;
    bool was_quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            in_quotes = true;
            was_quoted = true;
        } else if (c == ',') {
            fields.push_back(was_quoted ? field : trim(field));
            field.clear();
            was_quoted = false;
        } else {
            field += c;
        }
    }
    fields.push_back(was_quoted ? field : trim(field));
    return fields;
}

/**
 * @brief Header-validated table of string cells
 */
struct CsvTable {
    std::map<std::string, size_t> columns;
    std::vector<std::vector<std::string>> rows;
    std::vector<int> line_numbers;
};

CsvTable readTable(std::istream& in, const std::string& source,
                   const std::vector<std::string>& required) {
    CsvTable table;

    std::string line;
    int line_no = 0;
    bool have_header = false;

    while (std::getline(in, line)) {
        ++line_no;
        if (line_no == 1 && line.size() >= 3 &&
            line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            line.erase(0, 3);
        }
        if (trim(line).empty()) {
            continue;
        }

        std::vector<std::string> fields = splitCsvLine(line);
        if (!have_header) {
            for (size_t i = 0; i < fields.size(); ++i) {
                table.columns.emplace(fields[i], i);
            }
            have_header = true;

            std::string missing;
            for (const auto& name : required) {
                if (table.columns.count(name) == 0) {
                    missing += (missing.empty() ? "" : ", ") + name;
                }
            }
            if (!missing.empty()) {
                throw InputError(source + ": missing required column(s): " + missing);
            }
            continue;
        }

        table.rows.push_back(std::move(fields));
        table.line_numbers.push_back(line_no);
    }

    if (!have_header) {
        throw InputError(source + ": file is empty (no header row)");
    }
    return table;
}

const std::string& cell(const CsvTable& table, size_t row, const std::string& column,
                        const std::string& source) {
    size_t index = table.columns.at(column);
    const auto& fields = table.rows[row];
    if (index >= fields.size()) {
        throw InputError(source + ": line " + std::to_string(table.line_numbers[row]) +
                         " has no value for column '" + column + "'");
    }
    return fields[index];
}

double numberCell(const CsvTable& table, size_t row, const std::string& column,
                  const std::string& source) {
    const std::string& text = cell(table, row, column, source);

    std::istringstream ss(text);
    ss.imbue(std::locale::classic());
    double value = 0.0;
    ss >> value;
    if (text.empty() || ss.fail() || !(ss >> std::ws).eof()) {
        throw InputError(source + ": line " + std::to_string(table.line_numbers[row]) +
                         " column '" + column + "' is not a number: '" + text + "'");
    }
    return value;
}

std::ifstream openInput(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw InputError("Cannot open CSV file: " + path);
    }
    return file;
}

} // namespace

std::vector<GlobalPoint> parseGlobalCsv(std::istream& in, const std::string& source) {
    CsvTable table = readTable(in, source, {"Point", "Latitude", "Longitude", "EllipsoidalHeight"});

    std::vector<GlobalPoint> points;
    points.reserve(table.rows.size());
    for (size_t r = 0; r < table.rows.size(); ++r) {
        GlobalPoint pt;
        pt.id = cell(table, r, "Point", source);
        pt.geodetic.latitude = numberCell(table, r, "Latitude", source);
        pt.geodetic.longitude = numberCell(table, r, "Longitude", source);
        pt.geodetic.ellipsoidal_height = numberCell(table, r, "EllipsoidalHeight", source);
        points.push_back(pt);
    }
    return points;
}

std::vector<LocalPoint> parseLocalCsv(std::istream& in, const std::string& source) {
    CsvTable table = readTable(in, source, {"Point", "Easting", "Northing", "Elevation"});

    std::vector<LocalPoint> points;
    points.reserve(table.rows.size());
    for (size_t r = 0; r < table.rows.size(); ++r) {
        LocalPoint pt;
        pt.id = cell(table, r, "Point", source);
        pt.local.easting = numberCell(table, r, "Easting", source);
        pt.local.northing = numberCell(table, r, "Northing", source);
        pt.local.elevation = numberCell(table, r, "Elevation", source);
        points.push_back(pt);
    }
    return points;
}

std::vector<GlobalPoint> readGlobalCsv(const std::string& path) {
    std::ifstream file = openInput(path);
    return parseGlobalCsv(file, path);
}

std::vector<LocalPoint> readLocalCsv(const std::string& path) {
    std::ifstream file = openInput(path);
    return parseLocalCsv(file, path);
}

std::string formatTransformedCsv(const std::vector<TransformedPoint>& points) {
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << "Point,ProjectedEasting,ProjectedNorthing,Easting,Northing,Elevation\n";
    ss << std::fixed << std::setprecision(4);
    for (const auto& p : points) {
        std::string id = p.id;
        if (id.find_first_of(",\"") != std::string::npos) {
            std::string quoted = "\"";
            for (char c : id) {
                quoted += (c == '"') ? std::string("\"\"") : std::string(1, c);
            }
            id = quoted + "\"";
        }
        ss << id << ","
           << p.projected_easting << "," << p.projected_northing << ","
           << p.easting << "," << p.northing << "," << p.elevation << "\n";
    }
    return ss.str();
}

void writeOutputFiles(const std::vector<OutputFile>& files) {
    std::set<fs::path> targets;
    for (const auto& file : files) {
        if (!targets.insert(fs::absolute(file.path).lexically_normal()).second) {
            throw std::runtime_error("Output path given more than once: " + file.path);
        }
        std::error_code ec;
        if (fs::is_directory(file.path, ec)) {
            throw std::runtime_error("Output path is a directory: " + file.path);
        }
    }

    std::vector<std::string> temporaries;
    std::vector<std::string> backups;   // parallel to files; empty when no previous file
    std::vector<std::string> placed;

    // Undo everything done so far: new files out, previous files back
    auto rollback = [&]() {
        std::error_code ec;
        for (const auto& tmp : temporaries) {
            fs::remove(tmp, ec);
        }
        for (const auto& path : placed) {
            fs::remove(path, ec);
        }
        for (size_t i = 0; i < backups.size(); ++i) {
            if (!backups[i].empty()) {
                fs::rename(backups[i], files[i].path, ec);
            }
        }
    };

    for (const auto& file : files) {
        std::string tmp = file.path + ".tmp";
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (out) {
            temporaries.push_back(tmp);
            out << file.content;
            out.close();
        }
        if (!out) {
            rollback();
            throw std::runtime_error("Cannot write output file: " + file.path);
        }
    }

    for (size_t i = 0; i < files.size(); ++i) {
        const std::string& target = files[i].path;
        std::error_code ec;

        backups.emplace_back();
        if (fs::exists(target, ec)) {
            std::string bak = target + ".bak";
            fs::rename(target, bak, ec);
            if (ec) {
                backups.pop_back();
                rollback();
                throw std::runtime_error("Cannot replace output file: " + target +
                                         " (" + ec.message() + ")");
            }
            backups.back() = bak;
        }

        fs::rename(temporaries[i], target, ec);
        if (ec) {
            rollback();
            throw std::runtime_error("Cannot move output into place: " + target +
                                     " (" + ec.message() + ")");
        }
        placed.push_back(target);
    }

    std::error_code ec;
    for (const auto& bak : backups) {
        if (!bak.empty()) {
            fs::remove(bak, ec);
        }
    }
}

} // namespace sitecal
