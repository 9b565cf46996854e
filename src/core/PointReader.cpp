// src/core/PointReader.cpp
//
// Implementation of the point record reader.
#include "PointReader.hpp"
#include "Errors.hpp"
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

std::vector<std::string> splitRecord(const std::string& line, char delim) {
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string item;
    while (std::getline(ss, item, delim)) out.emplace_back(item);
    return out;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    const auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

namespace {

/**
 * @brief Parses a whole field as a finite double.
 *
 * @return bool False if the field is not entirely a number.
 */
bool parseCoordinate(const std::string& field, double& value) {
    if (field.empty()) return false;
    std::size_t used = 0;
    try {
        value = std::stod(field, &used);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
    return used == field.size() && std::isfinite(value);
}

} // namespace

std::vector<GroundTruthPoint> readPoints(std::istream& in) {
    std::vector<GroundTruthPoint> points;
    std::string line;
    std::size_t lineNo = 0;
    int dim = -1;

    while (std::getline(in, line)) {
        ++lineNo;
        const std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        // getline drops a trailing empty field, so catch it here.
        if (t.back() == ',') {
            throw MalformedInputError("record ends with an empty field", lineNo);
        }

        auto fields = splitRecord(t);
        for (auto& f : fields) f = trim(f);

        PointType type = PointType::Agent;
        const std::string& last = fields.back();
        double numeric = 0.0;
        if (!parseCoordinate(last, numeric)) {
            if (last == "S") {
                type = PointType::Anchor;
            } else if (last == "A") {
                type = PointType::Agent;
            } else {
                throw MalformedInputError("unrecognized point type '" + last + "'", lineNo);
            }
            fields.pop_back();
        }

        if (fields.empty()) {
            throw MalformedInputError("record has no coordinates", lineNo);
        }
        Coordinates coords(static_cast<Eigen::Index>(fields.size()));
        for (std::size_t k = 0; k < fields.size(); ++k) {
            double value = 0.0;
            if (!parseCoordinate(fields[k], value)) {
                throw MalformedInputError("cannot parse coordinate '" + fields[k] + "'", lineNo);
            }
            coords(static_cast<Eigen::Index>(k)) = value;
        }

        if (dim < 0) {
            dim = static_cast<int>(coords.size());
        } else if (coords.size() != dim) {
            throw MalformedInputError("record has " + std::to_string(coords.size()) +
                                      " coordinates, expected " + std::to_string(dim),
                                      lineNo);
        }
        points.emplace_back(points.size(), type, std::move(coords));
    }

    if (points.empty()) {
        throw MalformedInputError("input contains no point records");
    }
    return points;
}

std::vector<GroundTruthPoint> readPointsFromFile(const std::string& path) {
    std::ifstream fin(path);
    if (!fin.is_open()) {
        throw MalformedInputError("cannot open point file: " + path);
    }
    return readPoints(fin);
}
