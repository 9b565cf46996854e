// src/core/PointReader.hpp
//
// Reader for point records of the **CooperativeLocalizationEngine**.
//
// One record per line: `coord_1, coord_2, ..., coord_dim, type`, where the
// type tag is `S` (anchor) or `A` (agent). A record without a tag is an
// agent. Blank lines and lines starting with `#` are skipped. The first record
// fixes the dimension; ids follow record order.
#ifndef POINT_READER_HPP
#define POINT_READER_HPP
#include <istream>
#include <string>
#include <vector>
#include "Point.hpp"

/**
 * @brief Splits one delimited line into fields (no quoting).
 */
std::vector<std::string> splitRecord(const std::string& line, char delim = ',');

/**
 * @brief Strips leading and trailing whitespace.
 */
std::string trim(const std::string& s);

/**
 * @brief Reads all point records from a stream.
 *
 * @throws MalformedInputError with the offending line number for an
 *         unparsable or empty field, an unknown type tag, a dimension differing
 *         from the first record, or an input without records.
 */
std::vector<GroundTruthPoint> readPoints(std::istream& in);

/**
 * @brief Reads all point records from a file.
 *
 * @throws MalformedInputError if the file cannot be opened or a record is bad.
 */
std::vector<GroundTruthPoint> readPointsFromFile(const std::string& path);

#endif // POINT_READER_HPP
