#pragma once

/// @file report_reader.hpp
/// @brief Loading report batches from disk.

#include "common/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace io {

/// @brief Column layout of the spherical sensor CSV (0-based)
struct SphericalCsvColumns {
    int range = 7;
    int azimuth = 8;
    int elevation = 9;
    int time = 10;
};

/// @brief Reads spherical sensor records and converts them to Cartesian reports.
/// @param path CSV file with one header row.
/// @param columns Column layout.
/// @return Reports with ids numbered from 0 in file order.
/// @throws std::runtime_error If the file cannot be opened or a row is malformed.
auto read_spherical_csv(const std::string& path, const SphericalCsvColumns& columns = {}) -> common::ReportBatch;

/// @brief Reads Cartesian reports from a JSON file.
///
/// Expected layout: {"reports": [{"x": .., "y": .., "z": .., "time": .., "id": ..}, ...]}.
/// The id is optional and defaults to the position in the array.
/// @throws std::runtime_error If the file cannot be opened or is not valid JSON.
/// @throws std::invalid_argument If the document does not have the expected layout.
auto read_json_reports(const std::string& path) -> common::ReportBatch;

/// @brief Parses an already loaded JSON report document.
/// @throws std::invalid_argument If the document does not have the expected layout.
auto parse_json_reports(const nlohmann::json& document) -> common::ReportBatch;

/// @brief Serializes reports in the layout accepted by parse_json_reports.
auto reports_to_json(const common::ReportBatch& reports) -> nlohmann::json;

} // namespace io
