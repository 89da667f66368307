#include "io/report_reader.hpp"
#include "transforms/spherical.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace io {

namespace {

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string field;
    while (std::getline(iss, field, ',')) {
        fields.push_back(field);
    }
    return fields;
}

double parse_field(const std::vector<std::string>& fields, int column, std::size_t line_number) {
    if (column < 0 || static_cast<std::size_t>(column) >= fields.size()) {
        throw std::runtime_error("Line " + std::to_string(line_number) + ": missing column " + std::to_string(column));
    }
    try {
        std::size_t consumed = 0;
        double value = std::stod(fields[column], &consumed);
        if (fields[column].find_first_not_of(" \t\r", consumed) != std::string::npos) {
            throw std::invalid_argument(fields[column]);
        }
        return value;
    } catch (const std::exception&) {
        throw std::runtime_error("Line " + std::to_string(line_number) + ": column " + std::to_string(column)
                                 + " is not a number ('" + fields[column] + "')");
    }
}

} // namespace

auto read_spherical_csv(const std::string& path, const SphericalCsvColumns& columns) -> common::ReportBatch {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open report file " + path);
    }

    common::ReportBatch reports;
    std::string line;
    std::size_t line_number = 0;

    // Skip header
    if (std::getline(file, line)) {
        ++line_number;
    }

    while (std::getline(file, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue; // Skip empty lines

        auto fields = split_csv_line(line);
        double range = parse_field(fields, columns.range, line_number);
        double azimuth = parse_field(fields, columns.azimuth, line_number);
        double elevation = parse_field(fields, columns.elevation, line_number);
        double time = parse_field(fields, columns.time, line_number);

        try {
            Eigen::Vector3d position = transforms::spherical_to_cartesian(range, azimuth, elevation);
            reports.emplace_back(position, time, static_cast<int>(reports.size()));
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("Line " + std::to_string(line_number) + ": " + e.what());
        }
    }

    return reports;
}

auto read_json_reports(const std::string& path) -> common::ReportBatch {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open report file " + path);
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse JSON file " + path + ": " + e.what());
    }

    return parse_json_reports(document);
}

auto parse_json_reports(const nlohmann::json& document) -> common::ReportBatch {
    if (!document.is_object() || !document.contains("reports") || !document["reports"].is_array()) {
        throw std::invalid_argument("Report document must contain a 'reports' array");
    }

    common::ReportBatch reports;
    reports.reserve(document["reports"].size());
    for (const auto& entry : document["reports"]) {
        for (const char* key : {"x", "y", "z", "time"}) {
            if (!entry.contains(key) || !entry[key].is_number()) {
                throw std::invalid_argument(std::string("Each report needs a numeric '") + key + "'");
            }
        }
        int id = static_cast<int>(reports.size());
        if (entry.contains("id")) {
            if (!entry["id"].is_number_integer()) {
                throw std::invalid_argument("Report 'id' must be an integer");
            }
            id = entry["id"].get<int>();
        }
        reports.emplace_back(entry["x"].get<double>(), entry["y"].get<double>(), entry["z"].get<double>(),
                             entry["time"].get<double>(), id);
    }
    return reports;
}

auto reports_to_json(const common::ReportBatch& reports) -> nlohmann::json {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& report : reports) {
        array.push_back({
            {"id", report.id()},
            {"x", report.x()},
            {"y", report.y()},
            {"z", report.z()},
            {"time", report.time()}
        });
    }
    nlohmann::json document;
    document["reports"] = array;
    return document;
}

} // namespace io
