#include "config/tracker_config.hpp"
#include "common/statistics.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace config {

namespace {

/// Matrix from an array of rows or a scalar multiple of the identity
template <int N>
Eigen::Matrix<double, N, N> parse_matrix(const nlohmann::json& j, const std::string& key) {
    if (j.is_number()) {
        return Eigen::Matrix<double, N, N>::Identity() * j.get<double>();
    }
    if (!j.is_array() || j.size() != N) {
        throw std::invalid_argument("'" + key + "' must be a number or " + std::to_string(N) + " rows");
    }

    Eigen::Matrix<double, N, N> m;
    for (int r = 0; r < N; ++r) {
        const auto& row = j[r];
        if (!row.is_array() || row.size() != N) {
            throw std::invalid_argument("'" + key + "' row " + std::to_string(r) + " must have " + std::to_string(N) + " values");
        }
        for (int c = 0; c < N; ++c) {
            if (!row[c].is_number()) {
                throw std::invalid_argument("'" + key + "' entries must be numbers");
            }
            m(r, c) = row[c].get<double>();
        }
    }
    return m;
}

template <int N>
nlohmann::json matrix_to_json(const Eigen::Matrix<double, N, N>& m) {
    nlohmann::json rows = nlohmann::json::array();
    for (int r = 0; r < N; ++r) {
        nlohmann::json row = nlohmann::json::array();
        for (int c = 0; c < N; ++c) {
            row.push_back(m(r, c));
        }
        rows.push_back(row);
    }
    return rows;
}

double parse_number(const nlohmann::json& j, const std::string& key) {
    if (!j.is_number()) {
        throw std::invalid_argument("'" + key + "' must be a number");
    }
    return j.get<double>();
}

/// Enum values go through the same operator>> used by the command line
template <typename Enum>
Enum parse_enum(const nlohmann::json& j, const std::string& key) {
    if (!j.is_string()) {
        throw std::invalid_argument("'" + key + "' must be a string");
    }
    Enum value{};
    std::istringstream iss(j.get<std::string>());
    iss >> value;
    return value;
}

template <typename Enum>
std::string enum_to_string(const Enum& value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

bool is_symmetric_psd(const Eigen::MatrixXd& m, bool strictly_positive) {
    if (!m.allFinite() || !m.isApprox(m.transpose(), 1e-10)) {
        return false;
    }
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(m);
    double min_eigenvalue = es.eigenvalues().minCoeff();
    return strictly_positive ? min_eigenvalue > 0.0 : min_eigenvalue >= 0.0;
}

} // namespace

void TrackerConfig::validate() const {
    if (!std::isfinite(filter.plant_noise) || filter.plant_noise < 0.0) {
        throw std::invalid_argument("filter.plant_noise must be finite and non-negative");
    }
    if (!is_symmetric_psd(filter.measurement_noise, false)) {
        throw std::invalid_argument("filter.measurement_noise must be symmetric positive semi-definite");
    }
    if (!is_symmetric_psd(filter.initial_covariance, false)) {
        throw std::invalid_argument("filter.initial_covariance must be symmetric positive semi-definite");
    }
    if (!std::isfinite(grouping.time_window) || grouping.time_window <= 0.0) {
        throw std::invalid_argument("grouping.time_window must be positive");
    }
    if (!is_symmetric_psd(association.covariance, true)) {
        throw std::invalid_argument("association.covariance must be symmetric positive definite");
    }
    // Throws for degrees of freedom outside the table
    common::chi_square_gate(association.gate_dof);
    if (association.max_cluster_size == 0) {
        throw std::invalid_argument("association.max_cluster_size must be at least 1");
    }
}

auto from_json(const nlohmann::json& j) -> TrackerConfig {
    if (!j.is_object()) {
        throw std::invalid_argument("Configuration must be a JSON object");
    }

    TrackerConfig config;

    if (j.contains("filter")) {
        const auto& f = j["filter"];
        if (f.contains("plant_noise")) {
            config.filter.plant_noise = parse_number(f["plant_noise"], "filter.plant_noise");
        }
        if (f.contains("measurement_noise")) {
            config.filter.measurement_noise = parse_matrix<3>(f["measurement_noise"], "filter.measurement_noise");
        }
        if (f.contains("initial_covariance")) {
            config.filter.initial_covariance = parse_matrix<6>(f["initial_covariance"], "filter.initial_covariance");
        }
        if (f.contains("innovation")) {
            config.filter.innovation = parse_enum<filtering::InnovationReference>(f["innovation"], "filter.innovation");
        }
    }

    if (j.contains("grouping")) {
        const auto& g = j["grouping"];
        if (g.contains("time_window")) {
            config.grouping.time_window = parse_number(g["time_window"], "grouping.time_window");
        }
    }

    if (j.contains("association")) {
        const auto& a = j["association"];
        if (a.contains("covariance")) {
            config.association.covariance = parse_matrix<3>(a["covariance"], "association.covariance");
        }
        if (a.contains("gate_dof")) {
            if (!a["gate_dof"].is_number_integer()) {
                throw std::invalid_argument("'association.gate_dof' must be an integer");
            }
            config.association.gate_dof = a["gate_dof"].get<int>();
        }
        if (a.contains("clustering")) {
            config.association.clustering = parse_enum<association::ClusteringPolicy>(a["clustering"], "association.clustering");
        }
        if (a.contains("max_cluster_size")) {
            if (!a["max_cluster_size"].is_number_unsigned()) {
                throw std::invalid_argument("'association.max_cluster_size' must be a non-negative integer");
            }
            config.association.max_cluster_size = a["max_cluster_size"].get<std::size_t>();
        }
    }

    config.validate();
    return config;
}

auto to_json(const TrackerConfig& config) -> nlohmann::json {
    nlohmann::json j;
    j["filter"]["plant_noise"] = config.filter.plant_noise;
    j["filter"]["measurement_noise"] = matrix_to_json<3>(config.filter.measurement_noise);
    j["filter"]["initial_covariance"] = matrix_to_json<6>(config.filter.initial_covariance);
    j["filter"]["innovation"] = enum_to_string(config.filter.innovation);
    j["grouping"]["time_window"] = config.grouping.time_window;
    j["association"]["covariance"] = matrix_to_json<3>(config.association.covariance);
    j["association"]["gate_dof"] = config.association.gate_dof;
    j["association"]["clustering"] = enum_to_string(config.association.clustering);
    j["association"]["max_cluster_size"] = config.association.max_cluster_size;
    return j;
}

auto load_config(const std::string& path) -> TrackerConfig {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open configuration file " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse configuration file " + path + ": " + e.what());
    }

    return from_json(j);
}

} // namespace config
