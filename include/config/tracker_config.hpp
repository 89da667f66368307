#pragma once

/// @file tracker_config.hpp
/// @brief Tracker settings and their JSON representation.
///
/// Every key of the JSON document is optional; missing keys keep the defaults
/// below. Matrices are given either as an array of rows or as a single number
/// meaning that number times the identity.
///
/// @code{.json}
/// {
///     "filter":      { "plant_noise": 20, "measurement_noise": 1, "initial_covariance": 1, "innovation": "predicted" },
///     "grouping":    { "time_window": 50 },
///     "association": { "covariance": 1, "gate_dof": 3, "clustering": "nearest", "max_cluster_size": 8 }
/// }
/// @endcode

#include "association/gating.hpp"
#include "common/types.hpp"
#include "filtering/constant_velocity_filter.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace config {

/// @brief Constant-velocity filter settings
struct FilterConfig {
    double plant_noise{filtering::ConstantVelocityFilter::kDefaultPlantNoise};
    Eigen::Matrix3d measurement_noise{Eigen::Matrix3d::Identity()};
    common::Matrix6d initial_covariance{common::Matrix6d::Identity()};
    filtering::InnovationReference innovation{filtering::InnovationReference::PredictedState};
};

/// @brief Temporal grouping settings
struct GroupingConfig {
    double time_window{50.0};
};

/// @brief Gating, clustering and enumeration settings
struct AssociationConfig {
    Eigen::Matrix3d covariance{Eigen::Matrix3d::Identity()};  ///< Gating/scoring covariance
    int gate_dof{3};                                          ///< Degrees of freedom of the 95% gate
    association::ClusteringPolicy clustering{association::ClusteringPolicy::NearestTrack};
    std::size_t max_cluster_size{8};
};

/// @brief All tracker settings
struct TrackerConfig {
    FilterConfig filter;
    GroupingConfig grouping;
    AssociationConfig association;

    /// @throws std::invalid_argument If any value is out of range
    void validate() const;
};

/// @brief Build a configuration from JSON
/// @throws std::invalid_argument On malformed or out-of-range values
auto from_json(const nlohmann::json& j) -> TrackerConfig;

/// @brief Serialize a configuration (full form, matrices as rows)
auto to_json(const TrackerConfig& config) -> nlohmann::json;

/// @brief Read and validate a JSON configuration file
/// @throws std::runtime_error If the file cannot be opened or parsed
/// @throws std::invalid_argument On malformed or out-of-range values
auto load_config(const std::string& path) -> TrackerConfig;

} // namespace config
