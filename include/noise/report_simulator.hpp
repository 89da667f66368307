#pragma once

#include "common/types.hpp"
#include "noise/gaussian_noise.hpp"

#include <Eigen/Dense>

#include <vector>

namespace noise {

/// @brief Constant-velocity target used to simulate reports
struct SimulatedTarget {
    Eigen::Vector3d position;   ///< Position at start_time
    Eigen::Vector3d velocity;
    double start_time;
};

/// @brief Generates noisy position reports for constant-velocity targets
///
/// Target k reports at start_time + i * timestep for i = 0..reports_per_target-1.
/// Reports are returned sorted by time and numbered from 0 in that order.
/// @throws std::invalid_argument If the timestep is not positive
auto simulate_reports(
    const std::vector<SimulatedTarget>& targets,
    int reports_per_target,
    double timestep,
    const GaussianNoise& noise
) -> common::ReportBatch;

} // namespace noise
