#include "noise/report_simulator.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace noise {

auto simulate_reports(
    const std::vector<SimulatedTarget>& targets,
    int reports_per_target,
    double timestep,
    const GaussianNoise& noise
) -> common::ReportBatch {
    if (!std::isfinite(timestep) || timestep <= 0.0) {
        throw std::invalid_argument("Timestep must be positive");
    }
    if (reports_per_target < 0) {
        throw std::invalid_argument("Reports per target cannot be negative");
    }

    std::vector<std::pair<double, Eigen::Vector3d>> samples;
    samples.reserve(targets.size() * static_cast<std::size_t>(reports_per_target));
    for (const auto& target : targets) {
        for (int i = 0; i < reports_per_target; ++i) {
            double elapsed = i * timestep;
            Eigen::Vector3d truth = target.position + target.velocity * elapsed;
            samples.emplace_back(target.start_time + elapsed, truth + noise.generate_noise());
        }
    }

    std::stable_sort(samples.begin(), samples.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    common::ReportBatch reports;
    reports.reserve(samples.size());
    for (const auto& [time, position] : samples) {
        reports.emplace_back(position, time, static_cast<int>(reports.size()));
    }
    return reports;
}

} // namespace noise
