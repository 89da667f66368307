#pragma once

#include "common/types.hpp"
#include "config/tracker_config.hpp"
#include "filtering/constant_velocity_filter.hpp"

#include <Eigen/Dense>

#include <vector>

namespace tracking {

/// @brief One target: an exclusively owned filter plus its per-report outputs
class Track {
public:
    /// @brief Create a track from its first report (velocity starts at zero)
    /// @param id Track identifier
    /// @param config Filter settings
    /// @param first Report that starts the track
    Track(int id, const config::FilterConfig& config, const common::Report& first);

    /// @brief Predict to the report time and apply the report
    ///
    /// If the update is numerically impossible the prediction is kept, a
    /// warning naming the track and report is logged, and the returned output
    /// has updated == false.
    /// @throws std::invalid_argument If the report is older than the track
    auto ingest(const common::Report& report) -> common::FilterOutput;

    int id() const { return id_; }
    const filtering::ConstantVelocityFilter& filter() const { return filter_; }
    const std::vector<common::FilterOutput>& history() const { return history_; }
    Eigen::Vector3d position() const { return filter_.state().head<3>(); }
    Eigen::Vector3d velocity() const { return filter_.state().tail<3>(); }
    double last_update() const { return filter_.get_time(); }

private:
    int id_;
    filtering::ConstantVelocityFilter filter_;
    std::vector<common::FilterOutput> history_;
};

} // namespace tracking
