#pragma once

#include "association/association_engine.hpp"
#include "common/types.hpp"
#include "config/tracker_config.hpp"
#include "grouping/time_grouper.hpp"
#include "tracking/track.hpp"

#include <Eigen/Dense>

#include <vector>

namespace tracking {

/// @brief Everything produced by one processed batch
struct SessionResult {
    std::vector<common::FilterOutput> filter_outputs;   ///< One per report, in processing order
    association::AssociationResult association;         ///< Association of the batch against all tracks
};

/// @brief In-memory tracking session
///
/// process() groups a batch by time, starts one track per group and runs the
/// filter over the group's reports in time order, then associates every
/// report of the batch against the filtered positions of all tracks of the
/// session. Tracks live until reset() or destruction.
class Tracker {
public:
    /// @throws std::invalid_argument If the configuration is invalid
    explicit Tracker(const config::TrackerConfig& config = config::TrackerConfig{});

    /// @brief Filter and associate a batch; an empty batch is a no-op
    auto process(const common::ReportBatch& reports) -> SessionResult;

    /// @brief Associate reports against the current tracks without filtering them
    auto associate(const common::ReportBatch& reports) const -> association::AssociationResult;

    /// @brief Filtered positions of all tracks, indexed like tracks()
    auto track_positions() const -> std::vector<Eigen::Vector3d>;

    const std::vector<Track>& tracks() const { return tracks_; }
    const config::TrackerConfig& config() const { return config_; }

    /// @brief Drop all tracks
    void reset() { tracks_.clear(); }

private:
    config::TrackerConfig config_;
    grouping::TimeGrouper grouper_;
    association::AssociationEngine engine_;
    std::vector<Track> tracks_;
};

} // namespace tracking
