#include "tracking/tracker.hpp"

#include <spdlog/spdlog.h>

namespace tracking {

namespace {
const config::TrackerConfig& validated(const config::TrackerConfig& config) {
    config.validate();
    return config;
}
}

Tracker::Tracker(const config::TrackerConfig& config)
: config_(validated(config)),
  grouper_(config_.grouping.time_window),
  engine_(config_.association)
{}

auto Tracker::process(const common::ReportBatch& reports) -> SessionResult {
    SessionResult result;
    if (reports.empty()) {
        spdlog::info("Empty report batch; nothing to track");
        return result;
    }

    auto groups = grouper_.group(reports);
    spdlog::info("Processing {} reports in {} groups", reports.size(), groups.size());

    result.filter_outputs.reserve(reports.size());
    for (const auto& group : groups) {
        const int id = static_cast<int>(tracks_.size());
        tracks_.emplace_back(id, config_.filter, reports[group.front()]);
        Track& track = tracks_.back();
        result.filter_outputs.push_back(track.history().back());

        for (std::size_t i = 1; i < group.size(); ++i) {
            result.filter_outputs.push_back(track.ingest(reports[group[i]]));
        }

        const Eigen::Vector3d position = track.position();
        const Eigen::Vector3d velocity = track.velocity();
        spdlog::debug("Track {}: {} reports, position ({:.3f}, {:.3f}, {:.3f}), velocity ({:.3f}, {:.3f}, {:.3f})",
                      id, group.size(), position(0), position(1), position(2),
                      velocity(0), velocity(1), velocity(2));
    }

    result.association = engine_.associate(track_positions(), reports);
    return result;
}

auto Tracker::associate(const common::ReportBatch& reports) const -> association::AssociationResult {
    return engine_.associate(track_positions(), reports);
}

auto Tracker::track_positions() const -> std::vector<Eigen::Vector3d> {
    std::vector<Eigen::Vector3d> positions;
    positions.reserve(tracks_.size());
    for (const auto& track : tracks_) {
        positions.push_back(track.position());
    }
    return positions;
}

} // namespace tracking
