#include "tracking/track.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

namespace tracking {

Track::Track(int id, const config::FilterConfig& config, const common::Report& first)
: id_(id),
  filter_(config.plant_noise, config.measurement_noise, config.initial_covariance, config.innovation)
{
    filter_.initialize(first.x(), first.y(), first.z(), 0.0, 0.0, 0.0, first.time());
    history_.push_back({id_, first.id(), filter_.estimate(), true, false});

    spdlog::debug("Track {} initialized from report {} at t={}", id_, first.id(), first.time());
}

auto Track::ingest(const common::Report& report) -> common::FilterOutput {
    filter_.predict(report.time());

    bool updated = true;
    try {
        filter_.update(report);
        spdlog::trace("Track {}: report {} NIS {:.4f}", id_, report.id(), filter_.last_nis().value_or(0.0));
    } catch (const common::NumericalError& e) {
        spdlog::warn("Track {}: skipping update with report {} ({}); keeping prediction",
                     id_, report.id(), e.what());
        filter_.commit_prediction();
        updated = false;
    }

    history_.push_back({id_, report.id(), filter_.estimate(), false, updated});
    return history_.back();
}

} // namespace tracking
