#pragma once

#include "common/types.hpp"
#include "tracking/tracker.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace io {

/// @brief JSON form of a processed batch
///
/// Keys: "tracks" (final state, covariance and range/azimuth/elevation per
/// track), "filter_outputs", "clusters", "hypotheses" and "associations".
/// Report and track indices are translated to their ids; an unassociated
/// report has a null track_id.
auto results_to_json(
    const tracking::SessionResult& result,
    const std::vector<tracking::Track>& tracks,
    const common::ReportBatch& reports
) -> nlohmann::json;

/// @brief Write a JSON document, pretty-printed
/// @throws std::runtime_error If the file cannot be written
void write_json(const std::string& path, const nlohmann::json& document);

} // namespace io
