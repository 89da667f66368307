#pragma once

#include "common/types.hpp"

#include <cstddef>
#include <vector>

namespace association {

/// @brief Picks the most probable track for each report
class Resolver {
public:
    /// @brief Resolve per-report associations
    ///
    /// For every report, the track of the highest-probability hypothesis that
    /// assigns the report wins. Reports that no hypothesis assigns with a
    /// positive probability resolve to no track with probability 0.
    /// @param hypotheses Scored hypotheses of the batch
    /// @param report_count Number of reports in the batch
    /// @return One record per report, in report order
    /// @throws std::out_of_range If a hypothesis references a report outside the batch
    static auto resolve(
        const std::vector<common::ScoredHypothesis>& hypotheses,
        std::size_t report_count
    ) -> std::vector<common::ReportAssociation>;
};

} // namespace association
