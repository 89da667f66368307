#pragma once

#include "common/types.hpp"

#include <cstddef>
#include <vector>

namespace grouping {

/// @brief Indices of the reports that form one group, in time order
using ReportGroup = std::vector<std::size_t>;

/// @brief Partitions a report sequence into groups by temporal proximity.
///
/// The earliest report not yet grouped seeds a group; every ungrouped report
/// whose time differs from the seed by less than the window joins it.
/// Reports with equal times keep their input order.
class TimeGrouper {
public:
    static constexpr double kDefaultTimeWindow = 50.0;

    /// @brief Constructor
    /// @param time_window Maximum time difference from the seed (exclusive)
    /// @throws std::invalid_argument If the window is not positive and finite
    explicit TimeGrouper(double time_window = kDefaultTimeWindow);

    /// @brief Group a batch of reports
    /// @param reports Reports in any order
    /// @return Groups of indices into reports; empty for an empty batch
    auto group(const common::ReportBatch& reports) const -> std::vector<ReportGroup>;

    double time_window() const { return time_window_; }

private:
    double time_window_;
};

} // namespace grouping
