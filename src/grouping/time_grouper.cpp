#include "grouping/time_grouper.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace grouping {

TimeGrouper::TimeGrouper(double time_window)
: time_window_(time_window)
{
    if (!std::isfinite(time_window_) || time_window_ <= 0.0) {
        throw std::invalid_argument("Time window must be positive");
    }
}

auto TimeGrouper::group(const common::ReportBatch& reports) const -> std::vector<ReportGroup> {
    std::vector<ReportGroup> groups;
    if (reports.empty()) {
        return groups;
    }

    std::vector<std::size_t> order(reports.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
        [&reports](std::size_t a, std::size_t b) {
            return reports[a].time() < reports[b].time();
        });

    // Sorted sweep: everything inside the seed's window is contiguous
    std::size_t i = 0;
    while (i < order.size()) {
        const double seed_time = reports[order[i]].time();
        ReportGroup current;
        while (i < order.size() && reports[order[i]].time() - seed_time < time_window_) {
            current.push_back(order[i]);
            ++i;
        }
        groups.push_back(std::move(current));
    }

    return groups;
}

} // namespace grouping
