#include "association/probability_scorer.hpp"
#include "common/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace association {

ProbabilityScorer::ProbabilityScorer(const Eigen::Matrix3d& covariance_inverse)
: covariance_inverse_(covariance_inverse)
{
    if (!covariance_inverse_.allFinite()) {
        throw std::invalid_argument("Scorer covariance inverse must be finite");
    }
}

double ProbabilityScorer::score(
    const common::Hypothesis& hypothesis,
    const std::vector<Eigen::Vector3d>& track_positions,
    const common::ReportBatch& reports
) const {
    double probability = 1.0;
    for (const auto& assignment : hypothesis) {
        if (!assignment.report.has_value()) {
            continue;
        }
        const Eigen::Vector3d& track = track_positions.at(assignment.track);
        const common::Report& report = reports.at(*assignment.report);
        double d2 = common::mahalanobis_distance_squared(track, report.position(), covariance_inverse_);
        probability *= std::exp(-0.5 * d2);
    }
    return probability;
}

Normalization ProbabilityScorer::normalize(std::vector<double> scores) {
    double total = std::accumulate(scores.begin(), scores.end(), 0.0);

    if (scores.empty() || !std::isfinite(total) || total <= 0.0) {
        const bool degenerate = !scores.empty();
        std::fill(scores.begin(), scores.end(), 0.0);
        return {std::move(scores), degenerate};
    }

    for (double& s : scores) {
        s /= total;
    }
    return {std::move(scores), false};
}

} // namespace association
