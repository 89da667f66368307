#pragma once

#include "common/types.hpp"

#include <Eigen/Dense>

#include <vector>

namespace association {

/// @brief Normalized hypothesis probabilities
struct Normalization {
    std::vector<double> probabilities;
    bool degenerate;  ///< True if every raw score was zero (or the sum was not finite)
};

/// @brief Gaussian likelihood scoring of joint assignment hypotheses
class ProbabilityScorer {
public:
    /// @param covariance_inverse Inverse covariance for the Mahalanobis distance
    explicit ProbabilityScorer(const Eigen::Matrix3d& covariance_inverse);

    /// @brief Unnormalized score: product of exp(-0.5 * d²) over assigned pairs
    /// @param hypothesis Hypothesis to score
    /// @param track_positions Track positions indexed by track
    /// @param reports Reports indexed by report
    /// @throws std::out_of_range If the hypothesis references a missing track or report
    double score(
        const common::Hypothesis& hypothesis,
        const std::vector<Eigen::Vector3d>& track_positions,
        const common::ReportBatch& reports
    ) const;

    /// @brief Scale scores to sum to one
    ///
    /// A zero or non-finite sum yields all-zero probabilities and sets the
    /// degenerate flag instead of dividing.
    static Normalization normalize(std::vector<double> scores);

private:
    Eigen::Matrix3d covariance_inverse_;
};

} // namespace association
