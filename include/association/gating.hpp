#pragma once

#include "common/types.hpp"

#include <Eigen/Dense>

#include <iostream>
#include <vector>

namespace association {

/// @brief How a report's cluster is built from the tracks passing its gate
enum class ClusteringPolicy {
    NearestTrack,  ///< Only the nearest gated track
    AllGated       ///< Every gated track
};

std::istream& operator>>(std::istream& is, ClusteringPolicy& policy);
std::ostream& operator<<(std::ostream& os, const ClusteringPolicy& policy);

/// @brief (track, report) admissibility, rows are tracks and columns reports
using GateMask = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic>;

/// @brief Statistical gating of reports against track positions
///
/// A pair passes when its squared Mahalanobis distance is strictly below the
/// threshold.
class Gating {
public:
    /// @brief Constructor
    /// @param covariance_inverse Inverse of the association covariance (3x3)
    /// @param threshold Gate on the squared Mahalanobis distance
    /// @param policy Clustering policy
    /// @throws std::invalid_argument If the threshold is not positive or the matrix is not finite
    Gating(
        const Eigen::Matrix3d& covariance_inverse,
        double threshold,
        ClusteringPolicy policy = ClusteringPolicy::NearestTrack
    );

    /// @brief Squared distances, rows are tracks and columns reports
    auto distance_matrix(
        const std::vector<Eigen::Vector3d>& track_positions,
        const common::ReportBatch& reports
    ) const -> Eigen::MatrixXd;

    /// @brief Admissible pairs for a distance matrix
    auto gate_mask(const Eigen::MatrixXd& distances) const -> GateMask;

    /// @brief One cluster per report that passes the gate of at least one track
    auto form_clusters(const Eigen::MatrixXd& distances) const -> std::vector<common::Cluster>;

    bool accepts(double distance_squared) const { return distance_squared < threshold_; }
    double threshold() const { return threshold_; }
    ClusteringPolicy policy() const { return policy_; }
    const Eigen::Matrix3d& covariance_inverse() const { return covariance_inverse_; }

private:
    Eigen::Matrix3d covariance_inverse_;
    double threshold_;
    ClusteringPolicy policy_;
};

} // namespace association
