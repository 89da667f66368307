#pragma once

#include "association/gating.hpp"
#include "association/probability_scorer.hpp"
#include "common/types.hpp"
#include "config/tracker_config.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace association {

/// @brief Raised when a cluster is too large to enumerate
class ClusterTooLargeError : public std::runtime_error {
public:
    ClusterTooLargeError(std::size_t cluster_size, std::size_t limit);

    std::size_t cluster_size() const { return cluster_size_; }
    std::size_t limit() const { return limit_; }

private:
    std::size_t cluster_size_;
    std::size_t limit_;
};

/// @brief Outcome of one association batch
struct AssociationResult {
    std::vector<common::Cluster> clusters;                  ///< One per gated report
    std::vector<common::ScoredHypothesis> hypotheses;       ///< Every enumerated hypothesis
    std::vector<common::ReportAssociation> associations;    ///< One per report
    bool degenerate{false};                                 ///< All hypothesis scores were zero
};

/// @brief Multi-hypothesis report-to-track association over one batch
///
/// Gates every report against every track, builds clusters, enumerates the
/// hypotheses of each distinct cluster over the whole report pool, scores and
/// normalizes them together, and resolves the best track per report. A track
/// is only ever assigned reports inside its gate.
///
/// Inputs are read-only; the engine keeps no state between batches.
class AssociationEngine {
public:
    /// @brief Constructor
    /// @param covariance Association covariance (3x3, symmetric positive definite)
    /// @param gate_threshold Gate on the squared Mahalanobis distance
    /// @param policy Clustering policy
    /// @param max_cluster_size Largest cluster that is enumerated
    /// @throws std::invalid_argument On an invalid covariance, threshold or size limit
    AssociationEngine(
        const Eigen::Matrix3d& covariance,
        double gate_threshold,
        ClusteringPolicy policy = ClusteringPolicy::NearestTrack,
        std::size_t max_cluster_size = 8
    );

    /// @brief Construct from config
    explicit AssociationEngine(const config::AssociationConfig& config);

    /// @brief Associate a batch of reports with the given track positions
    /// @throws ClusterTooLargeError If a cluster exceeds the size limit
    auto associate(
        const std::vector<Eigen::Vector3d>& track_positions,
        const common::ReportBatch& reports
    ) const -> AssociationResult;

    const Gating& gating() const { return gating_; }
    std::size_t max_cluster_size() const { return max_cluster_size_; }

private:
    Gating gating_;
    ProbabilityScorer scorer_;
    std::size_t max_cluster_size_;
};

} // namespace association
