#include "association/association_engine.hpp"
#include "association/hypothesis_generator.hpp"
#include "association/resolver.hpp"
#include "common/statistics.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <utility>

namespace association {

ClusterTooLargeError::ClusterTooLargeError(std::size_t cluster_size, std::size_t limit)
: std::runtime_error(
      "Cluster of " + std::to_string(cluster_size) + " tracks exceeds the enumeration limit of "
      + std::to_string(limit)),
  cluster_size_(cluster_size),
  limit_(limit)
{}

AssociationEngine::AssociationEngine(
    const Eigen::Matrix3d& covariance,
    double gate_threshold,
    ClusteringPolicy policy,
    std::size_t max_cluster_size
) : gating_(common::invert_covariance(covariance), gate_threshold, policy),
    scorer_(gating_.covariance_inverse()),
    max_cluster_size_(max_cluster_size)
{
    if (max_cluster_size_ == 0) {
        throw std::invalid_argument("Maximum cluster size must be at least 1");
    }
}

AssociationEngine::AssociationEngine(const config::AssociationConfig& config)
: AssociationEngine(
      config.covariance,
      common::chi_square_gate(config.gate_dof),
      config.clustering,
      config.max_cluster_size)
{}

auto AssociationEngine::associate(
    const std::vector<Eigen::Vector3d>& track_positions,
    const common::ReportBatch& reports
) const -> AssociationResult {
    AssociationResult result;

    Eigen::MatrixXd distances = gating_.distance_matrix(track_positions, reports);
    result.clusters = gating_.form_clusters(distances);

    // Several reports can share a cluster; each distinct track set is enumerated once
    std::vector<std::vector<std::size_t>> track_sets;
    for (const auto& cluster : result.clusters) {
        if (cluster.tracks.size() > max_cluster_size_) {
            throw ClusterTooLargeError(cluster.tracks.size(), max_cluster_size_);
        }
        if (std::find(track_sets.begin(), track_sets.end(), cluster.tracks) == track_sets.end()) {
            track_sets.push_back(cluster.tracks);
        }
    }

    spdlog::debug("Association batch: {} tracks, {} reports, {} clusters, {} distinct",
                  track_positions.size(), reports.size(), result.clusters.size(), track_sets.size());

    GateMask mask = gating_.gate_mask(distances);

    std::vector<HypothesisGenerator> generators;
    generators.reserve(track_sets.size());
    std::size_t capacity = 0;
    for (auto& tracks : track_sets) {
        generators.emplace_back(std::move(tracks), reports.size(), mask);
        std::size_t count = generators.back().valid_count();
        capacity = (count > std::numeric_limits<std::size_t>::max() - capacity)
                   ? std::numeric_limits<std::size_t>::max() : capacity + count;
    }

    std::vector<common::Hypothesis> hypotheses;
    std::vector<double> scores;
    hypotheses.reserve(capacity);
    scores.reserve(capacity);

    for (auto& generator : generators) {
        while (auto hypothesis = generator.next()) {
            scores.push_back(scorer_.score(*hypothesis, track_positions, reports));
            hypotheses.push_back(std::move(*hypothesis));
        }
    }

    Normalization normalized = ProbabilityScorer::normalize(std::move(scores));
    result.degenerate = normalized.degenerate;
    if (result.degenerate) {
        spdlog::warn("All {} hypothesis scores are zero; reports left unassociated", hypotheses.size());
    }

    result.hypotheses.reserve(hypotheses.size());
    for (std::size_t i = 0; i < hypotheses.size(); ++i) {
        result.hypotheses.push_back({std::move(hypotheses[i]), normalized.probabilities[i]});
    }

    result.associations = Resolver::resolve(result.hypotheses, reports.size());
    return result;
}

} // namespace association
