#include "association/gating.hpp"
#include "common/statistics.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace association {

std::istream& operator>>(std::istream& is, ClusteringPolicy& policy) {
    std::string s;
    is >> s;
    if (s == "nearest" || s == "NEAREST") {
        policy = ClusteringPolicy::NearestTrack;
    } else if (s == "all" || s == "ALL") {
        policy = ClusteringPolicy::AllGated;
    } else {
        throw std::invalid_argument("Invalid clustering policy: " + s);
    }
    return is;
}

std::ostream& operator<<(std::ostream& os, const ClusteringPolicy& policy) {
    switch (policy) {
        case ClusteringPolicy::NearestTrack: os << "nearest"; break;
        case ClusteringPolicy::AllGated: os << "all"; break;
    }
    return os;
}

Gating::Gating(
    const Eigen::Matrix3d& covariance_inverse,
    double threshold,
    ClusteringPolicy policy
) : covariance_inverse_(covariance_inverse),
    threshold_(threshold),
    policy_(policy)
{
    if (!covariance_inverse_.allFinite()) {
        throw std::invalid_argument("Gating covariance inverse must be finite");
    }
    if (!std::isfinite(threshold_) || threshold_ <= 0.0) {
        throw std::invalid_argument("Gate threshold must be positive");
    }
}

auto Gating::distance_matrix(
    const std::vector<Eigen::Vector3d>& track_positions,
    const common::ReportBatch& reports
) const -> Eigen::MatrixXd {
    Eigen::MatrixXd distances(track_positions.size(), reports.size());
    for (std::size_t t = 0; t < track_positions.size(); ++t) {
        for (std::size_t r = 0; r < reports.size(); ++r) {
            distances(t, r) = common::mahalanobis_distance_squared(
                track_positions[t], reports[r].position(), covariance_inverse_
            );
        }
    }
    return distances;
}

auto Gating::gate_mask(const Eigen::MatrixXd& distances) const -> GateMask {
    return distances.array() < threshold_;
}

auto Gating::form_clusters(const Eigen::MatrixXd& distances) const -> std::vector<common::Cluster> {
    std::vector<common::Cluster> clusters;

    for (Eigen::Index r = 0; r < distances.cols(); ++r) {
        common::Cluster cluster{static_cast<std::size_t>(r), {}};

        if (policy_ == ClusteringPolicy::AllGated) {
            for (Eigen::Index t = 0; t < distances.rows(); ++t) {
                if (accepts(distances(t, r))) {
                    cluster.tracks.push_back(static_cast<std::size_t>(t));
                }
            }
        } else {
            // Greedy: the first track at the minimum distance wins ties
            Eigen::Index nearest = -1;
            double best = std::numeric_limits<double>::infinity();
            for (Eigen::Index t = 0; t < distances.rows(); ++t) {
                if (distances(t, r) < best) {
                    best = distances(t, r);
                    nearest = t;
                }
            }
            if (nearest >= 0 && accepts(best)) {
                cluster.tracks.push_back(static_cast<std::size_t>(nearest));
            }
        }

        if (!cluster.tracks.empty()) {
            clusters.push_back(std::move(cluster));
        }
    }

    return clusters;
}

} // namespace association
