#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <optional>
#include <vector>

namespace common {

// ============================================
// FIXED-SIZE ALGEBRA TYPES
// ============================================

using Vector6d = Eigen::Matrix<double, 6, 1>;
using Matrix6d = Eigen::Matrix<double, 6, 6>;
using Matrix36d = Eigen::Matrix<double, 3, 6>;

// ============================================
// MEASUREMENT TYPES (Data Containers)
// ============================================

/// @brief Cartesian position report from a sensor
///
/// Immutable once created. Used throughout pipeline:
/// reader → grouper → filters → association
class Report {
public:
    Report();
    Report(double x, double y, double z, double time, int id = -1);
    Report(const Eigen::Vector3d& position, double time, int id = -1);

    const Eigen::Vector3d& position() const { return position_; }
    double x() const { return position_(0); }
    double y() const { return position_(1); }
    double z() const { return position_(2); }
    double time() const { return time_; }
    int id() const { return id_; }

    bool is_valid() const;

private:
    Eigen::Vector3d position_;      ///< Cartesian position
    double time_;                   ///< Report timestamp
    int id_;                        ///< Report identifier (-1 if unset)
};

/// @brief Batch of reports
using ReportBatch = std::vector<Report>;

// ============================================
// STATE TYPES (Data Containers)
// ============================================

/// @brief State estimate with uncertainty
struct StateEstimate {
    Vector6d x;                     ///< State vector [x, y, z, vx, vy, vz]
    Matrix6d P;                     ///< State covariance
    double time;                    ///< Estimate timestamp

    StateEstimate() : x(Vector6d::Zero()), P(Matrix6d::Identity()), time(0.0) {}
    StateEstimate(const Vector6d& x_, const Matrix6d& P_, double time_)
        : x(x_), P(P_), time(time_) {}
};

/// @brief Filter output for one processed report
struct FilterOutput {
    int track_id;                   ///< Track that consumed the report
    int report_id;                  ///< Report that was consumed
    StateEstimate estimate;         ///< State after processing the report
    bool initialized;               ///< True if the report created the track
    bool updated;                   ///< False if the measurement update was skipped
};

// ============================================
// ASSOCIATION TYPES (Data Containers)
// ============================================

/// @brief One (track, report) entry of a hypothesis.
/// An empty report index means the track is unassigned.
struct Assignment {
    std::size_t track;
    std::optional<std::size_t> report;

    bool operator==(const Assignment& other) const {
        return track == other.track && report == other.report;
    }
};

/// @brief A joint assignment over all tracks of a cluster
using Hypothesis = std::vector<Assignment>;

/// @brief Tracks reachable from one report
struct Cluster {
    std::size_t report;                 ///< Report that seeded the cluster
    std::vector<std::size_t> tracks;    ///< Track indices, ascending
};

/// @brief Hypothesis with its normalized probability
struct ScoredHypothesis {
    Hypothesis hypothesis;
    double probability;
};

/// @brief Final association for one report
struct ReportAssociation {
    std::size_t report;                 ///< Report index within the batch
    std::optional<std::size_t> track;   ///< Most probable track (none if unassociated)
    double probability;                 ///< Posterior probability in [0, 1]
};

} // namespace common
