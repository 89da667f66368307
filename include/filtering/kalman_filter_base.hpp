#pragma once

#include <Eigen/Dense>

#include "common/types.hpp"

#include <algorithm>
#include <optional>

namespace filtering {

/// @brief Pure interface for position-report Kalman filters
class IKalmanFilter {
public:
    virtual ~IKalmanFilter() = default;

    /// @brief Propagate to an absolute time
    virtual void predict(double time) = 0;
    /// @brief Fold in one Cartesian position report
    virtual void update(const common::Report& report) = 0;

    virtual Eigen::VectorXd get_state() const = 0;
    virtual Eigen::MatrixXd get_covariance() const = 0;
    virtual void set_state(const Eigen::VectorXd& state) = 0;
    virtual void set_covariance(const Eigen::MatrixXd& covariance) = 0;
    virtual double get_time() const = 0;
};

/// @brief Shared helpers for filters whose state starts with [x, y, z, vx, vy, vz]
///
/// Also keeps the innovation of the last successful update so callers can
/// check filter consistency through the normalized innovation squared.
class KalmanFilterBase : public IKalmanFilter {
public:
    virtual ~KalmanFilterBase() = default;

    virtual void reset(
        const Eigen::VectorXd& initial_state,
        const Eigen::MatrixXd& initial_covariance,
        double /*initial_time*/ = 0.0
    ) {
        set_state(initial_state);
        set_covariance(initial_covariance);
        last_innovation_.reset();
        last_nis_.reset();
    }

    int get_state_dimension() const {
        return static_cast<int>(get_state().size());
    }

    Eigen::Vector3d get_position() const {
        return kinematic_block(0);
    }

    Eigen::Vector3d get_velocity() const {
        return kinematic_block(3);
    }

    /// @brief One-sigma position uncertainty per axis
    Eigen::Vector3d get_position_uncertainty() const {
        Eigen::MatrixXd P = get_covariance();
        if (P.rows() < 3 || P.cols() < 3) {
            return Eigen::Vector3d::Zero();
        }
        return P.topLeftCorner<3, 3>().diagonal().cwiseMax(0.0).cwiseSqrt();
    }

    /// @brief Finite, symmetric and non-negative definite (within round-off)
    bool is_covariance_valid() const {
        Eigen::MatrixXd P = get_covariance();
        if (!P.allFinite() || !P.isApprox(P.transpose(), 1e-9)) {
            return false;
        }
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(P);
        if (es.info() != Eigen::Success) {
            return false;
        }
        double tolerance = 1e-9 * std::max(1.0, es.eigenvalues().cwiseAbs().maxCoeff());
        return es.eigenvalues().minCoeff() >= -tolerance;
    }

    /// @brief Normalized innovation squared, innovationᵀ · S⁻¹ · innovation
    static double compute_nis(
        const Eigen::Vector3d& innovation,
        const Eigen::Matrix3d& innovation_covariance
    ) {
        return innovation.dot(innovation_covariance.ldlt().solve(innovation));
    }

    /// @brief Innovation of the last successful update, if any
    const std::optional<Eigen::Vector3d>& last_innovation() const { return last_innovation_; }

    /// @brief NIS of the last successful update, if any
    std::optional<double> last_nis() const { return last_nis_; }

protected:
    /// @brief Called by update() once the measurement has been accepted
    void record_innovation(const Eigen::Vector3d& innovation, const Eigen::Matrix3d& innovation_covariance) {
        last_innovation_ = innovation;
        last_nis_ = compute_nis(innovation, innovation_covariance);
    }

private:
    Eigen::Vector3d kinematic_block(Eigen::Index offset) const {
        Eigen::VectorXd state = get_state();
        if (state.size() < offset + 3) {
            return Eigen::Vector3d::Zero();
        }
        return state.segment<3>(offset);
    }

    std::optional<Eigen::Vector3d> last_innovation_;
    std::optional<double> last_nis_;
};

} // namespace filtering
