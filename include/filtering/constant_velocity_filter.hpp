#pragma once

#include "filtering/kalman_filter_base.hpp"
#include "common/types.hpp"

#include <iostream>

namespace filtering {

/// @brief Which state the measurement innovation is computed against
enum class InnovationReference {
    PredictedState,  ///< z - H * (Phi * S): the prediction is folded into the state
    PriorState       ///< z - H * S: the prediction only inflates the covariance
};

std::istream& operator>>(std::istream& is, InnovationReference& reference);
std::ostream& operator<<(std::ostream& os, const InnovationReference& reference);

/// @brief Linear Kalman filter with a constant-velocity motion model
///
/// State is [x, y, z, vx, vy, vz]. Reports observe position only.
/// Process noise is the plant noise scalar times the 6x6 identity.
///
/// The filter does not advance its time on predict(). A successful update()
/// moves it to the report time; after a failed update the caller keeps the
/// prediction with commit_prediction().
class ConstantVelocityFilter : public KalmanFilterBase {
public:
    static constexpr double kDefaultPlantNoise = 20.0;

    /// @brief Constructor
    /// @param plant_noise Process noise scalar q (Q = q * I6)
    /// @param measurement_noise Measurement noise covariance R (3x3)
    /// @param initial_covariance Covariance before the first update (6x6)
    /// @param reference Innovation reference mode
    /// @throws std::invalid_argument On negative plant noise or invalid matrices
    explicit ConstantVelocityFilter(
        double plant_noise = kDefaultPlantNoise,
        const Eigen::Matrix3d& measurement_noise = Eigen::Matrix3d::Identity(),
        const common::Matrix6d& initial_covariance = common::Matrix6d::Identity(),
        InnovationReference reference = InnovationReference::PredictedState
    );

    /// @brief Set the state directly; covariance is left unchanged
    void initialize(double x, double y, double z, double vx, double vy, double vz, double time);

    /// @brief Propagate state and covariance to the given time
    /// @throws std::logic_error If the filter is not initialized
    /// @throws std::invalid_argument If time precedes the filter time
    void predict(double time) override;

    /// @brief Apply a position report
    /// @throws std::logic_error If the filter is not initialized
    /// @throws common::NumericalError If the innovation covariance is singular or ill-conditioned
    void update(const common::Report& report) override;

    /// @brief Accept the last prediction as the current estimate without a measurement
    /// @throws std::logic_error If there is no pending prediction
    void commit_prediction();

    Eigen::VectorXd get_state() const override { return x_; }
    Eigen::MatrixXd get_covariance() const override { return P_; }
    void set_state(const Eigen::VectorXd& state) override;
    void set_covariance(const Eigen::MatrixXd& P) override;
    double get_time() const override { return current_time_; }

    void reset(
        const Eigen::VectorXd& initial_state,
        const Eigen::MatrixXd& initial_covariance,
        double initial_time = 0.0
    ) override {
        KalmanFilterBase::reset(initial_state, initial_covariance, initial_time);
        current_time_ = initial_time;
        initialized_ = true;
        has_prediction_ = false;
    }

    const common::Vector6d& state() const { return x_; }
    const common::Matrix6d& covariance() const { return P_; }
    const common::Vector6d& predicted_state() const { return xp_; }
    common::StateEstimate estimate() const { return {x_, P_, current_time_}; }

    bool is_initialized() const { return initialized_; }
    double plant_noise() const { return q_; }
    const Eigen::Matrix3d& measurement_noise() const { return R_; }
    const common::Matrix36d& measurement_matrix() const { return H_; }
    InnovationReference innovation_reference() const { return reference_; }

private:
    /// @brief Symmetrize P and clamp negative eigenvalues introduced by round-off
    static common::Matrix6d condition_covariance(const common::Matrix6d& P);

    common::Vector6d x_;            ///< State estimate
    common::Vector6d xp_;           ///< Last predicted state
    common::Matrix6d P_;            ///< Covariance matrix
    common::Matrix36d H_;           ///< Measurement matrix (position selector)
    Eigen::Matrix3d R_;             ///< Measurement noise covariance
    double q_;                      ///< Plant noise
    InnovationReference reference_;
    double current_time_;           ///< Time of the last initialize/update
    double predicted_time_;         ///< Target time of the last predict
    bool initialized_;
    bool has_prediction_;
};

} // namespace filtering
