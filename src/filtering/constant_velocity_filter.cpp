#include "filtering/constant_velocity_filter.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

namespace filtering {

namespace {
/// Smallest accepted reciprocal condition number of the innovation covariance
constexpr double kMinReciprocalCondition = 1e-12;
}

std::istream& operator>>(std::istream& is, InnovationReference& reference) {
    std::string s;
    is >> s;
    if (s == "predicted" || s == "PREDICTED") {
        reference = InnovationReference::PredictedState;
    } else if (s == "prior" || s == "PRIOR") {
        reference = InnovationReference::PriorState;
    } else {
        throw std::invalid_argument("Invalid innovation reference: " + s);
    }
    return is;
}

std::ostream& operator<<(std::ostream& os, const InnovationReference& reference) {
    switch (reference) {
        case InnovationReference::PredictedState: os << "predicted"; break;
        case InnovationReference::PriorState: os << "prior"; break;
    }
    return os;
}

ConstantVelocityFilter::ConstantVelocityFilter(
    double plant_noise,
    const Eigen::Matrix3d& measurement_noise,
    const common::Matrix6d& initial_covariance,
    InnovationReference reference
) : x_(common::Vector6d::Zero()),
    xp_(common::Vector6d::Zero()),
    P_(initial_covariance),
    H_(common::Matrix36d::Identity()),
    R_(measurement_noise),
    q_(plant_noise),
    reference_(reference),
    current_time_(0.0),
    predicted_time_(0.0),
    initialized_(false),
    has_prediction_(false)
{
    if (!std::isfinite(q_) || q_ < 0.0) {
        throw std::invalid_argument("Plant noise must be finite and non-negative");
    }

    if (!R_.allFinite() || !R_.isApprox(R_.transpose(), 1e-10)) {
        throw std::invalid_argument("Measurement noise covariance must be finite and symmetric");
    }

    if (!P_.allFinite() || !P_.isApprox(P_.transpose(), 1e-10)) {
        throw std::invalid_argument("Initial covariance must be finite and symmetric");
    }
}

void ConstantVelocityFilter::initialize(
    double x, double y, double z, double vx, double vy, double vz, double time
) {
    x_ << x, y, z, vx, vy, vz;
    xp_ = x_;
    current_time_ = time;
    predicted_time_ = time;
    initialized_ = true;
    has_prediction_ = false;
}

void ConstantVelocityFilter::predict(double time) {
    if (!initialized_) {
        throw std::logic_error("Filter must be initialized before predict");
    }

    double dt = time - current_time_;
    if (dt < 0.0) {
        throw std::invalid_argument("Prediction time precedes filter time");
    }

    // State transition: position += dt * velocity
    common::Matrix6d Phi = common::Matrix6d::Identity();
    Phi(0, 3) = dt;
    Phi(1, 4) = dt;
    Phi(2, 5) = dt;

    common::Matrix6d Q = common::Matrix6d::Identity() * q_;

    xp_ = Phi * x_;
    P_ = Phi * P_ * Phi.transpose() + Q;

    if (reference_ == InnovationReference::PredictedState) {
        x_ = xp_;
    }

    predicted_time_ = time;
    has_prediction_ = true;
}

void ConstantVelocityFilter::update(const common::Report& report) {
    if (!initialized_) {
        throw std::logic_error("Filter must be initialized before update");
    }

    // Innovation covariance: S = H*P*Hᵀ + R
    Eigen::Matrix3d S = H_ * P_ * H_.transpose() + R_;

    if (!S.allFinite()) {
        throw common::NumericalError("Innovation covariance is not finite");
    }

    Eigen::JacobiSVD<Eigen::Matrix3d> svd(S);
    const auto& sv = svd.singularValues();
    if (sv(0) <= 0.0 || sv(2) / sv(0) < kMinReciprocalCondition) {
        std::ostringstream oss;
        oss << "Innovation covariance is singular or ill-conditioned (singular values "
            << sv.transpose() << ")";
        throw common::NumericalError(oss.str());
    }

    // Innovation (measurement residual)
    Eigen::Vector3d innovation = report.position() - H_ * x_;

    // Kalman gain: K = P*Hᵀ*S⁻¹
    Eigen::Matrix<double, 6, 3> K = P_ * H_.transpose() * S.inverse();

    // P⁺ = (I - K*H)*P⁻
    common::Matrix6d P_post = condition_covariance((common::Matrix6d::Identity() - K * H_) * P_);

    x_ = x_ + K * innovation;
    P_ = P_post;
    current_time_ = report.time();
    has_prediction_ = false;
    record_innovation(innovation, S);
}

void ConstantVelocityFilter::commit_prediction() {
    if (!has_prediction_) {
        throw std::logic_error("No pending prediction to commit");
    }
    x_ = xp_;
    current_time_ = predicted_time_;
    has_prediction_ = false;
}

void ConstantVelocityFilter::set_state(const Eigen::VectorXd& state) {
    if (state.size() != 6) {
        throw std::invalid_argument("State vector must have 6 elements");
    }
    x_ = state;
    xp_ = x_;
}

void ConstantVelocityFilter::set_covariance(const Eigen::MatrixXd& P) {
    if (P.rows() != 6 || P.cols() != 6) {
        throw std::invalid_argument("Covariance matrix must be 6x6");
    }
    P_ = P;
}

common::Matrix6d ConstantVelocityFilter::condition_covariance(const common::Matrix6d& P) {
    // Ensure symmetry (numerical stability)
    common::Matrix6d symmetric = 0.5 * (P + P.transpose());

    Eigen::SelfAdjointEigenSolver<common::Matrix6d> es(symmetric);
    if (es.info() != Eigen::Success) {
        throw common::NumericalError("Covariance eigen-decomposition failed");
    }
    if (es.eigenvalues().minCoeff() >= 0.0) {
        return symmetric;
    }

    common::Vector6d clamped = es.eigenvalues().cwiseMax(0.0);
    common::Matrix6d repaired = es.eigenvectors() * clamped.asDiagonal() * es.eigenvectors().transpose();
    return 0.5 * (repaired + repaired.transpose());
}

} // namespace filtering
