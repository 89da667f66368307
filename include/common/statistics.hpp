#pragma once

#include <Eigen/Dense>

#include <array>

namespace common {

/// @brief Chi-square 95% quantiles indexed by degrees of freedom (0..9)
inline constexpr std::array<double, 10> chi2inv95 = {
    0.0, 3.8415, 5.9915, 7.8147, 9.4877, 11.070, 12.592, 14.067, 15.507, 16.919
};

/// @brief Gate value for a given number of degrees of freedom at 95% confidence
/// @param dof Degrees of freedom (1..9)
/// @return Chi-square 0.95 quantile
/// @throws std::invalid_argument If dof is outside the tabulated range
double chi_square_gate(int dof);

/// @brief Squared Mahalanobis distance between two positions
/// @param a First position
/// @param b Second position
/// @param cov_inv Inverse covariance used to scale the difference
/// @return (b - a)ᵀ · cov_inv · (b - a)
double mahalanobis_distance_squared(
    const Eigen::Vector3d& a,
    const Eigen::Vector3d& b,
    const Eigen::Matrix3d& cov_inv
);

/// @brief Mahalanobis distance between two positions
double mahalanobis_distance(
    const Eigen::Vector3d& a,
    const Eigen::Vector3d& b,
    const Eigen::Matrix3d& cov_inv
);

/// @brief Invert a 3x3 covariance used for association
/// @throws std::invalid_argument If the matrix is not symmetric positive definite
Eigen::Matrix3d invert_covariance(const Eigen::Matrix3d& covariance);

} // namespace common
