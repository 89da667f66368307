#include "common/statistics.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace common {

double chi_square_gate(int dof) {
    if (dof < 1 || dof >= static_cast<int>(chi2inv95.size())) {
        throw std::invalid_argument(
            "Chi-square gate is tabulated for 1 to 9 degrees of freedom, got " + std::to_string(dof)
        );
    }
    return chi2inv95[dof];
}

double mahalanobis_distance_squared(
    const Eigen::Vector3d& a,
    const Eigen::Vector3d& b,
    const Eigen::Matrix3d& cov_inv
) {
    Eigen::Vector3d delta = b - a;
    return delta.transpose() * cov_inv * delta;
}

double mahalanobis_distance(
    const Eigen::Vector3d& a,
    const Eigen::Vector3d& b,
    const Eigen::Matrix3d& cov_inv
) {
    return std::sqrt(mahalanobis_distance_squared(a, b, cov_inv));
}

Eigen::Matrix3d invert_covariance(const Eigen::Matrix3d& covariance) {
    if (!covariance.allFinite()) {
        throw std::invalid_argument("Association covariance must be finite");
    }

    if (!covariance.isApprox(covariance.transpose(), 1e-10)) {
        throw std::invalid_argument("Association covariance must be symmetric");
    }

    Eigen::LLT<Eigen::Matrix3d> llt(covariance);
    if (llt.info() != Eigen::Success) {
        throw std::invalid_argument("Association covariance must be positive definite");
    }

    return llt.solve(Eigen::Matrix3d::Identity());
}

} // namespace common
