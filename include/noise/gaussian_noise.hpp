#pragma once

#include <Eigen/Dense>

#include <cstdint>
#include <optional>
#include <random>

namespace noise {
/// @brief Uses a Mersenne Twister random number generator to generate gaussian position noise.
class GaussianNoise {
public:
    /// @brief Constructor: Initialize with the standard deviation of each position axis
    /// @param sigma_pos Standard deviation (must be non-negative)
    /// @param seed Fixed seed for reproducible runs; random_device when empty
    explicit GaussianNoise(double sigma_pos, std::optional<std::uint32_t> seed = std::nullopt);

    /// @brief Generate noise for a 3D position [x, y, z]
    auto generate_noise() const -> Eigen::Vector3d;

    auto sigma() const -> double { return sigma_; }

private:
    double sigma_;
    /// @brief Mersenne Twister random number generator
    mutable std::mt19937 gen_;
    /// @brief Gaussian noise for position
    mutable std::normal_distribution<double> posNoise_;
};
} // namespace noise
