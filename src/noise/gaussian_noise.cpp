#include "noise/gaussian_noise.hpp"

#include <cmath>
#include <stdexcept>

namespace noise {
GaussianNoise::GaussianNoise(double sigma_pos, std::optional<std::uint32_t> seed)
: sigma_(sigma_pos)
{
    if (!std::isfinite(sigma_pos) || sigma_pos < 0.0) {
        throw std::invalid_argument("Noise standard deviation must be finite and non-negative");
    }
    // normal_distribution requires a positive stddev; zero noise is handled in generate_noise
    posNoise_ = std::normal_distribution<double>(0.0, sigma_pos > 0.0 ? sigma_pos : 1.0);

    if (seed.has_value()) {
        gen_ = std::mt19937(*seed);
    } else {
        std::random_device rd;
        gen_ = std::mt19937(rd());
    }
}

auto GaussianNoise::generate_noise() const -> Eigen::Vector3d {
    if (sigma_ == 0.0) {
        return Eigen::Vector3d::Zero();
    }
    Eigen::Vector3d noise;
    noise(0) = posNoise_(gen_);
    noise(1) = posNoise_(gen_);
    noise(2) = posNoise_(gen_);
    return noise;
}
} // namespace noise
