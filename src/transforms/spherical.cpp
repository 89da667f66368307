#include "transforms/spherical.hpp"

#include <cmath>
#include <stdexcept>

namespace transforms {

namespace {
constexpr double kDegToRad = M_PI / 180.0;
constexpr double kRadToDeg = 180.0 / M_PI;
}

auto spherical_to_cartesian(double range, double azimuth_deg, double elevation_deg) -> Eigen::Vector3d {
    if (!std::isfinite(range) || !std::isfinite(azimuth_deg) || !std::isfinite(elevation_deg)) {
        throw std::invalid_argument("Spherical reading must be finite");
    }
    if (range < 0.0) {
        throw std::invalid_argument("Range cannot be negative");
    }

    const double az = azimuth_deg * kDegToRad;
    const double el = elevation_deg * kDegToRad;

    Eigen::Vector3d position;
    position << range * std::cos(el) * std::sin(az),
                range * std::cos(el) * std::cos(az),
                range * std::sin(el);
    return position;
}

auto cartesian_to_spherical(const Eigen::Vector3d& position) -> Eigen::Vector3d {
    const double range = position.norm();
    const double ground = std::hypot(position(0), position(1));

    // atan2(0, 0) is 0, so the origin and the zenith get azimuth 0
    double azimuth = normalize_azimuth(std::atan2(position(0), position(1)) * kRadToDeg);
    double elevation = std::atan2(position(2), ground) * kRadToDeg;

    return Eigen::Vector3d(range, azimuth, elevation);
}

auto normalize_azimuth(double azimuth_deg) -> double {
    double wrapped = std::fmod(azimuth_deg, 360.0);
    if (wrapped < 0.0) {
        wrapped += 360.0;
    }
    // fmod of a tiny negative value can round back up to exactly 360
    if (wrapped >= 360.0) {
        wrapped -= 360.0;
    }
    return wrapped;
}

} // namespace transforms
