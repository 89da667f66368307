#pragma once

/// @file spherical.hpp
/// @brief Conversions between sensor-native spherical readings and Cartesian positions.
///
/// Azimuth is a bearing measured from the +y axis toward the +x axis, elevation
/// is measured up from the xy-plane. Both are expressed in degrees.

#include <Eigen/Dense>

namespace transforms {

/// @brief Converts a spherical reading to a Cartesian position.
/// @param range Slant range (same units as the returned position).
/// @param azimuth_deg Azimuth bearing in degrees.
/// @param elevation_deg Elevation angle in degrees.
/// @return Position [x, y, z].
/// @throws std::invalid_argument If any input is not finite or range is negative.
auto spherical_to_cartesian(double range, double azimuth_deg, double elevation_deg) -> Eigen::Vector3d;

/// @brief Converts a Cartesian position to a spherical reading.
/// @param position Position [x, y, z].
/// @return [range, azimuth (degrees, in [0, 360)), elevation (degrees, in [-90, 90])].
/// @note The origin maps to range 0, azimuth 0, elevation 0.
auto cartesian_to_spherical(const Eigen::Vector3d& position) -> Eigen::Vector3d;

/// @brief Wraps an angle in degrees into [0, 360).
auto normalize_azimuth(double azimuth_deg) -> double;

} // namespace transforms
