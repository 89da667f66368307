#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <transforms/spherical.hpp>

#include <cmath>

// Azimuth 0 points along +y, azimuth 90 along +x
TEST(SphericalTest, CardinalDirections) {
    double tol = 1e-9;

    auto north = transforms::spherical_to_cartesian(100.0, 0.0, 0.0);
    EXPECT_NEAR(north(0), 0.0, tol);
    EXPECT_NEAR(north(1), 100.0, tol);
    EXPECT_NEAR(north(2), 0.0, tol);

    auto east = transforms::spherical_to_cartesian(100.0, 90.0, 0.0);
    EXPECT_NEAR(east(0), 100.0, tol);
    EXPECT_NEAR(east(1), 0.0, tol);

    auto up = transforms::spherical_to_cartesian(100.0, 0.0, 90.0);
    EXPECT_NEAR(up(0), 0.0, tol);
    EXPECT_NEAR(up(1), 0.0, tol);
    EXPECT_NEAR(up(2), 100.0, tol);
}

TEST(SphericalTest, RangeIsPreserved) {
    auto position = transforms::spherical_to_cartesian(1234.5, 217.0, -12.0);
    EXPECT_NEAR(position.norm(), 1234.5, 1e-9);
}

// Cartesian -> spherical -> Cartesian
TEST(SphericalTest, CartesianRoundTrip) {
    const Eigen::Vector3d positions[] = {
        {1000.0, 2000.0, 300.0},
        {-1500.0, 250.0, -40.0},
        {-10.0, -10.0, 5.0},
        {0.5, -3.0, 0.0}
    };

    for (const auto& position : positions) {
        auto spherical = transforms::cartesian_to_spherical(position);
        auto converted = transforms::spherical_to_cartesian(spherical(0), spherical(1), spherical(2));
        for (int i = 0; i < 3; ++i) {
            EXPECT_NEAR(converted(i), position(i), 1e-9);
        }
    }
}

// range/azimuth/elevation -> x,y,z -> range/azimuth/elevation
TEST(SphericalTest, SphericalRoundTrip) {
    const double readings[][3] = {
        {500.0, 45.0, 10.0},
        {1200.0, 300.0, -5.0},
        {80.0, 179.5, 60.0},
        {10.0, 0.0, 0.0}
    };

    for (const auto& reading : readings) {
        auto position = transforms::spherical_to_cartesian(reading[0], reading[1], reading[2]);
        auto spherical = transforms::cartesian_to_spherical(position);
        EXPECT_NEAR(spherical(0), reading[0], 1e-9);
        EXPECT_NEAR(spherical(1), reading[1], 1e-9);
        EXPECT_NEAR(spherical(2), reading[2], 1e-9);
    }
}

TEST(SphericalTest, NegativeAzimuthIsNormalized) {
    auto position = transforms::spherical_to_cartesian(100.0, -90.0, 0.0);
    auto spherical = transforms::cartesian_to_spherical(position);

    EXPECT_NEAR(spherical(1), 270.0, 1e-9);
    EXPECT_GE(spherical(1), 0.0);
    EXPECT_LT(spherical(1), 360.0);
}

TEST(SphericalTest, OriginMapsToZeroReading) {
    auto spherical = transforms::cartesian_to_spherical(Eigen::Vector3d::Zero());
    EXPECT_DOUBLE_EQ(spherical(0), 0.0);
    EXPECT_DOUBLE_EQ(spherical(1), 0.0);
    EXPECT_DOUBLE_EQ(spherical(2), 0.0);
}

TEST(SphericalTest, NormalizeAzimuth) {
    EXPECT_DOUBLE_EQ(transforms::normalize_azimuth(0.0), 0.0);
    EXPECT_DOUBLE_EQ(transforms::normalize_azimuth(360.0), 0.0);
    EXPECT_DOUBLE_EQ(transforms::normalize_azimuth(725.0), 5.0);
    EXPECT_DOUBLE_EQ(transforms::normalize_azimuth(-30.0), 330.0);

    double tiny = transforms::normalize_azimuth(-1e-18);
    EXPECT_GE(tiny, 0.0);
    EXPECT_LT(tiny, 360.0);
}

TEST(SphericalTest, ThrowsOnInvalidReading) {
    EXPECT_THROW(transforms::spherical_to_cartesian(-1.0, 0.0, 0.0), std::invalid_argument);
    EXPECT_THROW(transforms::spherical_to_cartesian(std::nan(""), 0.0, 0.0), std::invalid_argument);
    EXPECT_THROW(transforms::spherical_to_cartesian(1.0, INFINITY, 0.0), std::invalid_argument);
}
