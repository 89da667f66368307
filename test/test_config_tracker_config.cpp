#include <gtest/gtest.h>

#include "config/tracker_config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <string>

using nlohmann::json;

TEST(TrackerConfigTest, Defaults) {
    config::TrackerConfig cfg;

    EXPECT_DOUBLE_EQ(cfg.filter.plant_noise, 20.0);
    EXPECT_TRUE(cfg.filter.measurement_noise.isIdentity());
    EXPECT_TRUE(cfg.filter.initial_covariance.isIdentity());
    EXPECT_EQ(cfg.filter.innovation, filtering::InnovationReference::PredictedState);
    EXPECT_DOUBLE_EQ(cfg.grouping.time_window, 50.0);
    EXPECT_TRUE(cfg.association.covariance.isIdentity());
    EXPECT_EQ(cfg.association.gate_dof, 3);
    EXPECT_EQ(cfg.association.clustering, association::ClusteringPolicy::NearestTrack);
    EXPECT_EQ(cfg.association.max_cluster_size, 8u);
    EXPECT_NO_THROW(cfg.validate());
}

TEST(TrackerConfigTest, EmptyObjectKeepsDefaults) {
    auto cfg = config::from_json(json::object());
    EXPECT_DOUBLE_EQ(cfg.filter.plant_noise, 20.0);
    EXPECT_DOUBLE_EQ(cfg.grouping.time_window, 50.0);
}

TEST(TrackerConfigTest, ParsesEveryKey) {
    json j = json::parse(R"({
        "filter": {
            "plant_noise": 5.0,
            "measurement_noise": [[4, 0, 0], [0, 4, 0], [0, 0, 9]],
            "initial_covariance": 10,
            "innovation": "prior"
        },
        "grouping": { "time_window": 25 },
        "association": {
            "covariance": 2.5,
            "gate_dof": 2,
            "clustering": "all",
            "max_cluster_size": 4
        }
    })");

    auto cfg = config::from_json(j);

    EXPECT_DOUBLE_EQ(cfg.filter.plant_noise, 5.0);
    EXPECT_DOUBLE_EQ(cfg.filter.measurement_noise(0, 0), 4.0);
    EXPECT_DOUBLE_EQ(cfg.filter.measurement_noise(2, 2), 9.0);
    EXPECT_DOUBLE_EQ(cfg.filter.measurement_noise(0, 1), 0.0);
    EXPECT_TRUE(cfg.filter.initial_covariance.isApprox(common::Matrix6d::Identity() * 10.0));
    EXPECT_EQ(cfg.filter.innovation, filtering::InnovationReference::PriorState);
    EXPECT_DOUBLE_EQ(cfg.grouping.time_window, 25.0);
    EXPECT_TRUE(cfg.association.covariance.isApprox(Eigen::Matrix3d::Identity() * 2.5));
    EXPECT_EQ(cfg.association.gate_dof, 2);
    EXPECT_EQ(cfg.association.clustering, association::ClusteringPolicy::AllGated);
    EXPECT_EQ(cfg.association.max_cluster_size, 4u);
}

TEST(TrackerConfigTest, ToJsonRoundTrip) {
    config::TrackerConfig original;
    original.filter.plant_noise = 3.0;
    original.filter.innovation = filtering::InnovationReference::PriorState;
    original.grouping.time_window = 12.0;
    original.association.clustering = association::ClusteringPolicy::AllGated;
    original.association.covariance(1, 1) = 2.0;

    auto restored = config::from_json(config::to_json(original));

    EXPECT_DOUBLE_EQ(restored.filter.plant_noise, 3.0);
    EXPECT_EQ(restored.filter.innovation, filtering::InnovationReference::PriorState);
    EXPECT_DOUBLE_EQ(restored.grouping.time_window, 12.0);
    EXPECT_EQ(restored.association.clustering, association::ClusteringPolicy::AllGated);
    EXPECT_TRUE(restored.association.covariance.isApprox(original.association.covariance));
}

TEST(TrackerConfigTest, RejectsMalformedValues) {
    EXPECT_THROW(config::from_json(json::array()), std::invalid_argument);
    EXPECT_THROW(config::from_json(json::parse(R"({"filter": {"plant_noise": "high"}})")), std::invalid_argument);
    EXPECT_THROW(config::from_json(json::parse(R"({"filter": {"measurement_noise": [[1, 0], [0, 1]]}})")), std::invalid_argument);
    EXPECT_THROW(config::from_json(json::parse(R"({"filter": {"innovation": "sideways"}})")), std::invalid_argument);
    EXPECT_THROW(config::from_json(json::parse(R"({"association": {"gate_dof": 1.5}})")), std::invalid_argument);
    EXPECT_THROW(config::from_json(json::parse(R"({"association": {"max_cluster_size": -1}})")), std::invalid_argument);
}

TEST(TrackerConfigTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(config::from_json(json::parse(R"({"filter": {"plant_noise": -1}})")), std::invalid_argument);
    EXPECT_THROW(config::from_json(json::parse(R"({"grouping": {"time_window": 0}})")), std::invalid_argument);
    EXPECT_THROW(config::from_json(json::parse(R"({"association": {"covariance": 0}})")), std::invalid_argument);
    EXPECT_THROW(config::from_json(json::parse(R"({"association": {"gate_dof": 12}})")), std::invalid_argument);
    EXPECT_THROW(config::from_json(json::parse(R"({"association": {"max_cluster_size": 0}})")), std::invalid_argument);
}

TEST(TrackerConfigTest, RejectsIndefiniteCovariance) {
    config::TrackerConfig cfg;
    cfg.filter.measurement_noise(0, 0) = -1.0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(TrackerConfigTest, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "tracker_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"grouping": {"time_window": 75}, "association": {"clustering": "all"}})";
    }

    auto cfg = config::load_config(path);
    EXPECT_DOUBLE_EQ(cfg.grouping.time_window, 75.0);
    EXPECT_EQ(cfg.association.clustering, association::ClusteringPolicy::AllGated);
}

TEST(TrackerConfigTest, LoadReportsMissingAndInvalidFiles) {
    EXPECT_THROW(config::load_config(::testing::TempDir() + "does_not_exist.json"), std::runtime_error);

    const std::string path = ::testing::TempDir() + "tracker_config_broken.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(config::load_config(path), std::runtime_error);
}
