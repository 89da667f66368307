#include <gtest/gtest.h>

#include "association/hypothesis_generator.hpp"
#include "common/types.hpp"

#include <set>
#include <vector>

using association::GateMask;
using association::HypothesisGenerator;

namespace {

std::vector<common::Hypothesis> drain(HypothesisGenerator& generator) {
    std::vector<common::Hypothesis> hypotheses;
    while (auto hypothesis = generator.next()) {
        hypotheses.push_back(*hypothesis);
    }
    return hypotheses;
}

// At least one track assigned and no report assigned twice
bool is_valid(const common::Hypothesis& hypothesis) {
    std::set<std::size_t> reports;
    bool any = false;
    for (const auto& assignment : hypothesis) {
        if (assignment.report.has_value()) {
            if (!reports.insert(*assignment.report).second) {
                return false;
            }
            any = true;
        }
    }
    return any;
}

} // namespace

TEST(HypothesisGeneratorTest, SingleTrackTwoReports) {
    HypothesisGenerator generator({0}, 2);
    auto hypotheses = drain(generator);

    ASSERT_EQ(hypotheses.size(), 2u);
    EXPECT_EQ(hypotheses[0], (common::Hypothesis{{0, 0}}));
    EXPECT_EQ(hypotheses[1], (common::Hypothesis{{0, 1}}));
    EXPECT_EQ(generator.combination_count(), 3u);
}

TEST(HypothesisGeneratorTest, TwoTracksTwoReports) {
    HypothesisGenerator generator({0, 1}, 2);
    auto hypotheses = drain(generator);

    EXPECT_EQ(generator.combination_count(), 9u);
    EXPECT_EQ(generator.valid_count(), 6u);
    ASSERT_EQ(hypotheses.size(), 6u);

    // The first track is the least significant digit
    EXPECT_EQ(hypotheses[0], (common::Hypothesis{{0, 0}, {1, std::nullopt}}));
    EXPECT_EQ(hypotheses[1], (common::Hypothesis{{0, 1}, {1, std::nullopt}}));
    EXPECT_EQ(hypotheses[2], (common::Hypothesis{{0, std::nullopt}, {1, 0}}));
    EXPECT_EQ(hypotheses[3], (common::Hypothesis{{0, 1}, {1, 0}}));
    EXPECT_EQ(hypotheses[4], (common::Hypothesis{{0, std::nullopt}, {1, 1}}));
    EXPECT_EQ(hypotheses[5], (common::Hypothesis{{0, 0}, {1, 1}}));
}

TEST(HypothesisGeneratorTest, EveryHypothesisIsValidAndDistinct) {
    HypothesisGenerator generator({1, 4, 6}, 3);
    auto hypotheses = drain(generator);

    EXPECT_EQ(hypotheses.size(), generator.valid_count());

    std::set<std::vector<long>> seen;
    for (const auto& hypothesis : hypotheses) {
        ASSERT_EQ(hypothesis.size(), 3u);
        EXPECT_TRUE(is_valid(hypothesis));
        EXPECT_EQ(hypothesis[0].track, 1u);
        EXPECT_EQ(hypothesis[1].track, 4u);
        EXPECT_EQ(hypothesis[2].track, 6u);

        std::vector<long> key;
        for (const auto& a : hypothesis) {
            key.push_back(a.report.has_value() ? static_cast<long>(*a.report) : -1);
        }
        EXPECT_TRUE(seen.insert(key).second);
    }
}

TEST(HypothesisGeneratorTest, ValidCountClosedForm) {
    // sum_k C(N, k) * R! / (R - k)!
    EXPECT_EQ(HypothesisGenerator({0, 1, 2}, 2).valid_count(), 12u);
    EXPECT_EQ(HypothesisGenerator({0, 1, 2}, 3).valid_count(), 33u);
    EXPECT_EQ(HypothesisGenerator({0}, 5).valid_count(), 5u);
    EXPECT_EQ(HypothesisGenerator({0, 1}, 0).valid_count(), 0u);

    HypothesisGenerator generator({0, 1, 2, 3}, 3);
    EXPECT_EQ(drain(generator).size(), generator.valid_count());
}

TEST(HypothesisGeneratorTest, NoReportsYieldsNothing) {
    HypothesisGenerator generator({0, 1}, 0);
    EXPECT_EQ(generator.combination_count(), 1u);
    EXPECT_FALSE(generator.next().has_value());
}

TEST(HypothesisGeneratorTest, ExhaustedGeneratorStaysExhausted) {
    HypothesisGenerator generator({0}, 1);
    ASSERT_TRUE(generator.next().has_value());
    EXPECT_FALSE(generator.next().has_value());
    EXPECT_FALSE(generator.next().has_value());
}

TEST(HypothesisGeneratorTest, ResetRestartsSequence) {
    HypothesisGenerator generator({0, 1}, 3);
    auto first = drain(generator);

    generator.reset();
    auto second = drain(generator);

    EXPECT_EQ(first, second);
}

TEST(HypothesisGeneratorTest, GateMaskExcludesPairs) {
    GateMask mask(2, 2);
    mask << true, false,
            true, true;

    HypothesisGenerator generator({0, 1}, 2, mask);
    auto hypotheses = drain(generator);

    // Track 0 may only take report 0
    ASSERT_EQ(hypotheses.size(), 4u);
    for (const auto& hypothesis : hypotheses) {
        EXPECT_TRUE(is_valid(hypothesis));
        EXPECT_NE(hypothesis[0].report, std::optional<std::size_t>(1));
    }
    EXPECT_LE(hypotheses.size(), generator.valid_count());
}

TEST(HypothesisGeneratorTest, GateMaskCanExcludeEverything) {
    GateMask mask = GateMask::Constant(1, 3, false);
    HypothesisGenerator generator({0}, 3, mask);
    EXPECT_FALSE(generator.next().has_value());
}

TEST(HypothesisGeneratorTest, GateMaskBoundsCounterSpace) {
    const std::size_t pool = 5000;
    GateMask mask = GateMask::Constant(3, pool, false);
    mask.col(42).setConstant(true);

    HypothesisGenerator generator({0, 1, 2}, pool, mask);

    // Base 2 per track instead of pool + 1
    EXPECT_EQ(generator.combination_count(), 8u);
    EXPECT_EQ(generator.valid_count(), 7u);
    EXPECT_EQ(generator.candidates(1), (std::vector<std::size_t>{42}));

    auto hypotheses = drain(generator);
    ASSERT_EQ(hypotheses.size(), 3u);
    EXPECT_EQ(hypotheses[0], (common::Hypothesis{{0, 42}, {1, std::nullopt}, {2, std::nullopt}}));
    EXPECT_EQ(hypotheses[1], (common::Hypothesis{{0, std::nullopt}, {1, 42}, {2, std::nullopt}}));
    EXPECT_EQ(hypotheses[2], (common::Hypothesis{{0, std::nullopt}, {1, std::nullopt}, {2, 42}}));
}

TEST(HypothesisGeneratorTest, ValidCountOnLargeSpaces) {
    // 60 tracks, 1 report: 60 valid hypotheses out of 2^60 combinations
    std::vector<std::size_t> tracks(60);
    for (std::size_t i = 0; i < tracks.size(); ++i) {
        tracks[i] = i;
    }
    EXPECT_EQ(HypothesisGenerator(tracks, 1).valid_count(), 60u);

    // 4 tracks over a large pool stays within the counter space
    HypothesisGenerator generator({0, 1, 2, 3}, 60000);
    EXPECT_LE(generator.valid_count(), generator.combination_count() - 1);
    EXPECT_GT(generator.valid_count(), std::size_t{60000} * 59999 * 59998);
}

TEST(HypothesisGeneratorTest, RejectsMismatchedMask) {
    GateMask mask = GateMask::Constant(2, 2, true);
    EXPECT_THROW(HypothesisGenerator({0, 1}, 3, mask), std::invalid_argument);
    EXPECT_THROW(HypothesisGenerator({0, 2}, 2, mask), std::invalid_argument);
}

TEST(HypothesisGeneratorTest, ThrowsWhenCounterOverflows) {
    std::vector<std::size_t> tracks(64);
    for (std::size_t i = 0; i < tracks.size(); ++i) {
        tracks[i] = i;
    }
    EXPECT_THROW(HypothesisGenerator(tracks, 1), std::overflow_error);
}
