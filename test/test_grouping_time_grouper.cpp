#include <gtest/gtest.h>

#include "grouping/time_grouper.hpp"
#include "common/types.hpp"

#include <algorithm>

using grouping::ReportGroup;
using grouping::TimeGrouper;

namespace {
common::ReportBatch reports_at(std::initializer_list<double> times) {
    common::ReportBatch reports;
    for (double t : times) {
        reports.emplace_back(0.0, 0.0, 0.0, t, static_cast<int>(reports.size()));
    }
    return reports;
}
}

TEST(TimeGrouperTest, DefaultWindow) {
    TimeGrouper grouper;
    EXPECT_DOUBLE_EQ(grouper.time_window(), 50.0);
}

TEST(TimeGrouperTest, EmptyBatchYieldsNoGroups) {
    TimeGrouper grouper;
    EXPECT_TRUE(grouper.group({}).empty());
}

TEST(TimeGrouperTest, SingleReportFormsOneGroup) {
    TimeGrouper grouper;
    auto groups = grouper.group(reports_at({12.0}));

    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0], (ReportGroup{0}));
}

TEST(TimeGrouperTest, ReportsWithinWindowShareGroup) {
    TimeGrouper grouper(50.0);
    auto groups = grouper.group(reports_at({0.0, 10.0, 49.9, 60.0, 100.0, 120.0}));

    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0], (ReportGroup{0, 1, 2}));
    EXPECT_EQ(groups[1], (ReportGroup{3, 4}));
    // 120 is 60 past the seed at 60
    EXPECT_EQ(groups[2], (ReportGroup{5}));
}

TEST(TimeGrouperTest, WindowIsExclusive) {
    TimeGrouper grouper(50.0);
    auto groups = grouper.group(reports_at({0.0, 50.0}));

    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0], (ReportGroup{0}));
    EXPECT_EQ(groups[1], (ReportGroup{1}));
}

TEST(TimeGrouperTest, WindowIsMeasuredFromSeed) {
    // Consecutive gaps are small but the chain spans more than one window
    TimeGrouper grouper(10.0);
    auto groups = grouper.group(reports_at({0.0, 6.0, 12.0, 18.0}));

    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0], (ReportGroup{0, 1}));
    EXPECT_EQ(groups[1], (ReportGroup{2, 3}));
}

TEST(TimeGrouperTest, UnsortedInputIsGroupedInTimeOrder) {
    TimeGrouper grouper(50.0);
    auto groups = grouper.group(reports_at({200.0, 5.0, 210.0, 0.0}));

    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0], (ReportGroup{3, 1}));
    EXPECT_EQ(groups[1], (ReportGroup{0, 2}));
}

TEST(TimeGrouperTest, EqualTimesKeepInputOrder) {
    TimeGrouper grouper;
    auto groups = grouper.group(reports_at({3.0, 3.0, 3.0}));

    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0], (ReportGroup{0, 1, 2}));
}

TEST(TimeGrouperTest, EveryReportLandsInExactlyOneGroup) {
    TimeGrouper grouper(7.5);
    auto reports = reports_at({13.0, 2.0, 40.0, 8.0, 9.5, 41.0, 100.0, 3.3, 27.0});
    auto groups = grouper.group(reports);

    std::vector<std::size_t> seen;
    for (const auto& group : groups) {
        ASSERT_FALSE(group.empty());
        const double seed = reports[group.front()].time();
        for (std::size_t index : group) {
            EXPECT_GE(reports[index].time(), seed);
            EXPECT_LT(reports[index].time() - seed, 7.5);
            seen.push_back(index);
        }
    }

    std::sort(seen.begin(), seen.end());
    ASSERT_EQ(seen.size(), reports.size());
    for (std::size_t i = 0; i < seen.size(); ++i) {
        EXPECT_EQ(seen[i], i);
    }
}

TEST(TimeGrouperTest, RejectsInvalidWindow) {
    EXPECT_THROW(TimeGrouper(0.0), std::invalid_argument);
    EXPECT_THROW(TimeGrouper(-1.0), std::invalid_argument);
}
