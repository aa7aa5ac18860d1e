#include "Statistics.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

TEST(StatisticsTest, SummarizesFiniteValues) {
    const ColumnStats stats = Statistics::calculateStats({4.0, 1.0, std::numeric_limits<double>::quiet_NaN(), 3.0, 2.0});
    EXPECT_EQ(stats.count, 4u);
    EXPECT_DOUBLE_EQ(stats.mean, 2.5);
    EXPECT_DOUBLE_EQ(stats.median, 2.5);
    EXPECT_DOUBLE_EQ(stats.min, 1.0);
    EXPECT_DOUBLE_EQ(stats.max, 4.0);
    EXPECT_NEAR(stats.stddev, std::sqrt(5.0 / 3.0), 1e-12);
}

TEST(StatisticsTest, OddCountMedianAndSingleValue) {
    EXPECT_DOUBLE_EQ(Statistics::calculateStats({9.0, 1.0, 5.0}).median, 5.0);

    const ColumnStats one = Statistics::calculateStats({7.0});
    EXPECT_EQ(one.count, 1u);
    EXPECT_DOUBLE_EQ(one.stddev, 0.0);
}

TEST(StatisticsTest, NothingFiniteGivesZeroStats) {
    const ColumnStats stats = Statistics::calculateStats({std::numeric_limits<double>::infinity()});
    EXPECT_EQ(stats.count, 0u);
    EXPECT_DOUBLE_EQ(stats.mean, 0.0);
}
