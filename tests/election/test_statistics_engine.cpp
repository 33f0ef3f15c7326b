#include <gtest/gtest.h>
#include "election/stats/StatisticsEngine.hpp"

TEST(StatisticsEngine, DeltaPercentAgainstPriorRound) {
    auto d = StatisticsEngine::derive({120000}, {100000});
    ASSERT_EQ(d.deltaPercent.size(), 1u);
    EXPECT_DOUBLE_EQ(d.deltaPercent[0], 20.0);
}

TEST(StatisticsEngine, NegativeDelta) {
    auto d = StatisticsEngine::derive({75}, {100});
    EXPECT_DOUBLE_EQ(d.deltaPercent[0], -25.0);
}

TEST(StatisticsEngine, ZeroPriorGivesZeroDelta) {
    auto d = StatisticsEngine::derive({10, 0, 30}, {0, 0, 15});
    EXPECT_DOUBLE_EQ(d.deltaPercent[0], 0.0);
    EXPECT_DOUBLE_EQ(d.deltaPercent[1], 0.0);
    EXPECT_DOUBLE_EQ(d.deltaPercent[2], 100.0);
}

TEST(StatisticsEngine, HourlyIncreaseStartsAtZero) {
    auto d = StatisticsEngine::derive({50, 80, 80, 130}, {1, 1, 1, 1});
    EXPECT_EQ(d.hourlyIncrease, (std::vector<std::int64_t>{0, 30, 0, 50}));
}

TEST(StatisticsEngine, ShortPriorTreatedAsZero) {
    auto d = StatisticsEngine::derive({10, 20}, {5});
    ASSERT_EQ(d.deltaPercent.size(), 2u);
    EXPECT_DOUBLE_EQ(d.deltaPercent[0], 100.0);
    EXPECT_DOUBLE_EQ(d.deltaPercent[1], 0.0);
}

TEST(StatisticsEngine, EmptyInput) {
    auto d = StatisticsEngine::derive({}, {});
    EXPECT_TRUE(d.deltaPercent.empty());
    EXPECT_TRUE(d.hourlyIncrease.empty());
}

TEST(StatisticsEngine, ApplyFillsSeriesAndKeepsRunningIncrease) {
    SeriesPair s;
    s.current = {100, 150};
    s.prior = {100, 100};
    s.difference = {0, 50};
    s.runningIncrease = {100, 50};

    StatisticsEngine::apply(s);

    EXPECT_EQ(s.hourlyIncrease, (std::vector<std::int64_t>{0, 50}));
    EXPECT_EQ(s.runningIncrease, (std::vector<std::int64_t>{100, 50}));
    EXPECT_DOUBLE_EQ(s.deltaPercent[1], 50.0);
}
