/*
Turnout – TimeIndex Tests
Role: Verify observation timestamp generation and the prior-round mapping
Coverage: Day rollover, window end, current-hour cap, top-of-hour refusal, ordering
*/
#include <gtest/gtest.h>
#include "election/time/TimeIndex.hpp"

namespace {

WallTime at(int day, int hour, int minute, int second = 0) {
    return WallTime{2025, 5, day, hour, minute, second};
}

} // namespace

TEST(TimeIndex, RollsOverMidnightAndStopsAtCurrentHour) {
    const auto index = TimeIndex::generate(at(16, 10, 30), {15, 22}, {18, 21});

    ASSERT_EQ(index.size(), 13u);
    EXPECT_EQ(index.front(), (ObservationTimestamp{15, 22}));
    EXPECT_EQ(index[1], (ObservationTimestamp{15, 23}));
    EXPECT_EQ(index[2], (ObservationTimestamp{16, 0}));
    EXPECT_EQ(index.back(), (ObservationTimestamp{16, 10}));
}

TEST(TimeIndex, EmptyAtTopOfHour) {
    EXPECT_TRUE(TimeIndex::generate(at(16, 10, 0), {15, 22}, {18, 21}).empty());
    EXPECT_TRUE(TimeIndex::generate(at(16, 10, 0, 59), {15, 22}, {18, 21}).empty());
    EXPECT_TRUE(TimeIndex::generate(at(18, 23, 0), {15, 22}, {18, 21}).empty());
}

TEST(TimeIndex, NonZeroMinuteIsAccepted) {
    EXPECT_FALSE(TimeIndex::generate(at(16, 10, 1), {15, 22}, {18, 21}).empty());
    EXPECT_FALSE(TimeIndex::generate(at(16, 10, 59), {15, 22}, {18, 21}).empty());
}

TEST(TimeIndex, NeverReachesWindowEnd) {
    const ObservationTimestamp end{18, 21};
    const auto index = TimeIndex::generate(at(20, 5, 30), {15, 22}, end);

    ASSERT_FALSE(index.empty());
    EXPECT_EQ(index.back(), (ObservationTimestamp{18, 20}));
    for (const auto& ts : index) {
        EXPECT_LT(ts, end);
    }
    // 2 hours on day 15, 24 on 16 and 17, 21 on 18
    EXPECT_EQ(index.size(), 2u + 24u + 24u + 21u);
}

TEST(TimeIndex, EmptyBeforeWindowStarts) {
    EXPECT_TRUE(TimeIndex::generate(at(15, 21, 30), {15, 22}, {18, 21}).empty());
    EXPECT_TRUE(TimeIndex::generate(at(14, 23, 30), {15, 22}, {18, 21}).empty());
}

TEST(TimeIndex, StrictlyIncreasingAndCappedAtNow) {
    for (int day = 15; day <= 18; ++day) {
        for (int hour = 0; hour < 24; ++hour) {
            const auto now = at(day, hour, 17);
            const auto index = TimeIndex::generate(now, {15, 22}, {18, 21});
            for (std::size_t i = 1; i < index.size(); ++i) {
                EXPECT_LT(index[i - 1], index[i]);
            }
            for (const auto& ts : index) {
                EXPECT_LE(ts, (ObservationTimestamp{day, hour}));
            }
        }
    }
}

TEST(TimeIndex, NextAdvancesHourAndDay) {
    EXPECT_EQ(TimeIndex::next({15, 22}), (ObservationTimestamp{15, 23}));
    EXPECT_EQ(TimeIndex::next({15, 23}), (ObservationTimestamp{16, 0}));
}

TEST(TimeIndex, PriorRoundKeepsHour) {
    static_assert(TimeIndex::priorRound({16, 10}, 14) == ObservationTimestamp{2, 10});
    EXPECT_EQ(TimeIndex::priorRound({18, 0}, 14), (ObservationTimestamp{4, 0}));
}
