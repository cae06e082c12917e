/**
 * @file test_time_utils.cpp
 * @brief Unit tests for time utility functions
 */

#include <gtest/gtest.h>
#include <everify/utils/time_utils.h>

#include <thread>

using namespace everify::utils;

TEST(TimeUtilsTest, FormatIso8601_Epoch) {
    EXPECT_EQ(formatIso8601(fromUnixTimestamp(0)), "1970-01-01T00:00:00Z");
}

TEST(TimeUtilsTest, FormatIso8601_KnownTimestamp) {
    // 2021-01-01T00:00:00Z
    EXPECT_EQ(formatIso8601(fromUnixTimestamp(1609459200)), "2021-01-01T00:00:00Z");
}

TEST(TimeUtilsTest, FormatIso8601_Milliseconds) {
    auto tp = fromUnixTimestamp(1609459200) + std::chrono::milliseconds(42);
    EXPECT_EQ(formatIso8601(tp, true), "2021-01-01T00:00:00.042Z");
}

TEST(TimeUtilsTest, UnixRoundTripPreservesSeconds) {
    int64_t ts = 1700000000;
    EXPECT_EQ(toUnixTimestamp(fromUnixTimestamp(ts)), ts);
}

TEST(TimeUtilsTest, NowUnixIsCurrent) {
    int64_t before = toUnixTimestamp(now());
    int64_t current = nowUnix();
    EXPECT_GE(current, before);
    EXPECT_LE(current - before, 2);
}

TEST(TimeUtilsTest, ElapsedSecondsIsPositive) {
    auto start = std::chrono::steady_clock::now();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_GT(elapsedSeconds(start), 0.0);
}
