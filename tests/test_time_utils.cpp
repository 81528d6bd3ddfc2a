/**
 * @file test_time_utils.cpp
 * @brief Unit tests for time utility functions
 */

#include <gtest/gtest.h>
#include "utils/time_utils.hpp"
#include <chrono>
#include <thread>

using namespace aggbook;

// ============================================================================
// Clocks
// ============================================================================

TEST(TimeUtilsTest, GetTimestampNs) {
    uint64_t ts1 = get_timestamp_ns();
    uint64_t ts2 = get_timestamp_ns();

    EXPECT_GE(ts2, ts1);
    EXPECT_GT(ts1, 0);
}

TEST(TimeUtilsTest, MillisecondTimestampMatchesNanoseconds) {
    uint64_t ns = get_timestamp_ns();
    uint64_t ms = get_timestamp_ms();

    EXPECT_GE(ms, ns / 1000000ULL);
    EXPECT_LT(ms - ns / 1000000ULL, 1000);
}

TEST(TimeUtilsTest, MonotonicNeverGoesBackwards) {
    uint64_t prev = get_monotonic_ns();
    for (int i = 0; i < 1000; ++i) {
        uint64_t current = get_monotonic_ns();
        EXPECT_GE(current, prev);
        prev = current;
    }
}

TEST(TimeUtilsTest, MonotonicProgression) {
    uint64_t start = get_monotonic_ns();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    uint64_t elapsed_ns = get_monotonic_ns() - start;

    EXPECT_GE(elapsed_ns, 10'000'000);
}

TEST(TimeUtilsTest, MsToNs) {
    static_assert(ms_to_ns(1) == 1000000ULL, "ms_to_ns is constexpr");
    EXPECT_EQ(ms_to_ns(60000), 60000000000ULL);
    EXPECT_EQ(ms_to_ns(0), 0);
}

// ============================================================================
// ScopedTimer
// ============================================================================

TEST(TimeUtilsTest, ScopedTimer) {
    uint64_t duration_ns = 0;

    {
        ScopedTimer timer(duration_ns);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        EXPECT_GE(timer.elapsed_ns(), 5'000'000);
    }

    EXPECT_GE(duration_ns, 5'000'000);
}

// ============================================================================
// Formatting
// ============================================================================

TEST(TimeUtilsTest, NanosToIso8601) {
    EXPECT_EQ(nanos_to_iso8601(0), "1970-01-01T00:00:00.000000000Z");
    EXPECT_EQ(nanos_to_iso8601(1700000000123456789ULL), "2023-11-14T22:13:20.123456789Z");
}

TEST(TimeUtilsTest, FormatDuration) {
    EXPECT_EQ(format_duration(850), "850ns");
    EXPECT_EQ(format_duration(12400), "12.4us");
    EXPECT_EQ(format_duration(3200000), "3.2ms");
    EXPECT_EQ(format_duration(1500000000ULL), "1.5s");
}
