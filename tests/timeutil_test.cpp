/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <drifttrack/timeutil.hpp>

#include <chrono>

namespace drifttrack {
namespace {

using namespace std::chrono;

// 2023-06-01 12:30:00 UTC
const time_point REFERENCE = sys_days{year{2023}/June/1} + hours(12) + minutes(30);

TEST(ParseTimestampTest, SpaceSeparated) {
    auto tp = parseTimestamp("2023-06-01 12:30:00");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(*tp, REFERENCE);
}

TEST(ParseTimestampTest, WithoutSeconds) {
    auto tp = parseTimestamp("2023-06-01 12:30");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(*tp, REFERENCE);
}

TEST(ParseTimestampTest, ISO8601) {
    auto tp = parseTimestamp("2023-06-01T12:30:00Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(*tp, REFERENCE);

    auto noZone = parseTimestamp("2023-06-01T12:30:00");
    ASSERT_TRUE(noZone.has_value());
    EXPECT_EQ(*noZone, REFERENCE);
}

TEST(ParseTimestampTest, DateOnly) {
    auto tp = parseTimestamp("2023-06-01");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(*tp, time_point(sys_days{year{2023}/June/1}));
}

TEST(ParseTimestampTest, RejectsGarbage) {
    EXPECT_FALSE(parseTimestamp("").has_value());
    EXPECT_FALSE(parseTimestamp("yesterday").has_value());
    EXPECT_FALSE(parseTimestamp("2023-06-01 12:30:00 extra").has_value());
}

TEST(FormatTimestampTest, ISO8601) {
    EXPECT_EQ(formatTimestamp(REFERENCE), "2023-06-01T12:30:00Z");
}

TEST(FormatTimestampTest, TruncatesFractionalSeconds) {
    EXPECT_EQ(formatTimestamp(REFERENCE + milliseconds(750)), "2023-06-01T12:30:00Z");
}

TEST(FormatDurationTest, Units) {
    EXPECT_EQ(formatDuration(12.0), "12.0 seconds");
    EXPECT_EQ(formatDuration(300.0), "5.0 minutes");
    EXPECT_EQ(formatDuration(3.5 * 3600.0), "3.5 hours");
    EXPECT_EQ(formatDuration(2.0 * 86400.0), "2.0 days");
}

TEST(AddHoursTest, FractionalHours) {
    EXPECT_EQ(addHours(REFERENCE, 1.5), REFERENCE + minutes(90));
    EXPECT_EQ(addHours(REFERENCE, 0.0), REFERENCE);
}

}  // namespace
}  // namespace drifttrack
