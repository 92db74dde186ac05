/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __DRIFTTRACK_TIMEUTIL_HPP
#define __DRIFTTRACK_TIMEUTIL_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace drifttrack {

using time_point = std::chrono::system_clock::time_point;

/**
 * Parse a UTC timestamp. Accepted formats:
 *   YYYY-MM-DD HH:MM:SS
 *   YYYY-MM-DD HH:MM
 *   YYYY-MM-DDTHH:MM:SS
 *   YYYY-MM-DDTHH:MM:SSZ
 *   YYYY-MM-DD
 * @return The parsed time, or nullopt if no format matched the whole string
 */
std::optional<time_point> parseTimestamp(std::string_view str);

/**
 * Format a time as ISO-8601 UTC with second precision (YYYY-MM-DDTHH:MM:SSZ).
 */
std::string formatTimestamp(time_point tp);

/**
 * Format a duration for humans ("12.0 seconds", "3.5 hours", "2.0 days").
 */
std::string formatDuration(double seconds);

/** Offset a time by a (possibly fractional) number of hours */
time_point addHours(time_point tp, double hours);

} // namespace drifttrack

#endif
