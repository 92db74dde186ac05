/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <drifttrack/timeutil.hpp>

#include <array>
#include <format>
#include <sstream>

#include <date/date.h>
#include <spdlog/spdlog.h>

using spdlog::debug;

namespace drifttrack {

// Most specific first, so that a date-only format never claims a prefix
// of a longer timestamp
constexpr std::array<const char*, 5> TIMESTAMP_FORMATS = {
    "%Y-%m-%dT%H:%M:%SZ",
    "%Y-%m-%dT%H:%M:%S",
    "%Y-%m-%d %H:%M:%S",
    "%Y-%m-%d %H:%M",
    "%Y-%m-%d",
};

std::optional<time_point> parseTimestamp(std::string_view str) {
    for (const char* format : TIMESTAMP_FORMATS) {
        std::istringstream in{std::string(str)};
        time_point tp;
        in >> date::parse(format, tp);
        if (in.fail()) {
            continue;
        }
        // Reject partial matches
        if (in.peek() != std::char_traits<char>::eof()) {
            continue;
        }
        return tp;
    }
    debug("Could not parse timestamp: {}", str);
    return std::nullopt;
}

std::string formatTimestamp(time_point tp) {
    auto truncated = std::chrono::floor<std::chrono::seconds>(tp);
    return date::format("%Y-%m-%dT%H:%M:%SZ", truncated);
}

std::string formatDuration(double seconds) {
    if (seconds < 60.0) {
        return std::format("{:.1f} seconds", seconds);
    }
    if (seconds < 3600.0) {
        return std::format("{:.1f} minutes", seconds / 60.0);
    }
    if (seconds < 86400.0) {
        return std::format("{:.1f} hours", seconds / 3600.0);
    }
    return std::format("{:.1f} days", seconds / 86400.0);
}

time_point addHours(time_point tp, double hours) {
    using namespace std::chrono;
    return tp + duration_cast<system_clock::duration>(duration<double, std::ratio<3600>>{hours});
}

} // namespace drifttrack
