/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <drifttrack/fallback.hpp>
#include <drifttrack/geo.hpp>

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

using spdlog::debug;

namespace drifttrack {

Trajectory FallbackEstimator::estimate(const DriftRequest &request, const ObjectProfile &profile) {
    double scale = profile.currentFactor * profile.dragFactor;
    double latPerHour = FALLBACK_LAT_DEGREES_PER_HOUR * scale;
    double lonPerHour = FALLBACK_LON_DEGREES_PER_HOUR * scale;

    Trajectory trajectory;
    trajectory.push_back({
        .lat = request.latitude,
        .lon = request.longitude,
        .hoursElapsed = 0.0,
        .timestamp = request.startTime
    });

    int wholeHours = static_cast<int>(std::floor(request.hours));
    for (int h = 1; h <= wholeHours; h++) {
        double lat = std::clamp(request.latitude + latPerHour * h, -90.0, 90.0);
        double lon = normalizeLongitude(request.longitude + lonPerHour * h);
        trajectory.push_back({
            .lat = roundTo(lat, 6),
            .lon = roundTo(lon, 6),
            .hoursElapsed = static_cast<double>(h),
            .timestamp = request.startTime + std::chrono::hours(h)
        });
    }

    debug("Fallback trajectory: {} points, {:.4f} deg/h north, {:.4f} deg/h east",
        trajectory.size(), latPerHour, lonPerHour);

    return trajectory;
}

} // namespace drifttrack
