/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <drifttrack/trajectory.hpp>
#include <drifttrack/geo.hpp>

namespace drifttrack {

std::optional<TrajectoryPoint> interpolatePosition(const Trajectory &trajectory, double hours) {
    if (trajectory.size() < 2) {
        return std::nullopt;
    }

    for (std::size_t i = 0; i + 1 < trajectory.size(); i++) {
        const auto &a = trajectory[i];
        const auto &b = trajectory[i + 1];
        if (hours < a.hoursElapsed || hours > b.hoursElapsed) {
            continue;
        }
        if (b.hoursElapsed == a.hoursElapsed) {
            return a;
        }

        double factor = (hours - a.hoursElapsed) / (b.hoursElapsed - a.hoursElapsed);
        return TrajectoryPoint{
            .lat = roundTo(a.lat + factor * (b.lat - a.lat), 6),
            .lon = roundTo(a.lon + factor * (b.lon - a.lon), 6),
            .hoursElapsed = hours,
            .timestamp = addHours(trajectory.front().timestamp, hours)
        };
    }
    return std::nullopt;
}

double pathLengthKm(const Trajectory &trajectory) {
    double total = 0.0;
    for (std::size_t i = 1; i < trajectory.size(); i++) {
        total += distance(trajectory[i - 1].lat, trajectory[i - 1].lon,
                          trajectory[i].lat, trajectory[i].lon);
    }
    return total;
}

} // namespace drifttrack
