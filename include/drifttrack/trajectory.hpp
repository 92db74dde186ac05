/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __DRIFTTRACK_TRAJECTORY_HPP
#define __DRIFTTRACK_TRAJECTORY_HPP

#include <drifttrack/profile.hpp>
#include <drifttrack/timeutil.hpp>

#include <optional>
#include <vector>

namespace drifttrack {

/**
 * One drift prediction request.
 */
struct DriftRequest {
    double latitude;        ///< Last known latitude in degrees
    double longitude;       ///< Last known longitude in degrees
    time_point startTime;   ///< Incident time (UTC)
    double hours;           ///< Drift duration in hours (> 0)
    ObjectType objectType;  ///< What is drifting
};

/**
 * A recorded position along a drift trajectory.
 */
struct TrajectoryPoint {
    double lat;             ///< Latitude in degrees
    double lon;             ///< Longitude in degrees
    double hoursElapsed;    ///< Hours since the incident (>= 0)
    time_point timestamp;   ///< Incident time plus hoursElapsed
};

/**
 * Ordered positions; the first point is always the initial position at
 * hoursElapsed == 0 and hoursElapsed never decreases.
 */
using Trajectory = std::vector<TrajectoryPoint>;

/**
 * Linearly interpolate the position at a given elapsed time.
 * @return nullopt if the trajectory has fewer than two points or the time
 *         lies outside it
 */
std::optional<TrajectoryPoint> interpolatePosition(const Trajectory &trajectory, double hours);

/** Sum of great-circle distances between successive points, in kilometers */
double pathLengthKm(const Trajectory &trajectory);

} // namespace drifttrack

#endif
