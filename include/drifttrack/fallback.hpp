/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __DRIFTTRACK_FALLBACK_HPP
#define __DRIFTTRACK_FALLBACK_HPP

#include <drifttrack/profile.hpp>
#include <drifttrack/trajectory.hpp>

namespace drifttrack {

// Constant drift rates used when no current data can be sampled
constexpr double FALLBACK_LAT_DEGREES_PER_HOUR = 0.01;
constexpr double FALLBACK_LON_DEGREES_PER_HOUR = 0.015;

/**
 * Field-independent drift estimate.
 *
 * Moves the object north-east at constant rates scaled by the profile's
 * current and drag factors, one point per whole hour. The result is a
 * deterministic, degraded estimate; it is never an error.
 */
class FallbackEstimator {
public:
    static Trajectory estimate(const DriftRequest &request, const ObjectProfile &profile);
};

} // namespace drifttrack

#endif
