/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __DRIFTTRACK_CURRENTS_HPP
#define __DRIFTTRACK_CURRENTS_HPP

#include <drifttrack/errors.hpp>
#include <drifttrack/field.hpp>
#include <drifttrack/geo.hpp>
#include <drifttrack/timeutil.hpp>

#include <cstdint>
#include <string>

namespace drifttrack {

// ============================================================================
// Current Field Files
// ============================================================================

/**
 * Parse a current field from JSON text.
 *
 * Expected layout:
 *   {
 *     "time":      ["2023-01-01T00:00:00Z", ...],
 *     "latitude":  [52.0, 52.5, ...],
 *     "longitude": [3.5, 4.0, ...],
 *     "uo": [[[...]]],    // [time][latitude][longitude], m/s east
 *     "vo": [[[...]]]     // same shape, m/s north
 *   }
 *
 * A null value marks an absent cell. Axes that parse but are not monotonic
 * produce an unavailable field rather than an error.
 *
 * @throws FieldFormatException if the document is malformed
 */
GridVelocityField parseVelocityField(const std::string &json);

/**
 * Load a current field from a JSON file (see parseVelocityField).
 *
 * @throws std::runtime_error if the file cannot be read
 * @throws FieldFormatException if the file is malformed
 */
GridVelocityField loadVelocityField(const std::string &path);

// ============================================================================
// Generated Fields
// ============================================================================

struct SyntheticFieldOptions {
    int gridSize = 20;          ///< Points per spatial axis (>= 2)
    double spanDegrees = 2.0;   ///< Half-width of the grid around the center
    double sigma = 0.2;         ///< Standard deviation of u and v in m/s
};

/**
 * Build a random current field around a position, for testing and for runs
 * without real data. The time axis is hourly from start through end
 * (floor(hours) + 1 steps). The grid spans center +/- spanDegrees on both
 * axes, clipped to valid coordinates. Values are normally distributed with
 * mean zero; the same seed always yields the same field.
 *
 * @throws InvalidInputException for an invalid center or options
 */
GridVelocityField makeSyntheticField(double centerLat, double centerLon,
                                     time_point start, time_point end,
                                     std::uint32_t seed,
                                     const SyntheticFieldOptions &options = SyntheticFieldOptions{});

/**
 * Build a field carrying the same (u, v) everywhere inside bounds and for
 * the whole of [start, end].
 *
 * @throws InvalidInputException if the velocity is not finite or the bounds
 *         are empty or invalid
 */
GridVelocityField makeUniformField(double u, double v, const BoundingBox &bounds,
                                   time_point start, time_point end);

/**
 * Convert a speed in knots and a heading (degrees clockwise from north, the
 * direction the current flows toward) to eastward and northward m/s.
 */
VelocitySample currentFromKnots(double knots, double headingDegrees);

} // namespace drifttrack

#endif
