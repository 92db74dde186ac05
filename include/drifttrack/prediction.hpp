/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __DRIFTTRACK_PREDICTION_HPP
#define __DRIFTTRACK_PREDICTION_HPP

#include <drifttrack/field.hpp>
#include <drifttrack/integrator.hpp>
#include <drifttrack/profile.hpp>
#include <drifttrack/search.hpp>
#include <drifttrack/trajectory.hpp>

#include <iostream>
#include <string>

namespace drifttrack {

/**
 * Complete result of one drift prediction.
 */
struct DriftPrediction {
    DriftRequest request;
    IntegrationResult result;
    double totalDistanceKm;     ///< Great-circle distance from first to last point
    double pathLengthKm;        ///< Length of the recorded path
    double bearingDegrees;      ///< Bearing from first to last point
    SearchPatternResult searchPattern;

    const TrajectoryPoint& finalPosition() const { return result.trajectory.back(); }

    /** True if the fallback was used, any step degraded, or stepping stopped early */
    bool isDegraded() const;
};

/**
 * Run a prediction: integrate the trajectory, measure it and recommend a
 * search pattern.
 *
 * @throws InvalidInputException if the request or options are invalid
 */
DriftPrediction predictDrift(const DriftRequest &request,
                             const VelocityField &field,
                             const ObjectProfileTable &profiles = ObjectProfileTable::standard(),
                             const IntegratorOptions &options = IntegratorOptions{});

/**
 * Render a prediction as a JSON document.
 * @param pretty Indent the output for humans
 */
std::string toJSON(const DriftPrediction &prediction, bool pretty = true);

/**
 * Print a human-readable prediction report.
 */
void printPrediction(std::ostream &os, const DriftPrediction &prediction);

} // namespace drifttrack

#endif
