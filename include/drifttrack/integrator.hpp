/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __DRIFTTRACK_INTEGRATOR_HPP
#define __DRIFTTRACK_INTEGRATOR_HPP

#include <drifttrack/errors.hpp>
#include <drifttrack/field.hpp>
#include <drifttrack/profile.hpp>
#include <drifttrack/trajectory.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace drifttrack {

// Displacement applied for a step whose sample failed (degrees per hour)
constexpr double DEGRADED_STEP_LAT_DEGREES_PER_HOUR = 0.001;
constexpr double DEGRADED_STEP_LON_DEGREES_PER_HOUR = 0.0015;

/**
 * Integration settings. Step size and recording cadence are independent,
 * but the cadence must be a whole number of steps.
 */
struct IntegratorOptions {
    int stepMinutes = 15;               ///< Euler step; must divide 60
    int recordIntervalMinutes = 60;     ///< Positive multiple of stepMinutes
    std::int64_t maxSteps = 100000;     ///< Requests needing more steps are rejected

    /** Stop stepping once this instant has passed */
    std::optional<std::chrono::steady_clock::time_point> deadline;

    /** Stop stepping once this flag is set (not owned) */
    const std::atomic<bool>* cancelFlag = nullptr;
};

/**
 * Throws InvalidInputException if the options cannot be used.
 */
void validateOptions(const IntegratorOptions &options);

enum class IntegratorState {
    Initializing,
    Stepping,
    Finalized
};

enum class IntegrationMethod {
    FieldIntegration,   ///< Forward Euler through the velocity field
    Fallback            ///< Field unavailable; constant-rate estimate
};

enum class Termination {
    Completed,
    Cancelled,
    DeadlineExceeded
};

std::ostream& operator<<(std::ostream &os, const IntegratorState &state);
std::ostream& operator<<(std::ostream &os, const IntegrationMethod &method);
std::ostream& operator<<(std::ostream &os, const Termination &termination);

/**
 * Trajectory plus the diagnostics gathered while computing it.
 */
struct IntegrationResult {
    Trajectory trajectory;
    ObjectProfile profile;
    IntegrationMethod method = IntegrationMethod::FieldIntegration;
    Termination termination = Termination::Completed;
    bool degraded = false;              ///< Set when the fallback produced the trajectory
    std::int64_t stepsTaken = 0;
    std::int64_t outOfBoundsSamples = 0;
    std::int64_t missingSamples = 0;
    std::int64_t degradedSteps = 0;
    std::string fallbackReason;         ///< Why the field was unavailable
};

/**
 * Lagrangian drift integrator.
 *
 * Advances a position with explicit forward Euler steps through a velocity
 * field. At each step k the field is sampled at the step time t_k and the
 * current position; the velocity is scaled by the profile's current and drag
 * factors, turned into meters over the step and converted to degrees at the
 * current latitude.
 *
 * The integrator keeps no state between calls; integrate() is const and may
 * be called concurrently for independent requests.
 *
 * Usage:
 *   DriftIntegrator integrator(ObjectProfileTable::standard(), options);
 *   auto result = integrator.integrate(request, field);
 */
class DriftIntegrator {
public:
    /**
     * @throws InvalidInputException if the options are invalid
     */
    explicit DriftIntegrator(const ObjectProfileTable &profiles,
                             IntegratorOptions options = IntegratorOptions{});

    /**
     * Compute the drift trajectory for a request.
     *
     * @throws InvalidInputException for invalid coordinates, a non-positive
     *         duration, or a duration needing more than maxSteps steps
     */
    IntegrationResult integrate(const DriftRequest &request, const VelocityField &field) const;

    const IntegratorOptions& getOptions() const;

private:
    const ObjectProfileTable &profiles_;
    IntegratorOptions options_;

    void validateRequest(const DriftRequest &request) const;
    bool shouldStop(Termination &reason) const;
};

} // namespace drifttrack

#endif
