/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <drifttrack/integrator.hpp>
#include <drifttrack/fallback.hpp>
#include <drifttrack/geo.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::warn;

namespace drifttrack {

// ============================================================================
// Enum Output
// ============================================================================

std::ostream& operator<<(std::ostream &os, const IntegratorState &state) {
    switch (state) {
        case IntegratorState::Initializing:
            os << "Initializing";
            break;
        case IntegratorState::Stepping:
            os << "Stepping";
            break;
        case IntegratorState::Finalized:
            os << "Finalized";
            break;
    }
    return os;
}

std::ostream& operator<<(std::ostream &os, const IntegrationMethod &method) {
    switch (method) {
        case IntegrationMethod::FieldIntegration:
            os << "field_integration";
            break;
        case IntegrationMethod::Fallback:
            os << "fallback";
            break;
    }
    return os;
}

std::ostream& operator<<(std::ostream &os, const Termination &termination) {
    switch (termination) {
        case Termination::Completed:
            os << "completed";
            break;
        case Termination::Cancelled:
            os << "cancelled";
            break;
        case Termination::DeadlineExceeded:
            os << "deadline_exceeded";
            break;
    }
    return os;
}

template <typename T>
static std::string str(const T &value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

// Whole steps in a duration, counted in minutes so that 4.1 h at 1 minute is 246
static double wholeSteps(double hours, int stepMinutes) {
    return std::floor(hours * 60.0 / stepMinutes + 1e-9);
}

// ============================================================================
// Validation
// ============================================================================

void validateOptions(const IntegratorOptions &options) {
    if (options.stepMinutes <= 0 || 60 % options.stepMinutes != 0) {
        throw InvalidInputException(std::format(
            "Step size must be a positive divisor of 60 minutes, got {}", options.stepMinutes));
    }
    if (options.recordIntervalMinutes <= 0 || options.recordIntervalMinutes % options.stepMinutes != 0) {
        throw InvalidInputException(std::format(
            "Record interval must be a positive multiple of the step size ({} minutes), got {}",
            options.stepMinutes, options.recordIntervalMinutes));
    }
    if (options.maxSteps <= 0) {
        throw InvalidInputException(std::format(
            "Maximum step count must be positive, got {}", options.maxSteps));
    }
}

DriftIntegrator::DriftIntegrator(const ObjectProfileTable &profiles, IntegratorOptions options)
    : profiles_(profiles), options_(std::move(options)) {
    validateOptions(options_);
}

const IntegratorOptions& DriftIntegrator::getOptions() const {
    return options_;
}

void DriftIntegrator::validateRequest(const DriftRequest &request) const {
    if (!isValidCoordinate(request.latitude, request.longitude)) {
        throw InvalidInputException(std::format(
            "Invalid position: latitude {} longitude {}", request.latitude, request.longitude));
    }
    if (!std::isfinite(request.hours) || request.hours <= 0.0) {
        throw InvalidInputException(std::format(
            "Drift duration must be a positive number of hours, got {}", request.hours));
    }

    double steps = wholeSteps(request.hours, options_.stepMinutes);
    if (steps > static_cast<double>(options_.maxSteps)) {
        throw InvalidInputException(std::format(
            "{} hours at {} minute steps needs {:.0f} steps, more than the limit of {}",
            request.hours, options_.stepMinutes, steps, options_.maxSteps));
    }
}

bool DriftIntegrator::shouldStop(Termination &reason) const {
    if (options_.cancelFlag != nullptr && options_.cancelFlag->load(std::memory_order_relaxed)) {
        reason = Termination::Cancelled;
        return true;
    }
    if (options_.deadline && std::chrono::steady_clock::now() >= *options_.deadline) {
        reason = Termination::DeadlineExceeded;
        return true;
    }
    return false;
}

// ============================================================================
// Integration
// ============================================================================

IntegrationResult DriftIntegrator::integrate(const DriftRequest &request, const VelocityField &field) const {
    IntegratorState state = IntegratorState::Initializing;
    debug("Integrator {}: {} for {} hours as {}", str(state),
        formatCoordinates(request.latitude, request.longitude), request.hours,
        toIdentifier(request.objectType));

    validateRequest(request);

    IntegrationResult result;
    result.profile = profiles_.lookup(request.objectType);
    const auto &profile = result.profile;

    if (!field.isAvailable()) {
        result.method = IntegrationMethod::Fallback;
        result.degraded = true;
        result.fallbackReason = field.unavailableReason();
        warn("Current field unavailable ({}), using fallback drift estimate", result.fallbackReason);
        result.trajectory = FallbackEstimator::estimate(request, profile);
        state = IntegratorState::Finalized;
        debug("Integrator {}: fallback with {} points", str(state), result.trajectory.size());
        return result;
    }

    const double stepHours = options_.stepMinutes / 60.0;
    const double stepSeconds = options_.stepMinutes * 60.0;
    const auto stepDuration = std::chrono::minutes(options_.stepMinutes);
    const std::int64_t totalSteps = static_cast<std::int64_t>(wholeSteps(request.hours, options_.stepMinutes));
    const std::int64_t stepsPerRecord = options_.recordIntervalMinutes / options_.stepMinutes;
    const double scale = profile.currentFactor * profile.dragFactor;

    double lat = request.latitude;
    double lon = request.longitude;

    result.trajectory.push_back({
        .lat = lat,
        .lon = lon,
        .hoursElapsed = 0.0,
        .timestamp = request.startTime
    });

    state = IntegratorState::Stepping;
    debug("Integrator {}: {} steps of {} minutes, recording every {} steps",
        str(state), totalSteps, options_.stepMinutes, stepsPerRecord);

    for (std::int64_t k = 1; k <= totalSteps; k++) {
        Termination reason;
        if (shouldStop(reason)) {
            result.termination = reason;
            break;
        }

        time_point stepTime = request.startTime + stepDuration * k;

        double dLat = 0.0;
        double dLon = 0.0;
        bool degradedStep = false;

        try {
            auto sample = field.sample(stepTime, lat, lon);
            switch (sample.status) {
                case SampleStatus::Ok:
                    if (!std::isfinite(sample.u) || !std::isfinite(sample.v)) {
                        degradedStep = true;
                        break;
                    }
                    {
                        auto offset = metersToDegrees(sample.u * scale * stepSeconds,
                                                      sample.v * scale * stepSeconds, lat);
                        dLat = offset.dLat;
                        dLon = offset.dLon;
                    }
                    break;
                case SampleStatus::OutOfBounds:
                    if (result.outOfBoundsSamples == 0) {
                        warn("Drift left the current field at {} ({}), using zero velocity",
                            formatCoordinates(lat, lon), formatTimestamp(stepTime));
                    }
                    result.outOfBoundsSamples++;
                    break;
                case SampleStatus::NoData:
                    result.missingSamples++;
                    break;
            }
        } catch (const std::exception &err) {
            warn("Sampling failed at step {}: {}", k, err.what());
            degradedStep = true;
        }

        if (degradedStep) {
            dLat = DEGRADED_STEP_LAT_DEGREES_PER_HOUR * scale * stepHours;
            dLon = DEGRADED_STEP_LON_DEGREES_PER_HOUR * scale * stepHours;
            result.degradedSteps++;
            warn("Step {} degraded, applying default displacement", k);
        }

        lat = std::clamp(lat + dLat, -90.0, 90.0);
        lon = normalizeLongitude(lon + dLon);
        result.stepsTaken = k;

        if (k % stepsPerRecord == 0 || k == totalSteps) {
            result.trajectory.push_back({
                .lat = roundTo(lat, 6),
                .lon = roundTo(lon, 6),
                .hoursElapsed = k * stepHours,
                .timestamp = stepTime
            });
        }
    }

    if (result.termination != Termination::Completed) {
        double elapsed = result.stepsTaken * stepHours;
        warn("Integration stopped after {} of {} steps: {}",
            result.stepsTaken, totalSteps, str(result.termination));
        if (result.trajectory.size() == 1 || result.trajectory.back().hoursElapsed < elapsed) {
            result.trajectory.push_back({
                .lat = roundTo(lat, 6),
                .lon = roundTo(lon, 6),
                .hoursElapsed = elapsed,
                .timestamp = request.startTime + stepDuration * result.stepsTaken
            });
        }
    } else if (result.trajectory.size() == 1) {
        // Duration shorter than one step
        result.trajectory.push_back({
            .lat = roundTo(lat, 6),
            .lon = roundTo(lon, 6),
            .hoursElapsed = request.hours,
            .timestamp = addHours(request.startTime, request.hours)
        });
    }

    state = IntegratorState::Finalized;
    debug("Integrator {}: {} steps, {} points, {} out of bounds, {} missing, {} degraded",
        str(state), result.stepsTaken, result.trajectory.size(), result.outOfBoundsSamples,
        result.missingSamples, result.degradedSteps);

    return result;
}

} // namespace drifttrack
