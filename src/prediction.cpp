/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <drifttrack/prediction.hpp>
#include <drifttrack/geo.hpp>
#include <drifttrack/timeutil.hpp>

#include <format>
#include <sstream>
#include <utility>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <spdlog/spdlog.h>

using spdlog::info;

namespace drifttrack {

bool DriftPrediction::isDegraded() const {
    return result.degraded
        || result.degradedSteps > 0
        || result.termination != Termination::Completed;
}

DriftPrediction predictDrift(const DriftRequest &request,
                             const VelocityField &field,
                             const ObjectProfileTable &profiles,
                             const IntegratorOptions &options) {
    DriftIntegrator integrator(profiles, options);
    auto result = integrator.integrate(request, field);

    const auto &first = result.trajectory.front();
    const auto &last = result.trajectory.back();
    double totalKm = distance(first.lat, first.lon, last.lat, last.lon);
    double heading = totalKm > 0.0 ? bearing(first.lat, first.lon, last.lat, last.lon) : 0.0;
    double pathKm = pathLengthKm(result.trajectory);
    auto pattern = recommend(request.hours, totalKm, request.objectType);

    info("Predicted drift of {:.2f} km toward {:.0f} deg over {} hours, recommending {}",
        totalKm, heading, request.hours, pattern.name);

    return DriftPrediction{
        .request = request,
        .result = std::move(result),
        .totalDistanceKm = totalKm,
        .pathLengthKm = pathKm,
        .bearingDegrees = heading,
        .searchPattern = std::move(pattern)
    };
}

// ============================================================================
// JSON Output
// ============================================================================

template <typename T>
static std::string str(const T &value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

template <typename Writer>
static void writePrediction(Writer &writer, const DriftPrediction &prediction) {
    const auto &request = prediction.request;
    const auto &result = prediction.result;
    const auto &last = prediction.finalPosition();

    writer.StartObject();

    writer.Key("status");
    writer.String(prediction.isDegraded() ? "degraded" : "success");
    writer.Key("orig_lat");
    writer.Double(request.latitude);
    writer.Key("orig_lon");
    writer.Double(request.longitude);
    writer.Key("new_lat");
    writer.Double(last.lat);
    writer.Key("new_lon");
    writer.Double(last.lon);
    writer.Key("drift_hours");
    writer.Double(request.hours);
    writer.Key("object_type");
    writer.String(std::string(toIdentifier(request.objectType)).c_str());
    writer.Key("incident_time");
    writer.String(formatTimestamp(request.startTime).c_str());
    writer.Key("total_distance_km");
    writer.Double(roundTo(prediction.totalDistanceKm, 2));
    writer.Key("path_length_km");
    writer.Double(roundTo(prediction.pathLengthKm, 2));
    writer.Key("bearing_deg");
    writer.Double(roundTo(prediction.bearingDegrees, 1));
    writer.Key("search_pattern_name");
    writer.String(prediction.searchPattern.name.c_str());
    writer.Key("search_pattern_description");
    writer.String(prediction.searchPattern.rationale.c_str());
    writer.Key("method");
    writer.String(str(result.method).c_str());
    writer.Key("termination");
    writer.String(str(result.termination).c_str());

    writer.Key("diagnostics");
    writer.StartObject();
    writer.Key("steps");
    writer.Int64(result.stepsTaken);
    writer.Key("out_of_bounds_samples");
    writer.Int64(result.outOfBoundsSamples);
    writer.Key("missing_samples");
    writer.Int64(result.missingSamples);
    writer.Key("degraded_steps");
    writer.Int64(result.degradedSteps);
    writer.Key("fallback_reason");
    if (result.fallbackReason.empty()) {
        writer.Null();
    } else {
        writer.String(result.fallbackReason.c_str());
    }
    writer.EndObject();

    writer.Key("drift_path");
    writer.StartArray();
    for (const auto &point : result.trajectory) {
        writer.StartObject();
        writer.Key("lat");
        writer.Double(point.lat);
        writer.Key("lon");
        writer.Double(point.lon);
        writer.Key("hours_elapsed");
        writer.Double(point.hoursElapsed);
        writer.Key("timestamp");
        writer.String(formatTimestamp(point.timestamp).c_str());
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();
}

std::string toJSON(const DriftPrediction &prediction, bool pretty) {
    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        writePrediction(writer, prediction);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        writePrediction(writer, prediction);
    }
    return buffer.GetString();
}

// ============================================================================
// Text Output
// ============================================================================

void printPrediction(std::ostream &os, const DriftPrediction &prediction) {
    constexpr std::string_view rowFormat = "{:>6} {:>22} {:>22} {:>22}";
    const auto &request = prediction.request;
    const auto &result = prediction.result;
    const auto &last = prediction.finalPosition();

    double elapsedHours = last.hoursElapsed;
    double meanSpeedKnots = elapsedHours > 0.0
        ? metersPerSecondToKnots(prediction.totalDistanceKm * 1000.0 / (elapsedHours * 3600.0))
        : 0.0;

    os << "Drift Prediction:" << std::endl;
    os << "  Object:         " << request.objectType << std::endl;
    os << "  Incident Time:  " << formatTimestamp(request.startTime) << std::endl;
    os << "  Duration:       " << formatDuration(request.hours * 3600.0) << std::endl;
    os << "  Last Known:     " << formatCoordinates(request.latitude, request.longitude) << std::endl;
    os << "  Predicted:      " << formatCoordinates(last.lat, last.lon) << std::endl;
    os << "  Distance:       " << std::format("{:.2f} km ({:.2f} NM)",
        prediction.totalDistanceKm, kilometersToNauticalMiles(prediction.totalDistanceKm)) << std::endl;
    os << "  Path Length:    " << std::format("{:.2f} km", prediction.pathLengthKm) << std::endl;
    os << "  Bearing:        " << std::format("{:.1f} deg ({})",
        prediction.bearingDegrees, bearingToCompass(prediction.bearingDegrees)) << std::endl;
    os << "  Mean Speed:     " << std::format("{:.2f} kn", meanSpeedKnots) << std::endl;
    os << "  Method:         " << result.method << (prediction.isDegraded() ? " (degraded)" : "") << std::endl;
    if (!result.fallbackReason.empty()) {
        os << "  Fallback:       " << result.fallbackReason << std::endl;
    }
    if (result.termination != Termination::Completed) {
        os << "  Stopped:        " << result.termination << " after " << result.stepsTaken << " steps" << std::endl;
    }
    if (result.outOfBoundsSamples > 0 || result.missingSamples > 0 || result.degradedSteps > 0) {
        os << "  Samples:        " << std::format("{} out of bounds, {} missing, {} degraded",
            result.outOfBoundsSamples, result.missingSamples, result.degradedSteps) << std::endl;
    }
    os << std::endl;

    os << "Search Pattern:   " << prediction.searchPattern.name << std::endl;
    os << "  " << prediction.searchPattern.rationale << std::endl;
    os << std::endl;

    std::string sep6(6, '-');
    std::string sep22(22, '-');
    os << "Drift Path:" << std::endl;
    os << std::format(rowFormat, "Hours", "Time", "Latitude", "Longitude") << std::endl;
    os << std::format(rowFormat, sep6, sep22, sep22, sep22) << std::endl;
    for (const auto &point : result.trajectory) {
        os << std::format(rowFormat,
            std::format("{:.2f}", point.hoursElapsed),
            formatTimestamp(point.timestamp),
            std::format("{:.6f}", point.lat),
            std::format("{:.6f}", point.lon)) << std::endl;
    }
}

} // namespace drifttrack
