/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <drifttrack/currents.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <limits>
#include <random>
#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;

namespace drifttrack {

// ============================================================================
// JSON Reader
// ============================================================================

static const rapidjson::Value& requireArray(const rapidjson::Value &parent, const char *name) {
    if (!parent.HasMember(name)) {
        throw FieldFormatException(std::format("Current field is missing \"{}\"", name));
    }
    const auto &value = parent[name];
    if (!value.IsArray()) {
        throw FieldFormatException(std::format("Current field \"{}\" is not an array", name));
    }
    return value;
}

static std::vector<double> readAxis(const rapidjson::Document &doc, const char *name) {
    std::vector<double> axis;
    for (const auto &item : requireArray(doc, name).GetArray()) {
        if (!item.IsNumber()) {
            throw FieldFormatException(std::format("Current field \"{}\" contains a non-numeric value", name));
        }
        axis.push_back(item.GetDouble());
    }
    return axis;
}

static std::vector<time_point> readTimes(const rapidjson::Document &doc) {
    std::vector<time_point> times;
    for (const auto &item : requireArray(doc, "time").GetArray()) {
        if (!item.IsString()) {
            throw FieldFormatException("Current field \"time\" contains a non-string value");
        }
        auto tp = parseTimestamp(item.GetString());
        if (!tp) {
            throw FieldFormatException(std::format("Invalid timestamp in current field: {}", item.GetString()));
        }
        times.push_back(*tp);
    }
    return times;
}

// Flattens a [time][lat][lon] array, checking its shape
static std::vector<double> readComponent(const rapidjson::Document &doc, const char *name,
                                         std::size_t nTimes, std::size_t nLats, std::size_t nLons) {
    const auto &cube = requireArray(doc, name);
    if (cube.Size() != nTimes) {
        throw FieldFormatException(std::format(
            "Current field \"{}\" has {} time slices, expected {}", name, cube.Size(), nTimes));
    }

    std::vector<double> values;
    values.reserve(nTimes * nLats * nLons);
    for (const auto &slice : cube.GetArray()) {
        if (!slice.IsArray() || slice.Size() != nLats) {
            throw FieldFormatException(std::format(
                "Current field \"{}\" has a time slice without {} latitude rows", name, nLats));
        }
        for (const auto &row : slice.GetArray()) {
            if (!row.IsArray() || row.Size() != nLons) {
                throw FieldFormatException(std::format(
                    "Current field \"{}\" has a row without {} longitude values", name, nLons));
            }
            for (const auto &cell : row.GetArray()) {
                if (cell.IsNull()) {
                    values.push_back(std::numeric_limits<double>::quiet_NaN());
                } else if (cell.IsNumber()) {
                    values.push_back(cell.GetDouble());
                } else {
                    throw FieldFormatException(std::format(
                        "Current field \"{}\" contains a value that is neither a number nor null", name));
                }
            }
        }
    }
    return values;
}

GridVelocityField parseVelocityField(const std::string &json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError()) {
        throw FieldFormatException(std::format("Failed to parse current field JSON at offset {}: {}",
            doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsObject()) {
        throw FieldFormatException("Current field JSON is not an object");
    }

    auto times = readTimes(doc);
    auto latitudes = readAxis(doc, "latitude");
    auto longitudes = readAxis(doc, "longitude");
    auto u = readComponent(doc, "uo", times.size(), latitudes.size(), longitudes.size());
    auto v = readComponent(doc, "vo", times.size(), latitudes.size(), longitudes.size());

    return GridVelocityField(std::move(times), std::move(latitudes), std::move(longitudes),
                             std::move(u), std::move(v));
}

GridVelocityField loadVelocityField(const std::string &path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Unable to open current field file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    info("Loading current field from {}", path);
    return parseVelocityField(buffer.str());
}

// ============================================================================
// Generated Fields
// ============================================================================

static std::vector<double> linspace(double from, double to, int count) {
    std::vector<double> values;
    values.reserve(count);
    double step = (to - from) / (count - 1);
    for (int i = 0; i < count; i++) {
        values.push_back(from + step * i);
    }
    values.back() = to;
    return values;
}

static std::vector<time_point> hourlyAxis(time_point start, time_point end) {
    auto hours = std::chrono::floor<std::chrono::hours>(end - start).count();
    std::vector<time_point> times;
    for (long long h = 0; h <= std::max<long long>(hours, 0); h++) {
        times.push_back(start + std::chrono::hours(h));
    }
    return times;
}

GridVelocityField makeSyntheticField(double centerLat, double centerLon,
                                     time_point start, time_point end,
                                     std::uint32_t seed,
                                     const SyntheticFieldOptions &options) {
    if (!isValidCoordinate(centerLat, centerLon)) {
        throw InvalidInputException(std::format(
            "Invalid synthetic field center: latitude {} longitude {}", centerLat, centerLon));
    }
    if (options.gridSize < 2) {
        throw InvalidInputException(std::format("Synthetic grid size must be at least 2, got {}", options.gridSize));
    }
    if (!(options.spanDegrees > 0.0) || !(options.sigma >= 0.0)) {
        throw InvalidInputException("Synthetic field span must be positive and sigma non-negative");
    }

    auto latitudes = linspace(std::max(-90.0, centerLat - options.spanDegrees),
                              std::min(90.0, centerLat + options.spanDegrees), options.gridSize);
    auto longitudes = linspace(std::max(-180.0, centerLon - options.spanDegrees),
                               std::min(180.0, centerLon + options.spanDegrees), options.gridSize);
    auto times = hourlyAxis(start, end);

    std::size_t cells = times.size() * latitudes.size() * longitudes.size();
    std::mt19937 rng(seed);
    std::normal_distribution<double> distribution(0.0, options.sigma);

    std::vector<double> u(cells);
    std::vector<double> v(cells);
    std::generate(u.begin(), u.end(), [&]() { return distribution(rng); });
    std::generate(v.begin(), v.end(), [&]() { return distribution(rng); });

    debug("Synthetic current field: seed {}, {} time steps, {}x{} grid around {}",
        seed, times.size(), options.gridSize, options.gridSize, formatCoordinates(centerLat, centerLon));

    return GridVelocityField(std::move(times), std::move(latitudes), std::move(longitudes),
                             std::move(u), std::move(v));
}

GridVelocityField makeUniformField(double u, double v, const BoundingBox &bounds,
                                   time_point start, time_point end) {
    if (!std::isfinite(u) || !std::isfinite(v)) {
        throw InvalidInputException("Uniform current velocity must be finite");
    }
    if (!isValidCoordinate(bounds.minLat, bounds.minLon) ||
        !isValidCoordinate(bounds.maxLat, bounds.maxLon) ||
        !(bounds.minLat < bounds.maxLat) || !(bounds.minLon < bounds.maxLon)) {
        throw InvalidInputException(std::format(
            "Invalid uniform field bounds: lat [{}, {}] lon [{}, {}]",
            bounds.minLat, bounds.maxLat, bounds.minLon, bounds.maxLon));
    }
    if (end <= start) {
        end = start + std::chrono::hours(1);
    }

    debug("Uniform current field: u={:.3f} m/s v={:.3f} m/s", u, v);

    return GridVelocityField({start, end},
                             {bounds.minLat, bounds.maxLat},
                             {bounds.minLon, bounds.maxLon},
                             std::vector<double>(8, u),
                             std::vector<double>(8, v));
}

VelocitySample currentFromKnots(double knots, double headingDegrees) {
    double speed = knotsToMetersPerSecond(knots);
    double heading = headingDegrees * DEGREES_TO_RADIANS;
    return {speed * std::sin(heading), speed * std::cos(heading), SampleStatus::Ok};
}

} // namespace drifttrack
