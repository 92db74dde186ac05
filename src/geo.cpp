/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <drifttrack/geo.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <format>

namespace drifttrack {

double distance(double lat1, double lon1, double lat2, double lon2) {
    double lat1Rad = lat1 * DEGREES_TO_RADIANS;
    double lat2Rad = lat2 * DEGREES_TO_RADIANS;
    double dLat = (lat2 - lat1) * DEGREES_TO_RADIANS;
    double dLon = (lon2 - lon1) * DEGREES_TO_RADIANS;

    double sinHalfLat = std::sin(dLat / 2.0);
    double sinHalfLon = std::sin(dLon / 2.0);
    double a = sinHalfLat * sinHalfLat
             + std::cos(lat1Rad) * std::cos(lat2Rad) * sinHalfLon * sinHalfLon;
    // Rounding can push a just past 1 for antipodal points
    a = std::clamp(a, 0.0, 1.0);
    double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));

    return EARTH_RADIUS_KM * c;
}

double bearing(double lat1, double lon1, double lat2, double lon2) {
    double lat1Rad = lat1 * DEGREES_TO_RADIANS;
    double lat2Rad = lat2 * DEGREES_TO_RADIANS;
    double dLon = (lon2 - lon1) * DEGREES_TO_RADIANS;

    double y = std::sin(dLon) * std::cos(lat2Rad);
    double x = std::cos(lat1Rad) * std::sin(lat2Rad)
             - std::sin(lat1Rad) * std::cos(lat2Rad) * std::cos(dLon);

    double degrees = std::atan2(y, x) * RADIANS_TO_DEGREES;

    // Normalize to [0, 360)
    degrees = std::fmod(degrees + 360.0, 360.0);
    if (degrees >= 360.0) degrees -= 360.0;
    return degrees;
}

// Meters per degree of longitude shrink with cos(latitude)
static double metersPerDegreeLon(double atLat) {
    double cosLat = std::max(std::cos(atLat * DEGREES_TO_RADIANS), MIN_COS_LATITUDE);
    return METERS_PER_DEGREE_LON_AT_EQUATOR * cosLat;
}

DegreeOffset metersToDegrees(double dxMeters, double dyMeters, double atLat) {
    return {
        dyMeters / METERS_PER_DEGREE_LAT,
        dxMeters / metersPerDegreeLon(atLat)
    };
}

MeterOffset degreesToMeters(double dLat, double dLon, double atLat) {
    return {
        dLon * metersPerDegreeLon(atLat),
        dLat * METERS_PER_DEGREE_LAT
    };
}

bool isValidCoordinate(double lat, double lon) {
    if (!std::isfinite(lat) || !std::isfinite(lon)) {
        return false;
    }
    return lat >= -90.0 && lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
}

double normalizeLongitude(double lon) {
    if (lon >= -180.0 && lon <= 180.0) {
        return lon;
    }
    double wrapped = std::fmod(lon + 180.0, 360.0);
    if (wrapped < 0) wrapped += 360.0;
    return wrapped - 180.0;
}

double roundTo(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

std::string formatCoordinates(double lat, double lon, int precision) {
    char latDir = lat >= 0 ? 'N' : 'S';
    char lonDir = lon >= 0 ? 'E' : 'W';
    return std::format("{:.{}f}°{}, {:.{}f}°{}",
        std::abs(lat), precision, latDir,
        std::abs(lon), precision, lonDir);
}

std::string bearingToCompass(double degrees) {
    static const std::array<const char*, 16> points = {
        "N", "NNE", "NE", "ENE", "E", "ESE", "SE", "SSE",
        "S", "SSW", "SW", "WSW", "W", "WNW", "NW", "NNW"
    };
    double deg = std::fmod(degrees, 360.0);
    if (deg < 0) deg += 360.0;
    auto index = static_cast<std::size_t>((deg + 11.25) / 22.5) % points.size();
    return points[index];
}

} // namespace drifttrack
