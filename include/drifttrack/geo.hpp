/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __DRIFTTRACK_GEO_HPP
#define __DRIFTTRACK_GEO_HPP

#include <cmath>
#include <string>

namespace drifttrack {

// ============================================================================
// Constants
// ============================================================================

// Spherical earth
constexpr double EARTH_RADIUS_KM = 6371.0;

// Degree-meter conversion (one canonical pair, used everywhere)
constexpr double METERS_PER_DEGREE_LAT = 111320.0;
constexpr double METERS_PER_DEGREE_LON_AT_EQUATOR = 111320.0;

// Lower bound for cos(latitude) when converting longitude at the poles
constexpr double MIN_COS_LATITUDE = 1e-9;

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = M_PI / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / M_PI;

// Nautical units
constexpr double KNOTS_TO_MS = 0.514444;
constexpr double MS_TO_KNOTS = 1.944012;
constexpr double NAUTICAL_MILE_TO_KM = 1.852;
constexpr double KM_TO_NAUTICAL_MILE = 0.539957;

// ============================================================================
// Basic Data Types
// ============================================================================

/**
 * A displacement expressed in degrees of latitude and longitude.
 */
struct DegreeOffset {
    double dLat;    ///< Northward change in degrees
    double dLon;    ///< Eastward change in degrees
};

/**
 * A displacement expressed in meters on the local tangent plane.
 */
struct MeterOffset {
    double dx;      ///< Eastward distance in meters
    double dy;      ///< Northward distance in meters
};

/**
 * Latitude/longitude bounding box in degrees (inclusive).
 */
struct BoundingBox {
    double minLat;
    double maxLat;
    double minLon;
    double maxLon;

    bool contains(double lat, double lon) const {
        return lat >= minLat && lat <= maxLat && lon >= minLon && lon <= maxLon;
    }
};

// ============================================================================
// Spherical Earth Functions
// ============================================================================

/**
 * Great-circle distance between two points using the Haversine formula.
 * @return Distance in kilometers (exactly 0 for identical points)
 */
double distance(double lat1, double lon1, double lat2, double lon2);

/**
 * Initial bearing (forward azimuth) from the first point to the second.
 * @return Bearing in degrees, normalized to [0, 360)
 */
double bearing(double lat1, double lon1, double lat2, double lon2);

/**
 * Converts a local displacement in meters to degrees at the given latitude.
 *
 * cos(atLat) is clamped to MIN_COS_LATITUDE so the poles produce a very large
 * but finite longitude change instead of a division by zero.
 */
DegreeOffset metersToDegrees(double dxMeters, double dyMeters, double atLat);

/**
 * Converts a displacement in degrees to meters at the given latitude.
 */
MeterOffset degreesToMeters(double dLat, double dLon, double atLat);

/** Check that lat is in [-90, 90], lon in [-180, 180] and both are finite */
bool isValidCoordinate(double lat, double lon);

/** Wrap a longitude outside [-180, 180] back into range */
double normalizeLongitude(double lon);

/** Round to the given number of decimal places */
double roundTo(double value, int decimals);

/**
 * Formats a coordinate pair with hemisphere letters.
 * Example: "52.500000°N, 4.200000°E"
 */
std::string formatCoordinates(double lat, double lon, int precision = 6);

/** 16-point compass name for a bearing in degrees ("N", "NNE", ... "NNW") */
std::string bearingToCompass(double degrees);

// ============================================================================
// Unit Conversions
// ============================================================================

inline double knotsToMetersPerSecond(double knots) {
    return knots * KNOTS_TO_MS;
}

inline double metersPerSecondToKnots(double ms) {
    return ms * MS_TO_KNOTS;
}

inline double nauticalMilesToKilometers(double nm) {
    return nm * NAUTICAL_MILE_TO_KM;
}

inline double kilometersToNauticalMiles(double km) {
    return km * KM_TO_NAUTICAL_MILE;
}

} // namespace drifttrack

#endif
