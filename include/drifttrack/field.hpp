/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __DRIFTTRACK_FIELD_HPP
#define __DRIFTTRACK_FIELD_HPP

#include <drifttrack/errors.hpp>
#include <drifttrack/geo.hpp>
#include <drifttrack/timeutil.hpp>

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

namespace drifttrack {

/**
 * Outcome of a single velocity lookup.
 */
enum class SampleStatus {
    Ok,             ///< A grid cell was found and holds a value
    OutOfBounds,    ///< Position outside the field's coverage or the globe
    NoData          ///< The nearest cell is explicitly absent (land, masked)
};

std::ostream& operator<<(std::ostream &os, const SampleStatus &status);

/**
 * Eastward (u) and northward (v) current velocity in meters per second.
 * OutOfBounds and NoData samples always carry (0, 0).
 */
struct VelocitySample {
    double u;
    double v;
    SampleStatus status;
};

/**
 * Read-only accessor over ocean-current data.
 *
 * Implementations must be safe to sample from several threads at once if
 * they are shared between concurrent predictions.
 */
class VelocityField {
public:
    virtual ~VelocityField() = default;

    /** False if the field is empty or malformed and cannot be sampled at all */
    virtual bool isAvailable() const = 0;

    /** Why the field is unavailable (empty when it is available) */
    virtual std::string unavailableReason() const = 0;

    /**
     * Sample the current at a position and time.
     * @throws SampleFaultException (or another std::exception) on an
     *         unexpected failure of the underlying data source
     */
    virtual VelocitySample sample(time_point time, double lat, double lon) const = 0;
};

/**
 * A gridded current field with axes (time, latitude, longitude).
 *
 * Lookups are nearest-neighbor on every axis independently. Times before the
 * first or after the last time step clamp to that step. Values are stored
 * flat in [time][latitude][longitude] order; NaN marks an absent cell.
 *
 * A grid that fails validation is kept but reports isAvailable() == false.
 *
 * Usage:
 *   GridVelocityField field(times, lats, lons, u, v);
 *   if (field.isAvailable()) {
 *       auto s = field.sample(t, 52.5, 4.2);
 *   }
 */
class GridVelocityField : public VelocityField {
public:
    /** An empty, unavailable field */
    GridVelocityField();

    GridVelocityField(std::vector<time_point> times,
                      std::vector<double> latitudes,
                      std::vector<double> longitudes,
                      std::vector<double> u,
                      std::vector<double> v);

    /** An empty field that reports the given reason */
    static GridVelocityField unavailable(const std::string &reason);

    bool isAvailable() const override;
    std::string unavailableReason() const override;
    VelocitySample sample(time_point time, double lat, double lon) const override;

    const std::vector<time_point>& getTimes() const;
    const std::vector<double>& getLatitudes() const;
    const std::vector<double>& getLongitudes() const;

    /** Latitude/longitude extent of the grid */
    BoundingBox coverage() const;

    /** Print a short summary of the grid to a stream */
    void printInfo(std::ostream &os) const;

    /** Index of the axis value nearest to value (axis ascending or descending) */
    static std::size_t nearestIndex(const std::vector<double> &axis, double value);

    /** Index of the time step nearest to time, clamped to the axis */
    std::size_t nearestTimeIndex(time_point time) const;

private:
    std::vector<time_point> times_;
    std::vector<double> latitudes_;
    std::vector<double> longitudes_;
    std::vector<double> u_;
    std::vector<double> v_;
    BoundingBox coverage_{0.0, 0.0, 0.0, 0.0};
    std::string reason_;

    void validate();
    std::size_t cellIndex(std::size_t t, std::size_t i, std::size_t j) const;
};

} // namespace drifttrack

#endif
