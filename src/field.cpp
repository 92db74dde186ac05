/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <drifttrack/field.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <functional>
#include <utility>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace drifttrack {

std::ostream& operator<<(std::ostream &os, const SampleStatus &status) {
    switch (status) {
        case SampleStatus::Ok:
            os << "OK";
            break;
        case SampleStatus::OutOfBounds:
            os << "OUT_OF_BOUNDS";
            break;
        case SampleStatus::NoData:
            os << "NO_DATA";
            break;
    }
    return os;
}

// Checks that an axis is non-empty, finite and strictly monotonic
static bool isStrictlyMonotonic(const std::vector<double> &axis) {
    if (axis.empty()) {
        return false;
    }
    if (!std::all_of(axis.begin(), axis.end(), [](double x) { return std::isfinite(x); })) {
        return false;
    }
    if (axis.size() == 1) {
        return true;
    }
    bool ascending = axis[1] > axis[0];
    for (std::size_t i = 1; i < axis.size(); i++) {
        if (ascending ? !(axis[i] > axis[i - 1]) : !(axis[i] < axis[i - 1])) {
            return false;
        }
    }
    return true;
}

GridVelocityField::GridVelocityField() : reason_("velocity field is empty") {}

GridVelocityField::GridVelocityField(std::vector<time_point> times,
                                     std::vector<double> latitudes,
                                     std::vector<double> longitudes,
                                     std::vector<double> u,
                                     std::vector<double> v)
    : times_(std::move(times)),
      latitudes_(std::move(latitudes)),
      longitudes_(std::move(longitudes)),
      u_(std::move(u)),
      v_(std::move(v)) {
    validate();
}

GridVelocityField GridVelocityField::unavailable(const std::string &reason) {
    GridVelocityField field;
    field.reason_ = reason;
    return field;
}

void GridVelocityField::validate() {
    if (times_.empty()) {
        reason_ = "velocity field has no time steps";
        return;
    }
    for (std::size_t t = 1; t < times_.size(); t++) {
        if (times_[t] <= times_[t - 1]) {
            reason_ = "time axis is not strictly increasing";
            return;
        }
    }
    if (!isStrictlyMonotonic(latitudes_)) {
        reason_ = "latitude axis is empty or not monotonic";
        return;
    }
    if (!isStrictlyMonotonic(longitudes_)) {
        reason_ = "longitude axis is empty or not monotonic";
        return;
    }

    std::size_t expected = times_.size() * latitudes_.size() * longitudes_.size();
    if (u_.size() != expected || v_.size() != expected) {
        reason_ = std::format("expected {} values per component, got u={} v={}",
            expected, u_.size(), v_.size());
        return;
    }

    auto [minLat, maxLat] = std::minmax_element(latitudes_.begin(), latitudes_.end());
    auto [minLon, maxLon] = std::minmax_element(longitudes_.begin(), longitudes_.end());
    coverage_ = {*minLat, *maxLat, *minLon, *maxLon};
    reason_.clear();

    debug("Velocity field: {} time steps, {}x{} cells, lat [{:.3f}, {:.3f}], lon [{:.3f}, {:.3f}]",
        times_.size(), latitudes_.size(), longitudes_.size(),
        coverage_.minLat, coverage_.maxLat, coverage_.minLon, coverage_.maxLon);
}

bool GridVelocityField::isAvailable() const {
    return reason_.empty();
}

std::string GridVelocityField::unavailableReason() const {
    return reason_;
}

std::size_t GridVelocityField::nearestIndex(const std::vector<double> &axis, double value) {
    if (axis.size() <= 1) {
        return 0;
    }
    bool ascending = axis.front() <= axis.back();
    auto it = ascending
        ? std::lower_bound(axis.begin(), axis.end(), value)
        : std::lower_bound(axis.begin(), axis.end(), value, std::greater<double>());

    if (it == axis.begin()) {
        return 0;
    }
    if (it == axis.end()) {
        return axis.size() - 1;
    }

    // Ties go to the lower index
    auto upper = static_cast<std::size_t>(it - axis.begin());
    auto lower = upper - 1;
    return std::abs(axis[upper] - value) < std::abs(axis[lower] - value) ? upper : lower;
}

std::size_t GridVelocityField::nearestTimeIndex(time_point time) const {
    if (times_.size() <= 1 || time <= times_.front()) {
        return 0;
    }
    if (time >= times_.back()) {
        return times_.size() - 1;
    }
    auto it = std::lower_bound(times_.begin(), times_.end(), time);
    auto upper = static_cast<std::size_t>(it - times_.begin());
    auto lower = upper - 1;
    return (times_[upper] - time) < (time - times_[lower]) ? upper : lower;
}

std::size_t GridVelocityField::cellIndex(std::size_t t, std::size_t i, std::size_t j) const {
    return (t * latitudes_.size() + i) * longitudes_.size() + j;
}

VelocitySample GridVelocityField::sample(time_point time, double lat, double lon) const {
    if (!isAvailable()) {
        throw SampleFaultException("Velocity field unavailable: " + reason_);
    }

    if (!isValidCoordinate(lat, lon) || !coverage_.contains(lat, lon)) {
        return {0.0, 0.0, SampleStatus::OutOfBounds};
    }

    auto idx = cellIndex(nearestTimeIndex(time),
                         nearestIndex(latitudes_, lat),
                         nearestIndex(longitudes_, lon));
    double u = u_[idx];
    double v = v_[idx];
    if (!std::isfinite(u) || !std::isfinite(v)) {
        return {0.0, 0.0, SampleStatus::NoData};
    }
    return {u, v, SampleStatus::Ok};
}

const std::vector<time_point>& GridVelocityField::getTimes() const {
    return times_;
}

const std::vector<double>& GridVelocityField::getLatitudes() const {
    return latitudes_;
}

const std::vector<double>& GridVelocityField::getLongitudes() const {
    return longitudes_;
}

BoundingBox GridVelocityField::coverage() const {
    return coverage_;
}

void GridVelocityField::printInfo(std::ostream &os) const {
    if (!isAvailable()) {
        os << "Velocity field unavailable: " << reason_ << std::endl;
        return;
    }
    os << "Velocity field:" << std::endl;
    os << "  Time steps: " << times_.size()
       << " (" << formatTimestamp(times_.front()) << " to " << formatTimestamp(times_.back()) << ")" << std::endl;
    os << "  Grid:       " << latitudes_.size() << " x " << longitudes_.size() << std::endl;
    os << "  Latitude:   " << std::format("{:.4f} to {:.4f}", coverage_.minLat, coverage_.maxLat) << std::endl;
    os << "  Longitude:  " << std::format("{:.4f} to {:.4f}", coverage_.minLon, coverage_.maxLon) << std::endl;
}

} // namespace drifttrack
