/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <drifttrack/config.hpp>
#include <drifttrack/profile.hpp>

#include <algorithm>

namespace drifttrack {

std::ostream& operator<<(std::ostream &os, const FieldSource &source) {
    switch (source) {
        case FieldSource::None:
            os << "none";
            break;
        case FieldSource::File:
            os << "file";
            break;
        case FieldSource::Synthetic:
            os << "synthetic";
            break;
        case FieldSource::Uniform:
            os << "uniform";
            break;
    }
    return os;
}

double Config::getLatitude() {
    return latitude;
}

void Config::setLatitude(const double l) {
    latitude = l;
}

double Config::getLongitude() {
    return longitude;
}

void Config::setLongitude(const double l) {
    longitude = l;
}

double Config::getHours() {
    return hours;
}

void Config::setHours(const double h) {
    hours = h;
}

std::string Config::getObjectType() {
    return objectType;
}

void Config::setObjectType(const std::string &identifier) {
    objectType = identifier;
}

time_point Config::getTime() {
    return time;
}

void Config::setTime(const time_point tp) {
    time = tp;
}

int Config::getStepMinutes() {
    return stepMinutes;
}

void Config::setStepMinutes(const int minutes) {
    stepMinutes = minutes;
}

int Config::getRecordIntervalMinutes() {
    return recordIntervalMinutes;
}

void Config::setRecordIntervalMinutes(const int minutes) {
    recordIntervalMinutes = minutes;
}

std::int64_t Config::getMaxSteps() {
    return maxSteps;
}

void Config::setMaxSteps(const std::int64_t steps) {
    maxSteps = steps;
}

bool Config::hasTimeout() {
    return timeoutSeconds.has_value();
}

void Config::clearTimeout() {
    timeoutSeconds.reset();
}

double Config::getTimeoutSeconds() {
    return timeoutSeconds.value_or(0.0);
}

void Config::setTimeoutSeconds(const double seconds) {
    if (seconds > 0.0) {
        timeoutSeconds = seconds;
    } else {
        timeoutSeconds.reset();
    }
}

bool Config::hasFieldFile() {
    return fieldFile.has_value();
}

std::string Config::getFieldFile() {
    return fieldFile.value_or("");
}

void Config::setFieldFile(const std::string &path) {
    if (path.empty()) {
        fieldFile.reset();
    } else {
        fieldFile = path;
    }
}

bool Config::getSynthetic() {
    return synthetic;
}

void Config::setSynthetic(bool s) {
    synthetic = s;
}

std::uint32_t Config::getSeed() {
    return seed;
}

void Config::setSeed(const std::uint32_t s) {
    seed = s;
}

bool Config::hasUniformCurrent() {
    return uniformCurrent.has_value();
}

void Config::clearUniformCurrent() {
    uniformCurrent.reset();
}

double Config::getCurrentU() {
    return uniformCurrent ? uniformCurrent->first : 0.0;
}

double Config::getCurrentV() {
    return uniformCurrent ? uniformCurrent->second : 0.0;
}

void Config::setUniformCurrent(const double u, const double v) {
    uniformCurrent = std::make_pair(u, v);
}

FieldSource Config::getFieldSource() {
    if (fieldFile) {
        return FieldSource::File;
    }
    if (uniformCurrent) {
        return FieldSource::Uniform;
    }
    if (synthetic) {
        return FieldSource::Synthetic;
    }
    return FieldSource::None;
}

bool Config::getVerbose() {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

bool Config::getJSON() {
    return json;
}

void Config::setJSON(bool j) {
    json = j;
}

std::string Config::getLogFile() {
    return logFile;
}

void Config::setLogFile(const std::string &path) {
    logFile = path;
}

IntegratorOptions Config::getIntegratorOptions() {
    IntegratorOptions options;
    options.stepMinutes = stepMinutes;
    options.recordIntervalMinutes = recordIntervalMinutes;
    options.maxSteps = maxSteps;
    if (timeoutSeconds) {
        auto timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(*timeoutSeconds));
        options.deadline = std::chrono::steady_clock::now() + timeout;
    }
    return options;
}

DriftRequest Config::getDriftRequest() {
    return DriftRequest{
        .latitude = latitude,
        .longitude = longitude,
        .startTime = time,
        .hours = hours,
        .objectType = parseObjectType(objectType)
    };
}

}
