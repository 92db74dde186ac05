/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __DRIFTTRACK_CONFIG_HPP
#define __DRIFTTRACK_CONFIG_HPP

#include <drifttrack/integrator.hpp>
#include <drifttrack/trajectory.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace drifttrack {

/** Where the current field for a prediction comes from */
enum class FieldSource {
    None,       ///< No data; the prediction uses the fallback estimate
    File,       ///< JSON current-field file
    Synthetic,  ///< Seeded random field around the start position
    Uniform     ///< Constant current everywhere
};

std::ostream& operator<<(std::ostream &os, const FieldSource &source);

class Config {
public:
    // Empty constructor
    Config() = default;
    ~Config() = default;

    double getLatitude();
    void setLatitude(const double l);

    double getLongitude();
    void setLongitude(const double l);

    double getHours();
    void setHours(const double h);

    std::string getObjectType();
    void setObjectType(const std::string &identifier);

    time_point getTime();
    void setTime(const time_point tp);

    int getStepMinutes();
    void setStepMinutes(const int minutes);

    int getRecordIntervalMinutes();
    void setRecordIntervalMinutes(const int minutes);

    std::int64_t getMaxSteps();
    void setMaxSteps(const std::int64_t steps);

    bool hasTimeout();
    void clearTimeout();
    double getTimeoutSeconds();
    void setTimeoutSeconds(const double seconds);

    bool hasFieldFile();
    std::string getFieldFile();
    void setFieldFile(const std::string &path);

    bool getSynthetic();
    void setSynthetic(bool s);

    std::uint32_t getSeed();
    void setSeed(const std::uint32_t s);

    bool hasUniformCurrent();
    void clearUniformCurrent();
    double getCurrentU();
    double getCurrentV();
    void setUniformCurrent(const double u, const double v);

    /** File first, then a uniform current, then synthetic data */
    FieldSource getFieldSource();

    bool getVerbose();
    void setVerbose(bool);

    bool getJSON();
    void setJSON(bool);

    std::string getLogFile();
    void setLogFile(const std::string &path);

    /** Integrator options; the deadline (if any) starts counting now */
    IntegratorOptions getIntegratorOptions();

    /** The drift request described by this configuration */
    DriftRequest getDriftRequest();

private:
    double latitude = 0.0;
    double longitude = 0.0;
    double hours = 0.0;
    std::string objectType = "Unknown";
    time_point time;
    int stepMinutes = 15;
    int recordIntervalMinutes = 60;
    std::int64_t maxSteps = 100000;
    std::optional<double> timeoutSeconds;
    std::optional<std::string> fieldFile;
    bool synthetic = false;
    std::uint32_t seed = 42;
    std::optional<std::pair<double, double>> uniformCurrent;
    bool verbose = false;
    bool json = false;
    std::string logFile;
};

}

#endif
