/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <drifttrack.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

/** Set by SIGINT; checked by the integrator between steps */
static std::atomic<bool> cancelRequested{false};

static void handleInterrupt(int) {
    cancelRequested.store(true);
}

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

/** Log to stderr (and optionally a file) so that stdout stays clean for reports */
void setupLogging(drifttrack::Config &config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!config.getLogFile().empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(expandTilde(config.getLogFile())));
    }
    auto logger = std::make_shared<spdlog::logger>("drifttrack", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(config.getVerbose() ? spdlog::level::debug : spdlog::level::info);
}

/** Parse a timestamp option value, rejecting anything unrecognized */
drifttrack::time_point parseTimeOption(const std::string &timeStr) {
    auto tp = drifttrack::parseTimestamp(timeStr);
    if (!tp) {
        throw std::invalid_argument("Invalid time format (expected YYYY-MM-DD HH:MM:SS UTC): " + timeStr);
    }
    return *tp;
}

/** Build the current field for a request from the configured source */
drifttrack::GridVelocityField buildField(drifttrack::Config &config, const drifttrack::DriftRequest &request) {
    using namespace drifttrack;

    auto end = addHours(request.startTime, request.hours);
    switch (config.getFieldSource()) {
        case FieldSource::File:
            try {
                return loadVelocityField(expandTilde(config.getFieldFile()));
            } catch (const std::exception &err) {
                spdlog::warn("Unable to use current field file: {}", err.what());
                return GridVelocityField::unavailable(err.what());
            }
        case FieldSource::Uniform: {
            BoundingBox bounds{
                std::max(-90.0, request.latitude - 10.0), std::min(90.0, request.latitude + 10.0),
                std::max(-180.0, request.longitude - 10.0), std::min(180.0, request.longitude + 10.0)
            };
            return makeUniformField(config.getCurrentU(), config.getCurrentV(), bounds, request.startTime, end);
        }
        case FieldSource::Synthetic:
            return makeSyntheticField(request.latitude, request.longitude, request.startTime, end, config.getSeed());
        case FieldSource::None:
            break;
    }
    return GridVelocityField::unavailable("no current data source configured");
}

/** Print the object profile table */
void printProfiles() {
    using namespace drifttrack;

    constexpr std::string_view rowFormat = "{:<32} {:>6} {:>8} {:>6} {:>10}";
    std::string sep32(32, '-');
    std::string sep10(10, '-');
    std::string sep8(8, '-');
    std::string sep6(6, '-');

    const auto &table = ObjectProfileTable::standard();
    std::cout << "Object Profiles:" << std::endl;
    std::cout << std::format(rowFormat, "Object", "Drag", "Current", "Wind", "Survival") << std::endl;
    std::cout << std::format(rowFormat, sep32, sep6, sep8, sep6, sep10) << std::endl;
    for (auto type : KNOWN_OBJECT_TYPES) {
        const auto &profile = table.lookup(type);
        std::cout << std::format(rowFormat,
            toIdentifier(type),
            std::format("{:.2f}", profile.dragFactor),
            std::format("{:.2f}", profile.currentFactor),
            std::format("{:.3f}", profile.windFactor),
            std::format("{:.0f} h", profile.survivalHours)) << std::endl;
    }
    const auto &fallback = table.getDefaultProfile();
    std::cout << std::format(rowFormat,
        "(other)",
        std::format("{:.2f}", fallback.dragFactor),
        std::format("{:.2f}", fallback.currentFactor),
        std::format("{:.3f}", fallback.windFactor),
        std::format("{:.0f} h", fallback.survivalHours)) << std::endl;
}

/** Program entry point */
int main(int argc, char* argv[]) {

    drifttrack::Config config;
    config.setVerbose(false);
    config.setTime(std::chrono::system_clock::now());

    auto configFile = expandTilde("~/.drifttrack.toml");

    CLI::App app{"DriftTrack"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) { config.setVerbose(v > 0); },
        "Display debugging information");
    app.add_option_function<std::string>("--log-file",
        [&config](const std::string &path) { config.setLogFile(path); },
        "Also write log messages to this file");

    app.ignore_case();

    // Predict command - compute a drift trajectory and search pattern
    auto predictCommand = app.add_subcommand("predict", "Predict the drift of an object lost at sea");
    predictCommand->add_option_function<double>("--lat",
        [&config](const double l) { config.setLatitude(l); },
        "Last known latitude (in decimal format)")->required();
    predictCommand->add_option_function<double>("--lon",
        [&config](const double l) { config.setLongitude(l); },
        "Last known longitude (in decimal format)")->required();
    predictCommand->add_option_function<double>("--hours",
        [&config](const double h) { config.setHours(h); },
        "Hours of drift to predict")->required();
    predictCommand->add_option_function<std::string>("--object",
        [&config](const std::string &o) { config.setObjectType(o); },
        "Object type (see the profiles command, default Unknown)");
    predictCommand->add_option_function<std::string>("--time",
        [&config](const std::string &timeStr) { config.setTime(parseTimeOption(timeStr)); },
        "Incident time (format: YYYY-MM-DD HH:MM:SS UTC, default now)");
    predictCommand->add_option_function<std::string>("--field",
        [&config](const std::string &path) { config.setFieldFile(path); },
        "Current field JSON file");
    predictCommand->add_flag_function("--synthetic",
        [&config](const int64_t s) { config.setSynthetic(s > 0); },
        "Use a seeded random current field around the start position");
    predictCommand->add_option_function<std::uint32_t>("--seed",
        [&config](const std::uint32_t s) { config.setSeed(s); },
        "Random seed for the synthetic field (default 42)");

    double currentU = 0.0;
    double currentV = 0.0;
    double currentKnots = 0.0;
    double currentHeading = 0.0;
    auto currentUOption = predictCommand->add_option("--current-u", currentU, "Uniform eastward current in m/s");
    auto currentVOption = predictCommand->add_option("--current-v", currentV, "Uniform northward current in m/s");
    auto knotsOption = predictCommand->add_option("--current-knots", currentKnots, "Uniform current speed in knots");
    auto headingOption = predictCommand->add_option("--current-heading", currentHeading,
        "Direction the uniform current flows toward, in degrees from north");
    knotsOption->excludes(currentUOption)->excludes(currentVOption)->needs(headingOption);
    headingOption->needs(knotsOption);

    predictCommand->add_option_function<int>("--step",
        [&config](const int m) { config.setStepMinutes(m); },
        "Integration step in minutes, a divisor of 60 (default 15)");
    predictCommand->add_option_function<int>("--record",
        [&config](const int m) { config.setRecordIntervalMinutes(m); },
        "Minutes between recorded path points, a multiple of the step (default 60)");
    predictCommand->add_option_function<std::int64_t>("--max-steps",
        [&config](const std::int64_t s) { config.setMaxSteps(s); },
        "Reject predictions needing more integration steps than this (default 100000)");
    predictCommand->add_option_function<double>("--timeout",
        [&config](const double s) { config.setTimeoutSeconds(s); },
        "Stop integrating after this many seconds and report the partial path");
    predictCommand->add_flag_function("--json",
        [&config](const int64_t j) { config.setJSON(j > 0); },
        "Print the prediction as JSON");

    // Profiles command - list the drift coefficients
    auto profilesCommand = app.add_subcommand("profiles", "List object types and their drift coefficients");

    // Pattern command - search pattern recommendation only
    auto patternCommand = app.add_subcommand("pattern", "Recommend a search pattern");
    double patternHours = 0.0;
    double patternDistance = 0.0;
    std::string patternObject = "Unknown";
    patternCommand->add_option("--hours", patternHours, "Hours since the incident")->required();
    patternCommand->add_option("--distance", patternDistance, "Drift distance in kilometers")->required();
    patternCommand->add_option("--object", patternObject, "Object type (default Unknown)");

    // Distance command - great-circle distance and bearing
    auto distanceCommand = app.add_subcommand("distance", "Distance and bearing between two positions");
    std::vector<double> points;
    distanceCommand->add_option("coordinates", points, "LAT1 LON1 LAT2 LON2")->expected(4)->required();

    // Command callbacks

    predictCommand->final_callback([&config, &currentU, &currentV, &currentKnots, &currentHeading,
                                    currentUOption, currentVOption, knotsOption](void) {
        setupLogging(config);
        try {
            using namespace drifttrack;

            if (knotsOption->count() > 0) {
                auto current = currentFromKnots(currentKnots, currentHeading);
                config.setUniformCurrent(current.u, current.v);
            } else if (currentUOption->count() > 0 || currentVOption->count() > 0) {
                config.setUniformCurrent(currentU, currentV);
            }

            auto request = config.getDriftRequest();
            if (request.objectType == ObjectType::Unknown && config.getObjectType() != "Unknown") {
                spdlog::warn("Unrecognized object type '{}', using default drift profile", config.getObjectType());
            }

            auto field = buildField(config, request);
            if (field.isAvailable()) {
                spdlog::debug("Current field covers {} to {}",
                    formatCoordinates(field.coverage().minLat, field.coverage().minLon),
                    formatCoordinates(field.coverage().maxLat, field.coverage().maxLon));
            }

            auto options = config.getIntegratorOptions();
            options.cancelFlag = &cancelRequested;
            std::signal(SIGINT, handleInterrupt);

            auto prediction = predictDrift(request, field, ObjectProfileTable::standard(), options);

            if (config.getJSON()) {
                std::cout << toJSON(prediction) << std::endl;
            } else {
                printPrediction(std::cout, prediction);
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    profilesCommand->final_callback([&config](void) {
        setupLogging(config);
        try {
            printProfiles();
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    patternCommand->final_callback([&config, &patternHours, &patternDistance, &patternObject](void) {
        setupLogging(config);
        try {
            auto result = drifttrack::recommend(patternHours, patternDistance, patternObject);
            std::cout << "Search Pattern: " << result.name << std::endl;
            std::cout << "  " << result.rationale << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    distanceCommand->final_callback([&config, &points](void) {
        setupLogging(config);
        try {
            using namespace drifttrack;

            if (!isValidCoordinate(points[0], points[1]) || !isValidCoordinate(points[2], points[3])) {
                throw InvalidInputException("Coordinates out of range");
            }
            double km = distance(points[0], points[1], points[2], points[3]);
            double heading = bearing(points[0], points[1], points[2], points[3]);
            std::cout << "  From:     " << formatCoordinates(points[0], points[1]) << std::endl;
            std::cout << "  To:       " << formatCoordinates(points[2], points[3]) << std::endl;
            std::cout << "  Distance: " << std::format("{:.3f} km ({:.3f} NM)", km, kilometersToNauticalMiles(km)) << std::endl;
            std::cout << "  Bearing:  " << std::format("{:6.2f} deg ({})", heading, bearingToCompass(heading)) << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        std::exit(1);
    }

    return 0;
}
