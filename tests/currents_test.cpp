/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <drifttrack/currents.hpp>

#include <chrono>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

namespace drifttrack {
namespace {

using namespace std::chrono;

const time_point T0 = sys_days{year{2023}/January/1};

constexpr const char* SAMPLE_FIELD = R"({
    "time": ["2023-01-01T00:00:00Z", "2023-01-01T01:00:00Z"],
    "latitude": [52.0, 52.5, 53.0],
    "longitude": [3.5, 4.0],
    "uo": [[[0.1, 0.2], [0.3, null], [0.5, 0.6]],
           [[1.1, 1.2], [1.3, 1.4], [1.5, 1.6]]],
    "vo": [[[0.0, 0.0], [0.0, null], [0.0, 0.0]],
           [[-0.1, -0.1], [-0.1, -0.1], [-0.1, -0.1]]]
})";

// ============================================================================
// JSON Reader
// ============================================================================

TEST(ParseVelocityFieldTest, SampleDocument) {
    auto field = parseVelocityField(SAMPLE_FIELD);
    ASSERT_TRUE(field.isAvailable());
    EXPECT_EQ(field.getTimes().size(), 2u);
    EXPECT_EQ(field.getLatitudes().size(), 3u);
    EXPECT_EQ(field.getLongitudes().size(), 2u);

    auto s = field.sample(T0, 52.9, 3.6);
    EXPECT_EQ(s.status, SampleStatus::Ok);
    EXPECT_DOUBLE_EQ(s.u, 0.5);

    s = field.sample(T0 + hours(1), 52.0, 4.0);
    EXPECT_DOUBLE_EQ(s.u, 1.2);
    EXPECT_DOUBLE_EQ(s.v, -0.1);
}

TEST(ParseVelocityFieldTest, NullIsNoData) {
    auto field = parseVelocityField(SAMPLE_FIELD);
    EXPECT_EQ(field.sample(T0, 52.5, 4.0).status, SampleStatus::NoData);
    EXPECT_EQ(field.sample(T0 + hours(1), 52.5, 4.0).status, SampleStatus::Ok);
}

TEST(ParseVelocityFieldTest, InvalidJSON) {
    EXPECT_THROW(parseVelocityField("{ not json"), FieldFormatException);
    EXPECT_THROW(parseVelocityField("[1, 2, 3]"), FieldFormatException);
}

TEST(ParseVelocityFieldTest, MissingKey) {
    EXPECT_THROW(parseVelocityField(R"({"time": [], "latitude": [], "longitude": [], "uo": []})"),
        FieldFormatException);
}

TEST(ParseVelocityFieldTest, BadTimestamp) {
    EXPECT_THROW(parseVelocityField(R"({"time": ["noon"], "latitude": [1.0], "longitude": [1.0],
        "uo": [[[0.0]]], "vo": [[[0.0]]]})"), FieldFormatException);
}

TEST(ParseVelocityFieldTest, RaggedArray) {
    EXPECT_THROW(parseVelocityField(R"({"time": ["2023-01-01T00:00:00Z"], "latitude": [1.0, 2.0],
        "longitude": [1.0, 2.0], "uo": [[[0.0, 0.0], [0.0]]], "vo": [[[0.0, 0.0], [0.0, 0.0]]]})"),
        FieldFormatException);
}

TEST(ParseVelocityFieldTest, NonNumericValue) {
    EXPECT_THROW(parseVelocityField(R"({"time": ["2023-01-01T00:00:00Z"], "latitude": [1.0],
        "longitude": [1.0], "uo": [[["fast"]]], "vo": [[[0.0]]]})"), FieldFormatException);
}

TEST(ParseVelocityFieldTest, EmptyAxesAreUnavailable) {
    auto field = parseVelocityField(R"({"time": [], "latitude": [], "longitude": [], "uo": [], "vo": []})");
    EXPECT_FALSE(field.isAvailable());
}

TEST(LoadVelocityFieldTest, ReadsFile) {
    auto path = std::filesystem::temp_directory_path() / "drifttrack_currents_test.json";
    {
        std::ofstream out(path);
        out << SAMPLE_FIELD;
    }
    auto field = loadVelocityField(path.string());
    EXPECT_TRUE(field.isAvailable());
    std::filesystem::remove(path);
}

TEST(LoadVelocityFieldTest, MissingFile) {
    EXPECT_THROW(loadVelocityField("/nonexistent/drifttrack/field.json"), std::runtime_error);
}

// ============================================================================
// Generated Fields
// ============================================================================

TEST(SyntheticFieldTest, Shape) {
    auto field = makeSyntheticField(52.5, 4.2, T0, T0 + hours(6), 42);
    ASSERT_TRUE(field.isAvailable());
    EXPECT_EQ(field.getTimes().size(), 7u);
    EXPECT_EQ(field.getLatitudes().size(), 20u);
    EXPECT_EQ(field.getLongitudes().size(), 20u);
    EXPECT_DOUBLE_EQ(field.coverage().minLat, 50.5);
    EXPECT_DOUBLE_EQ(field.coverage().maxLat, 54.5);
    EXPECT_DOUBLE_EQ(field.coverage().maxLon, 6.2);
}

TEST(SyntheticFieldTest, FractionalHoursRoundDown) {
    auto field = makeSyntheticField(0.0, 0.0, T0, T0 + minutes(150), 1);
    EXPECT_EQ(field.getTimes().size(), 3u);
}

TEST(SyntheticFieldTest, SameSeedSameField) {
    auto a = makeSyntheticField(52.5, 4.2, T0, T0 + hours(3), 7);
    auto b = makeSyntheticField(52.5, 4.2, T0, T0 + hours(3), 7);
    auto c = makeSyntheticField(52.5, 4.2, T0, T0 + hours(3), 8);
    auto sa = a.sample(T0 + hours(2), 53.0, 4.5);
    auto sb = b.sample(T0 + hours(2), 53.0, 4.5);
    auto sc = c.sample(T0 + hours(2), 53.0, 4.5);
    EXPECT_EQ(sa.u, sb.u);
    EXPECT_EQ(sa.v, sb.v);
    EXPECT_NE(sa.u, sc.u);
}

TEST(SyntheticFieldTest, ClippedAtPole) {
    auto field = makeSyntheticField(89.0, 179.0, T0, T0 + hours(1), 3);
    ASSERT_TRUE(field.isAvailable());
    EXPECT_DOUBLE_EQ(field.coverage().maxLat, 90.0);
    EXPECT_DOUBLE_EQ(field.coverage().maxLon, 180.0);
}

TEST(SyntheticFieldTest, InvalidOptions) {
    EXPECT_THROW(makeSyntheticField(95.0, 0.0, T0, T0 + hours(1), 1), InvalidInputException);
    EXPECT_THROW(makeSyntheticField(0.0, 0.0, T0, T0 + hours(1), 1, SyntheticFieldOptions{.gridSize = 1}),
        InvalidInputException);
}

TEST(UniformFieldTest, ConstantEverywhere) {
    auto field = makeUniformField(0.3, -0.4, BoundingBox{50.0, 55.0, 0.0, 10.0}, T0, T0 + hours(12));
    ASSERT_TRUE(field.isAvailable());
    for (double lat : {50.0, 52.3, 55.0}) {
        auto s = field.sample(T0 + hours(5), lat, 7.7);
        EXPECT_EQ(s.status, SampleStatus::Ok);
        EXPECT_DOUBLE_EQ(s.u, 0.3);
        EXPECT_DOUBLE_EQ(s.v, -0.4);
    }
    EXPECT_EQ(field.sample(T0, 56.0, 5.0).status, SampleStatus::OutOfBounds);
}

TEST(UniformFieldTest, InvalidArguments) {
    EXPECT_THROW(makeUniformField(NAN, 0.0, BoundingBox{0.0, 1.0, 0.0, 1.0}, T0, T0), InvalidInputException);
    EXPECT_THROW(makeUniformField(0.0, 0.0, BoundingBox{1.0, 1.0, 0.0, 1.0}, T0, T0), InvalidInputException);
    EXPECT_NO_THROW(makeUniformField(0.0, 0.0, BoundingBox{0.0, 1.0, 0.0, 1.0}, T0, T0));
}

TEST(CurrentFromKnotsTest, Headings) {
    auto north = currentFromKnots(1.0, 0.0);
    EXPECT_NEAR(north.u, 0.0, 1e-12);
    EXPECT_NEAR(north.v, 0.514444, 1e-9);

    auto east = currentFromKnots(2.0, 90.0);
    EXPECT_NEAR(east.u, 1.028888, 1e-9);
    EXPECT_NEAR(east.v, 0.0, 1e-9);
}

}  // namespace
}  // namespace drifttrack
