/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <drifttrack/field.hpp>

#include <chrono>
#include <cmath>
#include <limits>
#include <sstream>

namespace drifttrack {
namespace {

using namespace std::chrono;

const time_point T0 = sys_days{year{2023}/January/1};
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/**
 * Two hourly time steps over a 3x2 grid. u encodes the cell as
 * 100*t + 10*i + j so lookups can be checked by value.
 */
class GridVelocityFieldTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<double> u;
        std::vector<double> v;
        for (int t = 0; t < 2; t++) {
            for (int i = 0; i < 3; i++) {
                for (int j = 0; j < 2; j++) {
                    u.push_back(100.0 * t + 10.0 * i + j);
                    v.push_back(-1.0);
                }
            }
        }
        // Absent cell at t=1, lat=52.5, lon=4.0
        u[6 + 3] = NaN;
        v[6 + 3] = NaN;

        field = GridVelocityField({T0, T0 + hours(1)}, {52.0, 52.5, 53.0}, {3.5, 4.0}, u, v);
    }

    GridVelocityField field;
};

TEST_F(GridVelocityFieldTest, IsAvailable) {
    EXPECT_TRUE(field.isAvailable());
    EXPECT_TRUE(field.unavailableReason().empty());
}

TEST_F(GridVelocityFieldTest, Coverage) {
    auto box = field.coverage();
    EXPECT_DOUBLE_EQ(box.minLat, 52.0);
    EXPECT_DOUBLE_EQ(box.maxLat, 53.0);
    EXPECT_DOUBLE_EQ(box.minLon, 3.5);
    EXPECT_DOUBLE_EQ(box.maxLon, 4.0);
}

TEST_F(GridVelocityFieldTest, NearestNeighborLookup) {
    auto s = field.sample(T0, 52.1, 3.6);
    EXPECT_EQ(s.status, SampleStatus::Ok);
    EXPECT_DOUBLE_EQ(s.u, 0.0);
    EXPECT_DOUBLE_EQ(s.v, -1.0);

    s = field.sample(T0, 52.9, 3.9);
    EXPECT_DOUBLE_EQ(s.u, 21.0);
}

TEST_F(GridVelocityFieldTest, NearestTimeStep) {
    EXPECT_DOUBLE_EQ(field.sample(T0 + minutes(20), 52.0, 3.5).u, 0.0);
    EXPECT_DOUBLE_EQ(field.sample(T0 + minutes(40), 52.0, 3.5).u, 100.0);
}

TEST_F(GridVelocityFieldTest, TimeClampsToAxis) {
    EXPECT_DOUBLE_EQ(field.sample(T0 - hours(5), 52.0, 3.5).u, 0.0);
    EXPECT_DOUBLE_EQ(field.sample(T0 + hours(48), 52.0, 3.5).u, 100.0);
}

TEST_F(GridVelocityFieldTest, OutOfBounds) {
    auto s = field.sample(T0, 51.9, 3.6);
    EXPECT_EQ(s.status, SampleStatus::OutOfBounds);
    EXPECT_EQ(s.u, 0.0);
    EXPECT_EQ(s.v, 0.0);

    EXPECT_EQ(field.sample(T0, 52.5, 4.1).status, SampleStatus::OutOfBounds);
    EXPECT_EQ(field.sample(T0, 95.0, 4.0).status, SampleStatus::OutOfBounds);
}

TEST_F(GridVelocityFieldTest, AbsentCellIsNoData) {
    auto s = field.sample(T0 + hours(1), 52.5, 4.0);
    EXPECT_EQ(s.status, SampleStatus::NoData);
    EXPECT_EQ(s.u, 0.0);
    EXPECT_EQ(s.v, 0.0);
}

TEST_F(GridVelocityFieldTest, PrintInfo) {
    std::ostringstream os;
    field.printInfo(os);
    EXPECT_NE(os.str().find("3 x 2"), std::string::npos);
}

// ============================================================================
// Axis Handling
// ============================================================================

TEST(NearestIndexTest, Ascending) {
    std::vector<double> axis = {0.0, 1.0, 2.0, 3.0};
    EXPECT_EQ(GridVelocityField::nearestIndex(axis, -5.0), 0u);
    EXPECT_EQ(GridVelocityField::nearestIndex(axis, 1.2), 1u);
    EXPECT_EQ(GridVelocityField::nearestIndex(axis, 1.8), 2u);
    EXPECT_EQ(GridVelocityField::nearestIndex(axis, 9.0), 3u);
}

TEST(NearestIndexTest, TiesGoToLowerIndex) {
    std::vector<double> axis = {0.0, 1.0};
    EXPECT_EQ(GridVelocityField::nearestIndex(axis, 0.5), 0u);
}

TEST(NearestIndexTest, Descending) {
    std::vector<double> axis = {53.0, 52.5, 52.0};
    EXPECT_EQ(GridVelocityField::nearestIndex(axis, 52.9), 0u);
    EXPECT_EQ(GridVelocityField::nearestIndex(axis, 52.4), 1u);
    EXPECT_EQ(GridVelocityField::nearestIndex(axis, 51.0), 2u);
}

TEST(GridValidationTest, DescendingLatitudeAxis) {
    GridVelocityField field({T0}, {53.0, 52.0}, {4.0, 5.0}, {1.0, 2.0, 3.0, 4.0}, {0.0, 0.0, 0.0, 0.0});
    ASSERT_TRUE(field.isAvailable());
    EXPECT_DOUBLE_EQ(field.sample(T0, 52.1, 4.9).u, 4.0);
    EXPECT_DOUBLE_EQ(field.coverage().minLat, 52.0);
}

TEST(GridValidationTest, DefaultIsUnavailable) {
    GridVelocityField field;
    EXPECT_FALSE(field.isAvailable());
    EXPECT_FALSE(field.unavailableReason().empty());
    EXPECT_THROW(field.sample(T0, 0.0, 0.0), SampleFaultException);
}

TEST(GridValidationTest, NamedUnavailable) {
    auto field = GridVelocityField::unavailable("download failed");
    EXPECT_FALSE(field.isAvailable());
    EXPECT_EQ(field.unavailableReason(), "download failed");
}

TEST(GridValidationTest, NonMonotonicAxis) {
    GridVelocityField field({T0}, {52.0, 53.0, 52.5}, {4.0}, {0.0, 0.0, 0.0}, {0.0, 0.0, 0.0});
    EXPECT_FALSE(field.isAvailable());
}

TEST(GridValidationTest, TimeAxisMustIncrease) {
    GridVelocityField field({T0, T0}, {52.0}, {4.0}, {0.0, 0.0}, {0.0, 0.0});
    EXPECT_FALSE(field.isAvailable());
}

TEST(GridValidationTest, WrongValueCount) {
    GridVelocityField field({T0}, {52.0, 53.0}, {4.0}, {0.0}, {0.0, 0.0});
    EXPECT_FALSE(field.isAvailable());
    EXPECT_NE(field.unavailableReason().find("expected 2"), std::string::npos);
}

TEST(GridValidationTest, EmptyAxis) {
    GridVelocityField field({T0}, {}, {4.0}, {}, {});
    EXPECT_FALSE(field.isAvailable());
}

TEST(SampleStatusTest, StreamOutput) {
    std::ostringstream os;
    os << SampleStatus::Ok << " " << SampleStatus::OutOfBounds << " " << SampleStatus::NoData;
    EXPECT_EQ(os.str(), "OK OUT_OF_BOUNDS NO_DATA");
}

}  // namespace
}  // namespace drifttrack
