/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <drifttrack/profile.hpp>

#include <sstream>
#include <string>

namespace drifttrack {
namespace {

class ObjectProfileTableTest : public ::testing::Test {
protected:
    const ObjectProfileTable &table = ObjectProfileTable::standard();
};

TEST_F(ObjectProfileTableTest, ContainsEveryKnownType) {
    EXPECT_EQ(table.getProfiles().size(), KNOWN_OBJECT_TYPES.size());
    for (auto type : KNOWN_OBJECT_TYPES) {
        EXPECT_EQ(table.getProfiles().count(type), 1u) << type;
    }
}

TEST_F(ObjectProfileTableTest, PersonAdultLifeJacket) {
    const auto &profile = table.lookup(ObjectType::PersonAdultLifeJacket);
    EXPECT_DOUBLE_EQ(profile.dragFactor, 0.8);
    EXPECT_DOUBLE_EQ(profile.currentFactor, 1.0);
    EXPECT_DOUBLE_EQ(profile.windFactor, 0.01);
    EXPECT_DOUBLE_EQ(profile.survivalHours, 24.0);
}

TEST_F(ObjectProfileTableTest, FishingTrawler) {
    const auto &profile = table.lookup("Fishing_Trawler");
    EXPECT_DOUBLE_EQ(profile.dragFactor, 0.2);
    EXPECT_DOUBLE_EQ(profile.windFactor, 0.03);
    EXPECT_DOUBLE_EQ(profile.survivalHours, 120.0);
}

TEST_F(ObjectProfileTableTest, Windsurfer) {
    const auto &profile = table.lookup(ObjectType::Windsurfer);
    EXPECT_DOUBLE_EQ(profile.dragFactor, 1.3);
    EXPECT_DOUBLE_EQ(profile.windFactor, 0.06);
}

TEST_F(ObjectProfileTableTest, UnknownYieldsDefaultProfile) {
    EXPECT_EQ(table.lookup(ObjectType::Unknown), DEFAULT_PROFILE);
    EXPECT_NO_THROW(table.lookup("Submarine"));
    EXPECT_EQ(table.lookup("Submarine"), DEFAULT_PROFILE);
    EXPECT_EQ(table.lookup(""), DEFAULT_PROFILE);
}

TEST_F(ObjectProfileTableTest, IdentifiersAreCaseSensitive) {
    EXPECT_EQ(table.lookup("kayak"), DEFAULT_PROFILE);
    EXPECT_EQ(table.lookup("Kayak"), table.lookup(ObjectType::Kayak));
}

TEST(ObjectProfileTableCustomTest, InjectedTable) {
    ObjectProfileTable custom({{ObjectType::Kayak, {2.0, 0.5, 0.0, 1.0}}}, {3.0, 1.0, 0.0, 5.0});
    EXPECT_DOUBLE_EQ(custom.lookup(ObjectType::Kayak).dragFactor, 2.0);
    EXPECT_DOUBLE_EQ(custom.lookup(ObjectType::RHIB).dragFactor, 3.0);
    EXPECT_DOUBLE_EQ(custom.getDefaultProfile().survivalHours, 5.0);
}

// ============================================================================
// Object Types
// ============================================================================

TEST(ObjectTypeTest, IdentifiersRoundTrip) {
    for (auto type : KNOWN_OBJECT_TYPES) {
        EXPECT_EQ(parseObjectType(toIdentifier(type)), type);
    }
}

TEST(ObjectTypeTest, CanonicalIdentifiers) {
    EXPECT_EQ(parseObjectType("Person_Adult_LifeJacket"), ObjectType::PersonAdultLifeJacket);
    EXPECT_EQ(parseObjectType("Hobby_Cat"), ObjectType::HobbyCat);
    EXPECT_EQ(parseObjectType("SUP_Board"), ObjectType::SUPBoard);
    EXPECT_EQ(parseObjectType("RHIB"), ObjectType::RHIB);
    EXPECT_EQ(parseObjectType("Person_Adult"), ObjectType::Unknown);
}

TEST(ObjectTypeTest, StreamOutput) {
    std::ostringstream os;
    os << ObjectType::PersonChildNoLifeJacket << " " << ObjectType::Unknown;
    EXPECT_EQ(os.str(), "Person_Child_NoLifeJacket Unknown");
}

TEST(ObjectTypeTest, LifeJacketVariants) {
    EXPECT_TRUE(wearsLifeJacket(ObjectType::PersonAdultLifeJacket));
    EXPECT_TRUE(wearsLifeJacket(ObjectType::PersonAdolescentLifeJacket));
    EXPECT_TRUE(wearsLifeJacket(ObjectType::PersonChildLifeJacket));
    EXPECT_FALSE(wearsLifeJacket(ObjectType::PersonAdultNoLifeJacket));
    EXPECT_FALSE(wearsLifeJacket(ObjectType::Kayak));
    EXPECT_FALSE(wearsLifeJacket(ObjectType::Unknown));
}

}  // namespace
}  // namespace drifttrack
