/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __DRIFTTRACK_PROFILE_HPP
#define __DRIFTTRACK_PROFILE_HPP

#include <array>
#include <iostream>
#include <map>
#include <string>
#include <string_view>

namespace drifttrack {

/**
 * Kind of object lost at sea. Unknown is the explicit default arm and maps
 * to the default profile.
 */
enum class ObjectType {
    PersonAdultLifeJacket,
    PersonAdultNoLifeJacket,
    PersonAdolescentLifeJacket,
    PersonAdolescentNoLifeJacket,
    PersonChildLifeJacket,
    PersonChildNoLifeJacket,
    Catamaran,
    HobbyCat,
    FishingTrawler,
    RHIB,
    SUPBoard,
    Windsurfer,
    Kayak,
    Unknown
};

/** Every known object type, in table order (excludes Unknown) */
constexpr std::array<ObjectType, 13> KNOWN_OBJECT_TYPES = {
    ObjectType::PersonAdultLifeJacket,
    ObjectType::PersonAdultNoLifeJacket,
    ObjectType::PersonAdolescentLifeJacket,
    ObjectType::PersonAdolescentNoLifeJacket,
    ObjectType::PersonChildLifeJacket,
    ObjectType::PersonChildNoLifeJacket,
    ObjectType::Catamaran,
    ObjectType::HobbyCat,
    ObjectType::FishingTrawler,
    ObjectType::RHIB,
    ObjectType::SUPBoard,
    ObjectType::Windsurfer,
    ObjectType::Kayak,
};

std::ostream& operator<<(std::ostream &os, const ObjectType &type);

/**
 * Parse a canonical object identifier (e.g. "Person_Adult_LifeJacket").
 * Matching is exact; anything else yields ObjectType::Unknown.
 */
ObjectType parseObjectType(std::string_view identifier);

/** Canonical identifier of an object type ("Unknown" for the default arm) */
std::string_view toIdentifier(ObjectType type);

/** True for the person variants that wear a life jacket */
bool wearsLifeJacket(ObjectType type);

/**
 * Drift coefficients for one kind of object.
 */
struct ObjectProfile {
    double dragFactor;      ///< Overall speed multiplier (dimensionless, > 0)
    double currentFactor;   ///< Ocean-current coupling (typically 1.0)
    double windFactor;      ///< Windage (>= 0, not used by the current-only integrator)
    double survivalHours;   ///< Informational survival estimate

    bool operator==(const ObjectProfile&) const = default;
};

/** Profile used for unknown object types */
constexpr ObjectProfile DEFAULT_PROFILE{1.0, 1.0, 0.0, 24.0};

/**
 * Immutable lookup table from object type to drift coefficients.
 *
 * The standard table is built once on first use. Callers that need other
 * coefficients construct their own table and inject it into the integrator.
 */
class ObjectProfileTable {
public:
    explicit ObjectProfileTable(std::map<ObjectType, ObjectProfile> profiles,
                                ObjectProfile defaultProfile = DEFAULT_PROFILE);

    /** The built-in table */
    static const ObjectProfileTable& standard();

    /** Look up a profile. Never throws; unmatched types get the default. */
    const ObjectProfile& lookup(ObjectType type) const;
    const ObjectProfile& lookup(std::string_view identifier) const;

    const ObjectProfile& getDefaultProfile() const;
    const std::map<ObjectType, ObjectProfile>& getProfiles() const;

private:
    std::map<ObjectType, ObjectProfile> profiles_;
    ObjectProfile default_;
};

} // namespace drifttrack

#endif
