/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <drifttrack/profile.hpp>

#include <utility>

namespace drifttrack {

std::string_view toIdentifier(ObjectType type) {
    switch (type) {
        case ObjectType::PersonAdultLifeJacket:
            return "Person_Adult_LifeJacket";
        case ObjectType::PersonAdultNoLifeJacket:
            return "Person_Adult_NoLifeJacket";
        case ObjectType::PersonAdolescentLifeJacket:
            return "Person_Adolescent_LifeJacket";
        case ObjectType::PersonAdolescentNoLifeJacket:
            return "Person_Adolescent_NoLifeJacket";
        case ObjectType::PersonChildLifeJacket:
            return "Person_Child_LifeJacket";
        case ObjectType::PersonChildNoLifeJacket:
            return "Person_Child_NoLifeJacket";
        case ObjectType::Catamaran:
            return "Catamaran";
        case ObjectType::HobbyCat:
            return "Hobby_Cat";
        case ObjectType::FishingTrawler:
            return "Fishing_Trawler";
        case ObjectType::RHIB:
            return "RHIB";
        case ObjectType::SUPBoard:
            return "SUP_Board";
        case ObjectType::Windsurfer:
            return "Windsurfer";
        case ObjectType::Kayak:
            return "Kayak";
        case ObjectType::Unknown:
            break;
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream &os, const ObjectType &type) {
    os << toIdentifier(type);
    return os;
}

ObjectType parseObjectType(std::string_view identifier) {
    for (auto type : KNOWN_OBJECT_TYPES) {
        if (identifier == toIdentifier(type)) {
            return type;
        }
    }
    return ObjectType::Unknown;
}

bool wearsLifeJacket(ObjectType type) {
    switch (type) {
        case ObjectType::PersonAdultLifeJacket:
        case ObjectType::PersonAdolescentLifeJacket:
        case ObjectType::PersonChildLifeJacket:
            return true;
        default:
            return false;
    }
}

ObjectProfileTable::ObjectProfileTable(std::map<ObjectType, ObjectProfile> profiles,
                                       ObjectProfile defaultProfile)
    : profiles_(std::move(profiles)), default_(defaultProfile) {}

const ObjectProfileTable& ObjectProfileTable::standard() {
    //                                              drag  current wind   survival
    static const ObjectProfileTable table({
        {ObjectType::PersonAdultLifeJacket,        {0.8, 1.0, 0.01,  24.0}},
        {ObjectType::PersonAdultNoLifeJacket,      {1.1, 1.0, 0.005, 6.0}},
        {ObjectType::PersonAdolescentLifeJacket,   {0.9, 1.0, 0.01,  24.0}},
        {ObjectType::PersonAdolescentNoLifeJacket, {1.1, 1.0, 0.005, 6.0}},
        {ObjectType::PersonChildLifeJacket,        {1.0, 1.0, 0.015, 12.0}},
        {ObjectType::PersonChildNoLifeJacket,      {1.1, 1.0, 0.005, 6.0}},
        {ObjectType::Catamaran,                    {0.4, 1.0, 0.05,  72.0}},
        {ObjectType::HobbyCat,                     {0.5, 1.0, 0.05,  72.0}},
        {ObjectType::FishingTrawler,               {0.2, 1.0, 0.03,  120.0}},
        {ObjectType::RHIB,                         {0.6, 1.0, 0.02,  48.0}},
        {ObjectType::SUPBoard,                     {1.2, 1.0, 0.06,  12.0}},
        {ObjectType::Windsurfer,                   {1.3, 1.0, 0.06,  12.0}},
        {ObjectType::Kayak,                        {1.1, 1.0, 0.01,  24.0}},
    });
    return table;
}

const ObjectProfile& ObjectProfileTable::lookup(ObjectType type) const {
    auto it = profiles_.find(type);
    if (it == profiles_.end()) {
        return default_;
    }
    return it->second;
}

const ObjectProfile& ObjectProfileTable::lookup(std::string_view identifier) const {
    return lookup(parseObjectType(identifier));
}

const ObjectProfile& ObjectProfileTable::getDefaultProfile() const {
    return default_;
}

const std::map<ObjectType, ObjectProfile>& ObjectProfileTable::getProfiles() const {
    return profiles_;
}

} // namespace drifttrack
