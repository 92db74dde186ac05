/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <drifttrack/search.hpp>

namespace drifttrack {

std::ostream& operator<<(std::ostream &os, const SearchPattern &pattern) {
    switch (pattern) {
        case SearchPattern::SectorSearch:
            os << "Sector Search";
            break;
        case SearchPattern::ExpandingSquare:
            os << "Expanding Square";
            break;
        case SearchPattern::ParallelTrack:
            os << "Parallel Track";
            break;
        case SearchPattern::ParallelSweep:
            os << "Parallel Sweep";
            break;
    }
    return os;
}

SearchPatternResult recommend(double hours, double driftKm, ObjectType type) {
    if (hours < 1.0 && driftKm < 2.0) {
        return {SearchPattern::SectorSearch, "Sector Search",
                "Use when position is recent and precise."};
    }
    if (hours < 3.0 && driftKm < 8.0) {
        return {SearchPattern::ExpandingSquare, "Expanding Square",
                "Covers moderate uncertainty zones."};
    }
    if (wearsLifeJacket(type) && hours < 24.0) {
        return {SearchPattern::ParallelTrack, "Parallel Track",
                "Person with life jacket - expanded search area."};
    }
    return {SearchPattern::ParallelSweep, "Parallel Sweep",
            "Large area coverage for extended time/distance."};
}

SearchPatternResult recommend(double hours, double driftKm, std::string_view objectIdentifier) {
    return recommend(hours, driftKm, parseObjectType(objectIdentifier));
}

} // namespace drifttrack
