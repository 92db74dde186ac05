/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __DRIFTTRACK_SEARCH_HPP
#define __DRIFTTRACK_SEARCH_HPP

#include <drifttrack/profile.hpp>

#include <iostream>
#include <string>
#include <string_view>

namespace drifttrack {

enum class SearchPattern {
    SectorSearch,
    ExpandingSquare,
    ParallelTrack,
    ParallelSweep
};

std::ostream& operator<<(std::ostream &os, const SearchPattern &pattern);

/**
 * A recommended search pattern with its display name and rationale.
 */
struct SearchPatternResult {
    SearchPattern pattern;
    std::string name;
    std::string rationale;
};

/**
 * Recommend a search pattern from the drift duration, the straight-line drift
 * distance and the kind of object. Rules are evaluated in order and the first
 * match wins:
 *
 *   hours < 1 and driftKm < 2           Sector Search
 *   hours < 3 and driftKm < 8           Expanding Square
 *   person with life jacket, hours < 24 Parallel Track
 *   otherwise                           Parallel Sweep
 */
SearchPatternResult recommend(double hours, double driftKm, ObjectType type);
SearchPatternResult recommend(double hours, double driftKm, std::string_view objectIdentifier);

} // namespace drifttrack

#endif
