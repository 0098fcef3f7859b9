#pragma once
#include <vector>
#include "MatchFinder.hpp"

class OverlapResolver {
public:
    // Orders candidates by (start asc, length desc, declaration order) and
    // greedily keeps those starting at or after the end of the last kept one.
    // The result is non-overlapping and sorted by start.
    static std::vector<CandidateMatch> resolve(std::vector<CandidateMatch> candidates);

    static void sortCandidates(std::vector<CandidateMatch>& candidates);
};
