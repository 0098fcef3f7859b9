#pragma once
#include <string>
#include <vector>

#include "MatchFinder.hpp"
#include "RedactionTypes.hpp"

class Rewriter {
public:
    // 'accepted' must be non-overlapping and sorted by start (OverlapResolver output).
    // When 'audit' is non-null one record per accepted match is appended to it.
    static std::string rewrite(const std::string& text,
                               const std::vector<CandidateMatch>& accepted,
                               std::vector<RedactionRecord>* audit);
};
