#include "OverlapResolver.hpp"
#include "PatternCompiler.hpp"
#include "Logger.hpp"

#include <algorithm>

static const char* kComp = "OverlapResolver";

void OverlapResolver::sortCandidates(std::vector<CandidateMatch>& candidates) {
    // stable: exact (start, length) ties keep rule declaration order
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const CandidateMatch& a, const CandidateMatch& b) {
                         if (a.start != b.start) return a.start < b.start;
                         return a.length() > b.length();
                     });
}

// Desc: select the non-overlapping subset to apply
// In: std::vector<CandidateMatch> candidates (any order, as produced by MatchFinder)
// Out: std::vector<CandidateMatch> (accepted, ascending start)
std::vector<CandidateMatch> OverlapResolver::resolve(std::vector<CandidateMatch> candidates) {
    sortCandidates(candidates);

    std::vector<CandidateMatch> accepted;
    accepted.reserve(candidates.size());
    size_t cursor = 0;
    for (const auto& c : candidates) {
        if (c.start < cursor) {
            Logger::debug(kComp, "skipping overlapping match for pattern '" +
                                (c.rule ? c.rule->name : std::string("?")) + "' at positions " +
                                std::to_string(c.start) + "-" + std::to_string(c.end));
            continue;
        }
        accepted.push_back(c);
        cursor = c.end;
    }
    return accepted;
}
