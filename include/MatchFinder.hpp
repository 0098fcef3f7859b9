#pragma once
#include <cstddef>
#include <string>
#include <vector>

struct CompiledRule;
struct CompiledRuleSet;

// One occurrence of one rule. The rule pointer lives as long as the snapshot.
struct CandidateMatch {
    size_t start{0};
    size_t end{0};  // exclusive
    const CompiledRule* rule{nullptr};

    size_t length() const { return end - start; }
};

namespace MatchFinder {
// Every non-empty, non-overlapping match of every rule, grouped by rule in
// declaration order. Rules that throw while matching are skipped and counted
// in *failed_rules.
std::vector<CandidateMatch> find_all(const CompiledRuleSet& set,
                                     const std::string& text,
                                     size_t* failed_rules = nullptr);
}
