#ifndef PATTERN_COMPILER_HPP
#define PATTERN_COMPILER_HPP

#ifndef PCRE2_CODE_UNIT_WIDTH
#define PCRE2_CODE_UNIT_WIDTH 8
#endif
#include <pcre2.h>

#include <memory>
#include <string>
#include <vector>

#include "PatternCatalog.hpp"
#include "PatternMatcherHS.hpp"
#include "RedactionTypes.hpp"

struct CompiledRule {
    std::shared_ptr<const pcre2_code> matcher;  // null only in hand-built test rules
    std::string name;
    std::string placeholder;
    std::string source;
};

// Immutable once built; shared read-only between concurrent redactions.
struct CompiledRuleSet {
    std::vector<CompiledRule> rules;
    std::vector<std::string>  skipped;          // names of rules that failed to compile
    std::unique_ptr<PatternMatcherHS> prefilter; // null when disabled or unusable
    std::shared_ptr<pcre2_match_context> limits; // match / depth / heap limits for every rule
    std::vector<Rule> source_rules;              // as supplied, for the summary contract
    std::string ruleset_hash;

    size_t size() const { return rules.size(); }
    bool   empty() const { return rules.empty(); }
};

using RuleSnapshot = std::shared_ptr<const CompiledRuleSet>;

namespace PatternCompiler {
// Options applied to every rule: letter case ignored, ^ and $ per line.
constexpr uint32_t kCompileOptions = PCRE2_CASELESS | PCRE2_MULTILINE;

// Compile one source; on failure returns null and fills 'error'.
std::shared_ptr<const pcre2_code> compileOne(const std::string& source, std::string& error);

RuleSnapshot compile(const std::vector<Rule>& rules, const EngineOptions& opts = EngineOptions{});
RuleSnapshot compile(const PatternCatalog& catalog);
}

#endif // PATTERN_COMPILER_HPP
