// include/PatternCatalog.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "RedactionTypes.hpp"

struct EngineOptions {
    bool prefilter = true;  // Hyperscan prefilter in front of the regex matchers

    // Per-rule, per-text PCRE2 limits; exceeding one skips the rule for that text.
    uint32_t match_limit    = 10000000;
    uint32_t depth_limit    = 100000;
    uint32_t heap_limit_kib = 262144;
};

// Ordered rule set: built-in defaults merged with an optional override file.
class PatternCatalog {
public:
    PatternCatalog() = default;

    bool loadDefaults();
    bool loadFromFile(const std::string& config_path);
    bool loadFromString(const std::string& json_text, const std::string& origin);

    const std::vector<Rule>& getRules() const { return rules_; }
    const EngineOptions& getEngineOptions() const { return options_; }
    size_t patternCount() const { return rules_.size(); }
    size_t rejectedCount() const { return rejected_; }

    std::string canonicalRulesJson() const;
    static std::string canonicalRulesJson(const std::vector<Rule>& rules, const EngineOptions& opts);
    static std::string hashCanonical(const std::string& data);
    std::string rulesetHash() const { return hashCanonical(canonicalRulesJson()); }

    PatternSummary summary() const { return summarize(rules_); }
    static PatternSummary summarize(const std::vector<Rule>& rules);

    static const char* defaultPatternsJson();

private:
    bool mergeJson_(const nlohmann::ordered_json& j, const std::string& origin);
    void upsert_(Rule r);

    std::vector<Rule> rules_;
    EngineOptions options_;
    size_t rejected_ = 0;
};
