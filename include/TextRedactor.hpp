#ifndef TEXT_REDACTOR_HPP
#define TEXT_REDACTOR_HPP

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "PatternCatalog.hpp"
#include "PatternCompiler.hpp"
#include "RedactionTypes.hpp"

// Redaction engine. Holds the current compiled snapshot plus one cached
// snapshot per distinct configuration; snapshots are never mutated.
class TextRedactor {
public:
    explicit TextRedactor(const PatternCatalog& catalog);

    RuleSnapshot snapshot() const;

    // Compiled snapshot for 'catalog' (from cache when its ruleset hash is
    // known). Does not change the current snapshot.
    RuleSnapshot snapshotFor(const PatternCatalog& catalog);

    // Make 'catalog' current. Calls already running keep their snapshot.
    RuleSnapshot reload(const PatternCatalog& catalog);

    size_t cachedSnapshots() const;

    std::string     redactText(const std::string& text) const;
    RedactionResult redactWithDetails(const std::string& text) const;

    static std::string     redactText(const CompiledRuleSet& set, const std::string& text);
    static RedactionResult redactWithDetails(const CompiledRuleSet& set, const std::string& text);

    PatternSummary getPatternSummary() const;

private:
    static std::string runPipeline_(const CompiledRuleSet& set,
                                    const std::string& text,
                                    std::vector<RedactionRecord>* audit,
                                    size_t& failed_rules);

    mutable std::shared_mutex mu_;
    RuleSnapshot current_;
    std::unordered_map<std::string, RuleSnapshot> cache_;
};

#endif // TEXT_REDACTOR_HPP
