// === src/TextRedactor/TextRedactor.cpp ===
#include "TextRedactor.hpp"
#include "Logger.hpp"
#include "MatchFinder.hpp"
#include "OverlapResolver.hpp"
#include "Rewriter.hpp"

#include <mutex>

static const char* kComp = "TextRedactor";

TextRedactor::TextRedactor(const PatternCatalog& catalog) {
    reload(catalog);
}

RuleSnapshot TextRedactor::snapshot() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return current_;
}

// Desc: look up or build the compiled snapshot of a configuration
// In: const PatternCatalog& catalog
// Out: RuleSnapshot
RuleSnapshot TextRedactor::snapshotFor(const PatternCatalog& catalog) {
    const std::string key = catalog.rulesetHash();
    {
        std::shared_lock<std::shared_mutex> lk(mu_);
        auto it = cache_.find(key);
        if (it != cache_.end()) return it->second;
    }

    // compile outside the lock; readers keep going on the old snapshots
    RuleSnapshot fresh = PatternCompiler::compile(catalog);

    std::unique_lock<std::shared_mutex> lk(mu_);
    auto ins = cache_.emplace(key, std::move(fresh));
    return ins.first->second;
}

RuleSnapshot TextRedactor::reload(const PatternCatalog& catalog) {
    RuleSnapshot snap = snapshotFor(catalog);
    std::unique_lock<std::shared_mutex> lk(mu_);
    current_ = snap;
    return snap;
}

size_t TextRedactor::cachedSnapshots() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return cache_.size();
}

// Desc: find -> resolve -> rewrite; shared by both operating modes
// In: const CompiledRuleSet& set, const std::string& text,
//     std::vector<RedactionRecord>* audit (null in text-only mode), size_t& failed_rules
// Out: std::string (redacted text)
std::string TextRedactor::runPipeline_(const CompiledRuleSet& set,
                                       const std::string& text,
                                       std::vector<RedactionRecord>* audit,
                                       size_t& failed_rules) {
    failed_rules = 0;
    if (text.empty() || set.empty()) return text;

    std::vector<CandidateMatch> candidates = MatchFinder::find_all(set, text, &failed_rules);
    const size_t found = candidates.size();
    std::vector<CandidateMatch> accepted = OverlapResolver::resolve(std::move(candidates));

    if (found > 0) {
        Logger::debug(kComp, "found " + std::to_string(found) + " total matches, applied " +
                            std::to_string(accepted.size()) + " redactions");
    }
    return Rewriter::rewrite(text, accepted, audit);
}

std::string TextRedactor::redactText(const CompiledRuleSet& set, const std::string& text) {
    size_t failed = 0;
    return runPipeline_(set, text, nullptr, failed);
}

RedactionResult TextRedactor::redactWithDetails(const CompiledRuleSet& set, const std::string& text) {
    RedactionResult res;
    size_t failed = 0;
    res.redacted_text = runPipeline_(set, text, &res.redactions, failed);
    res.total_redactions = res.redactions.size();
    res.skipped_rules = set.skipped.size() + failed;
    return res;
}

std::string TextRedactor::redactText(const std::string& text) const {
    RuleSnapshot snap = snapshot();
    return redactText(*snap, text);
}

RedactionResult TextRedactor::redactWithDetails(const std::string& text) const {
    RuleSnapshot snap = snapshot();
    return redactWithDetails(*snap, text);
}

PatternSummary TextRedactor::getPatternSummary() const {
    RuleSnapshot snap = snapshot();
    return PatternCatalog::summarize(snap->source_rules);
}
