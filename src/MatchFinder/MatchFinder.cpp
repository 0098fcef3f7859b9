#include "MatchFinder.hpp"
#include "PatternCompiler.hpp"
#include "Logger.hpp"

#include <memory>

static const char* kComp = "MatchFinder";

// Desc: collect all non-overlapping, non-empty matches of one rule
// In: const CompiledRule& rule, const std::string& text, pcre2_match_context* limits,
//     std::vector<CandidateMatch>& found, std::string& error
// Out: bool (false if PCRE2 reported an error, e.g. a limit was exceeded)
static bool scan_rule(const CompiledRule& rule,
                      const std::string& text,
                      pcre2_match_context* limits,
                      std::vector<CandidateMatch>& found,
                      std::string& error) {
    if (!rule.matcher) return true;

    std::unique_ptr<pcre2_match_data, void(*)(pcre2_match_data*)> md(
        pcre2_match_data_create_from_pattern(rule.matcher.get(), nullptr), pcre2_match_data_free);
    if (!md) {
        error = "out of memory";
        return false;
    }

    const auto subject = reinterpret_cast<PCRE2_SPTR>(text.data());
    const size_t len = text.size();
    size_t offset = 0;
    uint32_t opts = 0;

    while (offset <= len) {
        int rc = pcre2_match(rule.matcher.get(), subject, len, offset, opts, md.get(), limits);
        if (rc == PCRE2_ERROR_NOMATCH) break;
        if (rc < 0) {
            PCRE2_UCHAR msg[256];
            pcre2_get_error_message(rc, msg, sizeof(msg));
            error = reinterpret_cast<const char*>(msg);
            return false;
        }

        const PCRE2_SIZE* ov = pcre2_get_ovector_pointer(md.get());
        const size_t start = ov[0];
        const size_t end = ov[1];
        if (end <= start) {
            // empty match: search again from here, refusing another empty match at the same spot
            if (start >= len) break;
            offset = start;
            opts = PCRE2_NOTEMPTY_ATSTART;
            continue;
        }
        found.push_back(CandidateMatch{start, end, &rule});
        offset = end;
        opts = 0;
    }
    return true;
}

namespace MatchFinder {

// Desc: run every (prefilter-selected) rule over text and collect its matches
// In: const CompiledRuleSet& set, const std::string& text, size_t* failed_rules
// Out: std::vector<CandidateMatch> (unsorted across rules)
std::vector<CandidateMatch> find_all(const CompiledRuleSet& set,
                                     const std::string& text,
                                     size_t* failed_rules) {
    std::vector<CandidateMatch> all;
    size_t failed = 0;

    std::vector<char> marks;
    if (set.prefilter) {
        set.prefilter->candidates(text, marks);
    }

    for (size_t i = 0; i < set.rules.size(); ++i) {
        const CompiledRule& rule = set.rules[i];
        if (!marks.empty() && !marks[i]) continue;

        std::vector<CandidateMatch> found;
        std::string err;
        if (!scan_rule(rule, text, set.limits.get(), found, err)) {
            Logger::warn(kComp, "error applying pattern '" + rule.name + "': " + err);
            ++failed;
            continue;
        }
        all.insert(all.end(), found.begin(), found.end());
    }

    if (failed_rules) *failed_rules = failed;
    return all;
}

}
