#include "PatternCompiler.hpp"
#include "Logger.hpp"

static const char* kComp = "PatternCompiler";

namespace PatternCompiler {

// Desc: compile one regex source with the shared options
// In: const std::string& source, std::string& error
// Out: std::shared_ptr<const pcre2_code> (null on error)
std::shared_ptr<const pcre2_code> compileOne(const std::string& source, std::string& error) {
    std::unique_ptr<pcre2_compile_context, void(*)(pcre2_compile_context*)> ccx(
        pcre2_compile_context_create(nullptr), pcre2_compile_context_free);
    if (!ccx) {
        error = "out of memory";
        return nullptr;
    }
    // \r, \n and \r\n all end a line, so CRLF text anchors the same as LF text
    pcre2_set_newline(ccx.get(), PCRE2_NEWLINE_ANYCRLF);

    int errcode = 0;
    PCRE2_SIZE erroff = 0;
    pcre2_code* code = pcre2_compile(reinterpret_cast<PCRE2_SPTR>(source.c_str()), source.size(),
                                     kCompileOptions, &errcode, &erroff, ccx.get());
    if (!code) {
        PCRE2_UCHAR msg[256];
        pcre2_get_error_message(errcode, msg, sizeof(msg));
        error = std::string(reinterpret_cast<const char*>(msg)) + " at offset " + std::to_string(erroff);
        return nullptr;
    }
    return std::shared_ptr<const pcre2_code>(code, [](const pcre2_code* c) {
        pcre2_code_free(const_cast<pcre2_code*>(c));
    });
}

// Desc: compile rules into an immutable snapshot; invalid regexes are skipped
// In: const std::vector<Rule>& rules, const EngineOptions& opts
// Out: RuleSnapshot (never null)
RuleSnapshot compile(const std::vector<Rule>& rules, const EngineOptions& opts) {
    auto set = std::make_shared<CompiledRuleSet>();
    set->rules.reserve(rules.size());

    for (const auto& r : rules) {
        std::string err;
        auto code = compileOne(r.regex, err);
        if (!code) {
            Logger::warn(kComp, "invalid regex pattern '" + (r.name.empty() ? std::string("unknown") : r.name) +
                                "': " + err);
            set->skipped.push_back(r.name);
            continue;
        }
        set->rules.push_back(CompiledRule{std::move(code), r.name, r.placeholder, r.regex});
        Logger::debug(kComp, "compiled pattern '" + r.name + "': " + r.regex);
    }

    pcre2_match_context* mcx = pcre2_match_context_create(nullptr);
    if (mcx) {
        pcre2_set_match_limit(mcx, opts.match_limit);
        pcre2_set_depth_limit(mcx, opts.depth_limit);
        pcre2_set_heap_limit(mcx, opts.heap_limit_kib);
        set->limits.reset(mcx, pcre2_match_context_free);
    } else {
        Logger::warn(kComp, "cannot allocate match context, library default limits apply");
    }

    if (opts.prefilter && !set->rules.empty()) {
        std::vector<std::string> sources;
        sources.reserve(set->rules.size());
        for (const auto& cr : set->rules) sources.push_back(cr.source);

        auto hs = std::make_unique<PatternMatcherHS>();
        if (hs->build(sources)) {
            Logger::debug(kComp, "prefilter covers " + std::to_string(hs->filteredCount()) + "/" +
                                 std::to_string(hs->patternCount()) + " patterns");
            set->prefilter = std::move(hs);
        } else {
            Logger::info(kComp, "prefilter unavailable, scanning every rule");
        }
    }

    set->source_rules = rules;
    set->ruleset_hash = PatternCatalog::hashCanonical(PatternCatalog::canonicalRulesJson(rules, opts));
    Logger::info(kComp, "successfully compiled " + std::to_string(set->rules.size()) + " regex patterns" +
                        (set->skipped.empty() ? std::string() : ", skipped " + std::to_string(set->skipped.size())));
    return set;
}

RuleSnapshot compile(const PatternCatalog& catalog) {
    return compile(catalog.getRules(), catalog.getEngineOptions());
}

}
