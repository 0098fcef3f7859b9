#include "PatternMatcherHS.hpp"
#include "Logger.hpp"
#include <climits>

static const char* kComp = "PatternMatcherHS";

namespace {
    // Per-thread scratch, grown by hs_alloc_scratch to fit every database
    // the thread scans.
    struct ScratchHolder {
        hs_scratch_t* s = nullptr;
        ~ScratchHolder() { if (s) hs_free_scratch(s); }
    };
    thread_local ScratchHolder tls_scratch;
}

// Desc: true if the regex uses a line anchor (^, $ or \Z) outside a character class.
//       Hyperscan ends lines only at \n while the exact matcher also accepts \r and \r\n.
// In: const std::string& re
// Out: bool
bool PatternMatcherHS::hasLineAnchor(const std::string& re) {
    bool in_class = false;
    for (size_t i = 0; i < re.size(); ++i) {
        const char c = re[i];
        if (c == '\\') {
            if (!in_class && i + 1 < re.size() && re[i + 1] == 'Z') return true;
            ++i;
            continue;
        }
        if (in_class) {
            if (c == ']') in_class = false;
            continue;
        }
        if (c == '[') {
            in_class = true;
            if (i + 1 < re.size() && re[i + 1] == '^') ++i;
            if (i + 1 < re.size() && re[i + 1] == ']') ++i;  // leading ] is literal
            continue;
        }
        if (c == '^' || c == '$') return true;
    }
    return false;
}

PatternMatcherHS::PatternMatcherHS() = default;

PatternMatcherHS::~PatternMatcherHS() {
    freeAll_();
}

void PatternMatcherHS::freeAll_() noexcept {
    if (db_) { hs_free_database(db_); db_ = nullptr; }
    ready_ = false;
    count_ = 0;
    filtered_ = 0;
    always_.clear();
}

// Desc: compile all patterns into one prefilter database, dropping the ones
//       Hyperscan rejects until the rest compile
// In: const std::vector<std::string>& patterns
// Out: bool (true if a database is ready)
bool PatternMatcherHS::build(const std::vector<std::string>& patterns) {
    freeAll_();

    count_ = patterns.size();
    always_.assign(count_, 0);
    if (patterns.empty()) {
        return false;
    }

    std::vector<const char*> cpat;
    std::vector<unsigned> flags;
    std::vector<unsigned> ids;
    cpat.reserve(patterns.size());
    flags.reserve(patterns.size());
    ids.reserve(patterns.size());
    for (size_t i = 0; i < patterns.size(); ++i) {
        if (hasLineAnchor(patterns[i])) {
            always_[i] = 1;
            continue;
        }
        cpat.push_back(patterns[i].c_str());
        // mirror icase + multiline; prefilter mode may over-report, never under-report
        flags.push_back(HS_FLAG_CASELESS | HS_FLAG_MULTILINE | HS_FLAG_PREFILTER |
                        HS_FLAG_SINGLEMATCH | HS_FLAG_ALLOWEMPTY);
        ids.push_back(static_cast<unsigned>(i));
    }

    while (!cpat.empty()) {
        hs_compile_error_t* ce = nullptr;
        hs_error_t rc = hs_compile_multi(
            cpat.data(),
            flags.data(),
            ids.data(),
            static_cast<unsigned>(cpat.size()),
            HS_MODE_BLOCK,
            nullptr,
            &db_,
            &ce
        );
        if (rc == HS_SUCCESS) {
            if (ce) hs_free_compile_error(ce);
            break;
        }

        if (ce && ce->expression >= 0 && static_cast<size_t>(ce->expression) < cpat.size()) {
            const size_t at = static_cast<size_t>(ce->expression);
            const unsigned id = ids[at];
            Logger::debug(kComp, "pattern #" + std::to_string(id) + " not prefiltered: " + ce->message);
            hs_free_compile_error(ce);
            always_[id] = 1;
            cpat.erase(cpat.begin() + at);
            flags.erase(flags.begin() + at);
            ids.erase(ids.begin() + at);
            continue;
        }

        Logger::warn(kComp, std::string("compile failed: ") + (ce ? ce->message : "unknown"));
        if (ce) hs_free_compile_error(ce);
        db_ = nullptr;
        always_.assign(count_, 1);
        return false;
    }

    if (!db_) {
        // every pattern was rejected or anchored
        return false;
    }

    hs_error_t rc = hs_alloc_scratch(db_, &tls_scratch.s);
    if (rc != HS_SUCCESS) {
        Logger::warn(kComp, "hs_alloc_scratch failed: " + std::to_string(rc));
        hs_free_database(db_);
        db_ = nullptr;
        always_.assign(count_, 1);
        return false;
    }

    filtered_ = cpat.size();
    ready_ = true;
    return true;
}

bool PatternMatcherHS::candidates(const std::string& text, std::vector<char>& out) const {
    out.assign(always_.begin(), always_.end());
    if (!ready_) return true;

    if (text.size() > UINT_MAX) {
        Logger::warn(kComp, "text too large for block scan, prefilter bypassed");
        out.assign(count_, 1);
        return false;
    }

    if (hs_alloc_scratch(db_, &tls_scratch.s) != HS_SUCCESS) {
        Logger::warn(kComp, "hs_alloc_scratch failed, prefilter bypassed");
        out.assign(count_, 1);
        return false;
    }

    auto on_match = [](unsigned int id, unsigned long long, unsigned long long, unsigned int, void* ctx) -> int {
        auto* marks = static_cast<std::vector<char>*>(ctx);
        if (id < marks->size()) (*marks)[id] = 1;
        return 0;
    };

    hs_error_t rc = hs_scan(
        db_,
        text.data(),
        static_cast<unsigned int>(text.size()),
        0,
        tls_scratch.s,
        on_match,
        &out
    );

    if (rc != HS_SUCCESS) {
        Logger::warn(kComp, "hs_scan error: " + std::to_string(rc) + ", prefilter bypassed");
        out.assign(count_, 1);
        return false;
    }
    return true;
}
