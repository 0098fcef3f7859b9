#pragma once
#include <string>
#include <vector>
#include <hs/hs.h>

// Multi-pattern prefilter built on Hyperscan.
// One block scan tells which patterns may match a text; patterns Hyperscan
// cannot compile stay "always candidate".
class PatternMatcherHS {
public:
    PatternMatcherHS();
    ~PatternMatcherHS();

    PatternMatcherHS(const PatternMatcherHS&) = delete;
    PatternMatcherHS& operator=(const PatternMatcherHS&) = delete;

    // Build (or rebuild) from regex sources; index i is pattern id i.
    // Returns false if no database could be built (every pattern is then a candidate).
    bool build(const std::vector<std::string>& patterns);

    // out[i] != 0 if pattern i may match 'text'. Returns false if the scan
    // failed, in which case every entry is set.
    bool candidates(const std::string& text, std::vector<char>& out) const;

    // Anchored patterns stay out of the database and are always scanned.
    static bool hasLineAnchor(const std::string& re);

    size_t patternCount()  const { return count_; }
    size_t filteredCount() const { return filtered_; }
    bool   isReady()       const { return ready_; }

private:
    hs_database_t* db_{nullptr};
    bool           ready_{false};
    size_t         count_{0};
    size_t         filtered_{0};          // patterns inside the database
    std::vector<char> always_;            // 1 = not in the database, always scanned

    void freeAll_() noexcept;
};
