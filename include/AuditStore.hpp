// === include/AuditStore.hpp ===
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <sqlite3.h>

#include "RedactionTypes.hpp"

// One persisted redaction; the secret itself is kept only as a SHA-256 digest.
struct AuditRow {
    int64_t     run_id{0};
    int64_t     seq{0};
    std::string pattern_name;
    std::string placeholder;
    int64_t     start_pos{0};
    int64_t     end_pos{0};
    std::string replacement;
    std::string matched_sha256;
};

class AuditStore {
public:
    explicit AuditStore(sqlite3* db) : db_(db) {}  // db handle not owned

    static const char* schemaSql();
    bool initSchema();

    // Returns the new run id, or -1 on failure (nothing is written then).
    int64_t recordRun(const std::string& source,
                      const std::string& ruleset_hash,
                      const RedactionResult& result);

    std::vector<AuditRow> loadRun(int64_t run_id) const;
    int64_t runCount() const;

private:
    sqlite3* db_{nullptr};
};
