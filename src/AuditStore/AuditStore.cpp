#include "AuditStore.hpp"
#include "Logger.hpp"
#include "PatternCatalog.hpp"

#include <ctime>

static const char* kComp = "AuditStore";

// Create tables query
static const char* kSchemaSQL = R"SQL(
CREATE TABLE IF NOT EXISTS runs (
  id               INTEGER PRIMARY KEY AUTOINCREMENT,
  ts               INTEGER NOT NULL,
  source           TEXT    NOT NULL,
  ruleset_hash     TEXT    NOT NULL,
  total_redactions INTEGER NOT NULL,
  skipped_rules    INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS redactions (
  run_id          INTEGER NOT NULL REFERENCES runs(id) ON DELETE CASCADE,
  seq             INTEGER NOT NULL,
  pattern_name    TEXT    NOT NULL,
  placeholder     TEXT    NOT NULL,
  start_pos       INTEGER NOT NULL,
  end_pos         INTEGER NOT NULL,
  replacement     TEXT    NOT NULL,
  matched_sha256  TEXT    NOT NULL,
  PRIMARY KEY (run_id, seq)
);

CREATE INDEX IF NOT EXISTS idx_redactions_pattern ON redactions(pattern_name);
)SQL";

const char* AuditStore::schemaSql() { return kSchemaSQL; }

bool AuditStore::initSchema() {
    if (!db_) return false;
    char* err = nullptr;
    if (sqlite3_exec(db_, kSchemaSQL, nullptr, nullptr, &err) != SQLITE_OK) {
        Logger::error(kComp, std::string("schema exec failed: ") + (err ? err : "unknown"));
        if (err) sqlite3_free(err);
        return false;
    }
    return true;
}

// Desc: write a run header and all of its redaction rows in one transaction
// In: const std::string& source, const std::string& ruleset_hash, const RedactionResult& result
// Out: int64_t (run id, -1 on failure)
int64_t AuditStore::recordRun(const std::string& source,
                              const std::string& ruleset_hash,
                              const RedactionResult& result) {
    if (!db_) return -1;

    if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK) {
        Logger::error(kComp, std::string("begin failed: ") + sqlite3_errmsg(db_));
        return -1;
    }
    auto rollback = [&](const char* what) -> int64_t {
        Logger::error(kComp, std::string(what) + ": " + sqlite3_errmsg(db_));
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        return -1;
    };

    int64_t run_id = -1;
    {
        sqlite3_stmt* s = nullptr;
        if (sqlite3_prepare_v2(db_,
                "INSERT INTO runs(ts, source, ruleset_hash, total_redactions, skipped_rules) "
                "VALUES(?,?,?,?,?)", -1, &s, nullptr) != SQLITE_OK) {
            return rollback("prepare runs");
        }
        sqlite3_bind_int64(s, 1, static_cast<sqlite3_int64>(::time(nullptr)));
        sqlite3_bind_text(s, 2, source.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s, 3, ruleset_hash.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(s, 4, static_cast<sqlite3_int64>(result.total_redactions));
        sqlite3_bind_int64(s, 5, static_cast<sqlite3_int64>(result.skipped_rules));
        int rc = sqlite3_step(s);
        sqlite3_finalize(s);
        if (rc != SQLITE_DONE) return rollback("insert run");
        run_id = sqlite3_last_insert_rowid(db_);
    }

    {
        sqlite3_stmt* s = nullptr;
        if (sqlite3_prepare_v2(db_,
                "INSERT INTO redactions(run_id, seq, pattern_name, placeholder, start_pos, end_pos, "
                "replacement, matched_sha256) VALUES(?,?,?,?,?,?,?,?)", -1, &s, nullptr) != SQLITE_OK) {
            return rollback("prepare redactions");
        }
        int64_t seq = 0;
        for (const auto& r : result.redactions) {
            const std::string digest = PatternCatalog::hashCanonical(r.matched_text);
            sqlite3_bind_int64(s, 1, run_id);
            sqlite3_bind_int64(s, 2, seq++);
            sqlite3_bind_text(s, 3, r.pattern_name.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(s, 4, r.placeholder.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(s, 5, static_cast<sqlite3_int64>(r.start_pos));
            sqlite3_bind_int64(s, 6, static_cast<sqlite3_int64>(r.end_pos));
            sqlite3_bind_text(s, 7, r.replacement.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(s, 8, digest.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(s) != SQLITE_DONE) {
                sqlite3_finalize(s);
                return rollback("insert redaction");
            }
            sqlite3_reset(s);
            sqlite3_clear_bindings(s);
        }
        sqlite3_finalize(s);
    }

    if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
        return rollback("commit");
    }
    Logger::debug(kComp, "recorded run " + std::to_string(run_id) + " with " +
                        std::to_string(result.redactions.size()) + " redactions");
    return run_id;
}

std::vector<AuditRow> AuditStore::loadRun(int64_t run_id) const {
    std::vector<AuditRow> rows;
    if (!db_) return rows;

    sqlite3_stmt* s = nullptr;
    if (sqlite3_prepare_v2(db_,
            "SELECT seq, pattern_name, placeholder, start_pos, end_pos, replacement, matched_sha256 "
            "FROM redactions WHERE run_id=? ORDER BY seq", -1, &s, nullptr) != SQLITE_OK) {
        Logger::error(kComp, std::string("prepare load: ") + sqlite3_errmsg(db_));
        return rows;
    }
    sqlite3_bind_int64(s, 1, run_id);

    auto col_text = [&](int i) {
        const unsigned char* t = sqlite3_column_text(s, i);
        return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
    };
    while (sqlite3_step(s) == SQLITE_ROW) {
        AuditRow r;
        r.run_id         = run_id;
        r.seq            = sqlite3_column_int64(s, 0);
        r.pattern_name   = col_text(1);
        r.placeholder    = col_text(2);
        r.start_pos      = sqlite3_column_int64(s, 3);
        r.end_pos        = sqlite3_column_int64(s, 4);
        r.replacement    = col_text(5);
        r.matched_sha256 = col_text(6);
        rows.push_back(std::move(r));
    }
    sqlite3_finalize(s);
    return rows;
}

int64_t AuditStore::runCount() const {
    if (!db_) return 0;
    int64_t n = 0;
    sqlite3_stmt* s = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM runs", -1, &s, nullptr) == SQLITE_OK) {
        if (sqlite3_step(s) == SQLITE_ROW) n = sqlite3_column_int64(s, 0);
        sqlite3_finalize(s);
    }
    return n;
}
