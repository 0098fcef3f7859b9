// requirements.cpp
#include "requirements.hpp"
#include "AuditStore.hpp"
#include "Logger.hpp"
#include "XdgConfig.hpp"

static const char* kComp = "Requirements";

// Desc: forward collected startup lines to the logger
// In: const StartupResult& out
// Out: void
void Requirements::flushLogs(const StartupResult& out) {
    for (const auto& l : out.logs) {
        if (!out.ok && l == out.error) {
            Logger::error(kComp, l);
        } else {
            Logger::debug(kComp, l);
        }
    }
}

// Desc: built-in patterns, then the override file if any
// In: const std::string& config_path, StartupResult& out
// Out: bool (true on success)
bool Requirements::loadCatalog(const std::string& config_path, StartupResult& out) {
    if (!out.catalog.loadDefaults()) {
        out.error = "[config] built-in patterns failed to load";
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back("[config] built-in patterns: " + std::to_string(out.catalog.patternCount()));

    if (config_path.empty()) return true;
    if (!out.catalog.loadFromFile(config_path)) {
        out.error = "[config] failed to load " + config_path;
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back("[config] loaded: " + config_path);
    return true;
}

bool Requirements::validateCatalog(StartupResult& out) {
    const auto& cat = out.catalog;
    if (cat.rejectedCount() > 0) {
        Logger::warn(kComp, std::to_string(cat.rejectedCount()) + " malformed rule(s) rejected from configuration");
    }
    if (cat.patternCount() == 0) {
        // not fatal: the engine passes text through unchanged
        Logger::warn(kComp, "no patterns configured, text will not be redacted");
    }
    out.logs.push_back("[config] patterns loaded: " + std::to_string(cat.patternCount()));
    out.logs.push_back("[config] prefilter: " + std::string(cat.getEngineOptions().prefilter ? "on" : "off"));
    out.logs.push_back("[config] ruleset: " + cat.rulesetHash());
    return true;
}

// Desc: open/init the SQLite audit DB and apply schema
// In: const std::string& db_path, StartupResult& out
// Out: bool (true on success)
bool Requirements::initAuditDb(const std::string& db_path, StartupResult& out) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(db_path.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        out.error = std::string("[audit] sqlite open failed: ") + (raw ? sqlite3_errmsg(raw) : "unknown");
        out.logs.push_back(out.error);
        if (raw) sqlite3_close(raw);
        return false;
    }
    sqlite3_busy_timeout(raw, 5000);
    sqlite3_exec(raw, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(raw, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(raw, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);

    out.db.reset(raw);

    AuditStore store(out.db.get());
    if (!store.initSchema()) {
        out.error = "[audit] schema exec failed: " + db_path;
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back("[audit] schema ok: " + db_path);
    return true;
}

// Desc: orchestrate startup: config discovery, catalog, audit DB
// In: const std::string& config_arg, const std::string& audit_db_path
// Out: StartupResult
StartupResult Requirements::run(const std::string& config_arg,
                                const std::string& audit_db_path) {
    StartupResult res;

    // 1) config discovery
    res.config_path = XdgConfig::resolveConfigPath(config_arg);
    res.logs.push_back("[config] override: " + (res.config_path.empty() ? std::string("<none>") : res.config_path));

    // 2) catalog load + validate
    if (!loadCatalog(res.config_path, res) || !validateCatalog(res)) {
        flushLogs(res);
        return res;
    }

    // 3) audit DB
    if (!audit_db_path.empty() && !initAuditDb(audit_db_path, res)) {
        flushLogs(res);
        return res;
    }

    res.ok = true;
    flushLogs(res);
    return res;
}
