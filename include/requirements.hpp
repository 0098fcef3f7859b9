// requirements.hpp
#pragma once
#include "PatternCatalog.hpp"
#include <memory>
#include <string>
#include <vector>
#include <sqlite3.h>

struct StartupResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> logs;
    std::string config_path;        // resolved override file, empty = built-ins only
    PatternCatalog catalog;
    std::unique_ptr<sqlite3, void(*)(sqlite3*)> db{nullptr, [](sqlite3* p){ if (p) sqlite3_close(p); }};
};

class Requirements {
public:
    // config_arg: --config value (may be empty); audit_db_path: empty = no audit DB
    static StartupResult run(const std::string& config_arg,
                             const std::string& audit_db_path);

private:
    static bool loadCatalog(const std::string& config_path, StartupResult& out);
    static bool validateCatalog(StartupResult& out);
    static bool initAuditDb(const std::string& db_path, StartupResult& out);
    static void flushLogs(const StartupResult& out);
};
