#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// One named pattern as supplied by the catalog.
struct Rule {
    std::string name;
    std::string regex;
    std::string placeholder;
    std::string category = "Unknown";
    std::string description;
};

struct RedactionRecord {
    std::string pattern_name;
    std::string placeholder;
    size_t      start_pos{0};
    size_t      end_pos{0};   // exclusive
    std::string matched_text;
    std::string replacement;
};

struct RedactionResult {
    std::string redacted_text;
    std::vector<RedactionRecord> redactions;
    size_t total_redactions{0};
    size_t skipped_rules{0};  // invalid at compile time + failed during this call
};

struct PatternDetail {
    std::string name;
    std::string category;
    std::string description;
    std::string regex;
    std::string placeholder;
};

struct PatternSummary {
    size_t total_patterns{0};
    std::map<std::string, size_t> categories;
    std::vector<PatternDetail> pattern_details;
};

constexpr int kResultSchemaVersion = 1;

void to_json(nlohmann::json& j, const RedactionRecord& r);
void to_json(nlohmann::json& j, const RedactionResult& r);
void to_json(nlohmann::json& j, const PatternDetail& d);
void to_json(nlohmann::json& j, const PatternSummary& s);
