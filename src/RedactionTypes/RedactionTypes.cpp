#include "RedactionTypes.hpp"

using nlohmann::json;

void to_json(json& j, const RedactionRecord& r) {
    j = json{
        {"pattern_name", r.pattern_name},
        {"placeholder",  r.placeholder},
        {"start_pos",    r.start_pos},
        {"end_pos",      r.end_pos},
        {"matched_text", r.matched_text},
        {"replacement",  r.replacement}
    };
}

// Desc: serialize a detailed redaction result (versioned schema)
// In: json& j, const RedactionResult& r
// Out: void
void to_json(json& j, const RedactionResult& r) {
    j = json{
        {"schema_version",   kResultSchemaVersion},
        {"redacted_text",    r.redacted_text},
        {"redactions",       r.redactions},
        {"total_redactions", r.total_redactions},
        {"skipped_rules",    r.skipped_rules}
    };
}

void to_json(json& j, const PatternDetail& d) {
    j = json{
        {"name",        d.name},
        {"category",    d.category},
        {"description", d.description},
        {"regex",       d.regex},
        {"placeholder", d.placeholder}
    };
}

void to_json(json& j, const PatternSummary& s) {
    j = json{
        {"total_patterns",  s.total_patterns},
        {"categories",      s.categories},
        {"pattern_details", s.pattern_details}
    };
}
