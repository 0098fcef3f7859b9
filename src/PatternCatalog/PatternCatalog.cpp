// === PatternCatalog.cpp ===
#include "PatternCatalog.hpp"
#include "Logger.hpp"

#include <climits>
#include <cstdint>
#include <fstream>
#include <utility>
#include <iterator>
#include <sstream>
#include <openssl/sha.h>

using nlohmann::json;
using nlohmann::ordered_json;

static const char* kComp = "PatternCatalog";

// Desc: read one string field of a rule object
// In: const ordered_json& obj, const char* key, std::string& out
// Out: bool (false if missing or not a string)
static bool read_string(const ordered_json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

bool PatternCatalog::loadDefaults() {
    rules_.clear();
    options_ = EngineOptions{};
    rejected_ = 0;
    return loadFromString(defaultPatternsJson(), "<built-in>");
}

bool PatternCatalog::loadFromFile(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        Logger::error(kComp, "cannot open file: " + config_path);
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return loadFromString(text, config_path);
}

// Desc: parse a JSON catalog document and merge it over the current rules
// In: const std::string& json_text, const std::string& origin (for messages)
// Out: bool (false on invalid JSON/structure; catalog is left unchanged)
bool PatternCatalog::loadFromString(const std::string& json_text, const std::string& origin) {
    ordered_json j;
    try {
        j = ordered_json::parse(json_text);
    } catch (const json::exception& e) {
        Logger::error(kComp, "invalid JSON in " + origin + ": " + e.what());
        return false;
    }

    PatternCatalog next = *this;
    if (!next.mergeJson_(j, origin)) return false;
    *this = std::move(next);
    Logger::debug(kComp, "loaded " + origin + ", " + std::to_string(rules_.size()) + " rules");
    return true;
}

// Desc: replace a rule with the same name in place, else append
// In: Rule r
// Out: void
void PatternCatalog::upsert_(Rule r) {
    for (auto& existing : rules_) {
        if (existing.name == r.name) {
            Logger::debug(kComp, "rule '" + r.name + "' overridden");
            existing = std::move(r);
            return;
        }
    }
    rules_.push_back(std::move(r));
}

bool PatternCatalog::mergeJson_(const ordered_json& j, const std::string& origin) {
    if (!j.is_object()) {
        Logger::error(kComp, origin + ": top level must be an object");
        return false;
    }

    // engine options
    if (j.contains("engine")) {
        const auto& e = j["engine"];
        if (!e.is_object()) {
            Logger::error(kComp, origin + ": 'engine' must be an object");
            return false;
        }
        if (e.contains("prefilter")) {
            if (!e["prefilter"].is_boolean()) {
                Logger::error(kComp, origin + ": 'engine.prefilter' must be a boolean");
                return false;
            }
            options_.prefilter = e["prefilter"].get<bool>();
        }
        const std::pair<const char*, uint32_t*> limits[] = {
            {"match_limit",    &options_.match_limit},
            {"depth_limit",    &options_.depth_limit},
            {"heap_limit_kib", &options_.heap_limit_kib},
        };
        for (const auto& l : limits) {
            if (!e.contains(l.first)) continue;
            const auto& v = e[l.first];
            if (!v.is_number_unsigned() || v.get<uint64_t>() == 0 || v.get<uint64_t>() > UINT32_MAX) {
                Logger::error(kComp, origin + ": 'engine." + l.first + "' must be a positive 32-bit integer");
                return false;
            }
            *l.second = v.get<uint32_t>();
        }
    }

    if (!j.contains("patterns")) {
        Logger::warn(kComp, origin + ": no 'patterns' object");
        return true;
    }
    const auto& pats = j["patterns"];
    if (!pats.is_object()) {
        Logger::error(kComp, origin + ": 'patterns' must be an object of categories");
        return false;
    }

    for (auto cat = pats.begin(); cat != pats.end(); ++cat) {
        const std::string& category = cat.key();
        const auto& body = cat.value();
        if (!body.is_object() || !body.contains("rules") || !body["rules"].is_array()) {
            Logger::warn(kComp, origin + ": category '" + category + "' has no 'rules' array, skipped");
            continue;
        }

        size_t idx = 0;
        for (const auto& r : body["rules"]) {
            ++idx;
            if (!r.is_object()) {
                Logger::warn(kComp, origin + ": " + category + " rule #" + std::to_string(idx) + " is not an object");
                ++rejected_;
                continue;
            }
            Rule rule;
            rule.category = category;
            bool ok = read_string(r, "name", rule.name)
                   && read_string(r, "regex", rule.regex)
                   && read_string(r, "placeholder", rule.placeholder);
            if (!ok || rule.name.empty() || rule.regex.empty() || rule.placeholder.empty()) {
                std::string label = rule.name.empty() ? "#" + std::to_string(idx) : "'" + rule.name + "'";
                Logger::warn(kComp, origin + ": " + category + " rule " + label +
                                   " needs non-empty 'name', 'regex' and 'placeholder', rejected");
                ++rejected_;
                continue;
            }
            if (r.contains("description") && !read_string(r, "description", rule.description)) {
                Logger::warn(kComp, origin + ": rule '" + rule.name + "' description is not a string, ignored");
            }
            upsert_(std::move(rule));
        }
    }
    return true;
}


std::string PatternCatalog::canonicalRulesJson() const {
    return canonicalRulesJson(rules_, options_);
}

// Desc: build canonical JSON of the ordered rules and engine options
// In: const std::vector<Rule>& rules, const EngineOptions& opts
// Out: std::string (JSON)
std::string PatternCatalog::canonicalRulesJson(const std::vector<Rule>& rules, const EngineOptions& opts) {
    // order is significant: it decides exact ties between rules.
    // category and description feed the summary, so they are part of the identity.
    json arr = json::array();
    for (const auto& r : rules) {
        arr.push_back(json::array({r.name, r.regex, r.placeholder, r.category, r.description}));
    }
    json c;
    c["prefilter"] = opts.prefilter;
    c["match_limit"] = opts.match_limit;
    c["depth_limit"] = opts.depth_limit;
    c["heap_limit_kib"] = opts.heap_limit_kib;
    c["rules"] = std::move(arr);
    return c.dump();
}

// Desc: hash data into SHA-256 hex
// In: const std::string& data
// Out: std::string (64 hex chars)
std::string PatternCatalog::hashCanonical(const std::string& data) {
    unsigned char out[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), out);
    static const char* hex = "0123456789abcdef";
    std::string h(2 * SHA256_DIGEST_LENGTH, '0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        h[2*i]   = hex[(out[i]>>4) & 0xF];
        h[2*i+1] = hex[out[i] & 0xF];
    }
    return h;
}

PatternSummary PatternCatalog::summarize(const std::vector<Rule>& rules) {
    PatternSummary s;
    s.total_patterns = rules.size();
    for (const auto& r : rules) {
        const std::string category = r.category.empty() ? "Unknown" : r.category;
        s.categories[category] += 1;
        s.pattern_details.push_back(PatternDetail{r.name, category, r.description, r.regex, r.placeholder});
    }
    return s;
}
