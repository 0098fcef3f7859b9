#include "Rewriter.hpp"
#include "PatternCompiler.hpp"

// Desc: splice placeholders into text at the accepted spans
// In: const std::string& text, const std::vector<CandidateMatch>& accepted,
//     std::vector<RedactionRecord>* audit (may be null)
// Out: std::string (redacted text)
std::string Rewriter::rewrite(const std::string& text,
                              const std::vector<CandidateMatch>& accepted,
                              std::vector<RedactionRecord>* audit) {
    std::string out;
    out.reserve(text.size());
    if (audit) audit->reserve(audit->size() + accepted.size());

    size_t last = 0;
    for (const auto& m : accepted) {
        out.append(text, last, m.start - last);
        out += m.rule->placeholder;
        if (audit) {
            audit->push_back(RedactionRecord{
                m.rule->name,
                m.rule->placeholder,
                m.start,
                m.end,
                text.substr(m.start, m.length()),
                m.rule->placeholder
            });
        }
        last = m.end;
    }
    out.append(text, last, std::string::npos);
    return out;
}
