#include <catch2/catch.hpp>

#include "PatternCompiler.hpp"
#include "Rewriter.hpp"

TEST_CASE("Placeholders are spliced between unmatched slices") {
    CompiledRule key{nullptr, "key", "<KEY>", "k"};
    CompiledRule mail{nullptr, "mail", "<MAIL>", "m"};
    const std::string text = "a KEY b MAIL c";

    std::vector<RedactionRecord> audit;
    std::string out = Rewriter::rewrite(text, {{2, 5, &key}, {8, 12, &mail}}, &audit);

    REQUIRE(out == "a <KEY> b <MAIL> c");
    REQUIRE(audit.size() == 2);
    REQUIRE(audit[0].pattern_name == "key");
    REQUIRE(audit[0].start_pos == 2);
    REQUIRE(audit[0].end_pos == 5);
    REQUIRE(audit[0].matched_text == "KEY");
    REQUIRE(audit[0].replacement == "<KEY>");
    REQUIRE(audit[1].matched_text == "MAIL");
    REQUIRE(audit[1].placeholder == "<MAIL>");
}

TEST_CASE("Matches at both ends of the text") {
    CompiledRule r{nullptr, "x", "[X]", "x"};
    std::string out = Rewriter::rewrite("xxmidxx", {{0, 2, &r}, {5, 7, &r}}, nullptr);
    REQUIRE(out == "[X]mid[X]");
}

TEST_CASE("No accepted matches returns the text unchanged") {
    std::vector<RedactionRecord> audit;
    REQUIRE(Rewriter::rewrite("nothing here", {}, &audit) == "nothing here");
    REQUIRE(audit.empty());
}

TEST_CASE("Text-only mode produces the same text without records") {
    CompiledRule r{nullptr, "x", "<R>", "x"};
    std::vector<CandidateMatch> accepted{{1, 3, &r}, {4, 5, &r}};
    std::vector<RedactionRecord> audit;
    REQUIRE(Rewriter::rewrite("abcdef", accepted, nullptr) == Rewriter::rewrite("abcdef", accepted, &audit));
    REQUIRE(audit.size() == 2);
}
