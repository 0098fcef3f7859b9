#include <catch2/catch.hpp>

#include "MatchFinder.hpp"
#include "PatternCompiler.hpp"
#include "test_helpers.hpp"

TEST_CASE("Compiled rules keep declaration order") {
    auto set = PatternCompiler::compile({
        make_rule("first",  "aaa", "<A>"),
        make_rule("second", "bbb", "<B>"),
        make_rule("third",  "ccc", "<C>"),
    });
    REQUIRE(set->size() == 3);
    REQUIRE(set->rules[0].name == "first");
    REQUIRE(set->rules[1].name == "second");
    REQUIRE(set->rules[2].name == "third");
    REQUIRE(set->rules[2].placeholder == "<C>");
    REQUIRE(set->skipped.empty());
}

TEST_CASE("Invalid regex is skipped with a warning") {
    LogCapture cap(LogLevel::Warning);
    auto set = PatternCompiler::compile({
        make_rule("broken", "([a-z", "<BROKEN>"),
        make_rule("aws_key", "AKIA[0-9A-Z]{16}", "<REDACT_AWS_KEY>"),
    });
    REQUIRE(set->size() == 1);
    REQUIRE(set->rules[0].name == "aws_key");
    REQUIRE(set->skipped == std::vector<std::string>{"broken"});

    const std::string log = cap.text();
    REQUIRE(log.find("[WARN]") != std::string::npos);
    REQUIRE(log.find("broken") != std::string::npos);
}

TEST_CASE("All rules invalid yields an empty snapshot") {
    auto set = PatternCompiler::compile({
        make_rule("a", "*oops", "<A>"),
        make_rule("b", "(", "<B>"),
    });
    REQUIRE(set->empty());
    REQUIRE(set->skipped.size() == 2);
    REQUIRE_FALSE(set->prefilter);
}

TEST_CASE("Matchers are case-insensitive and multiline") {
    auto set = PatternCompiler::compile({
        make_rule("line", "^secret$", "<S>"),
    });
    REQUIRE(set->size() == 1);
    auto hits = MatchFinder::find_all(*set, "first\nSECRET\nlast");
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].start == 6);
    REQUIRE(hits[0].end == 12);
    REQUIRE(MatchFinder::find_all(*set, "not a secret here").empty());
}

TEST_CASE("Line anchors accept CR, LF and CRLF line ends") {
    auto set = PatternCompiler::compile({
        make_rule("tail", "token=\\w+$", "<T>"),
        make_rule("head", "^secret\\w+", "<S>"),
    });
    auto crlf = MatchFinder::find_all(*set, "token=abc123\r\nnext");
    REQUIRE(crlf.size() == 1);
    REQUIRE(crlf[0].end == 12);

    auto lone_cr = MatchFinder::find_all(*set, "x\rsecretXYZ");
    REQUIRE(lone_cr.size() == 1);
    REQUIRE(lone_cr[0].start == 2);
}

TEST_CASE("compileOne reports the error text") {
    std::string err;
    REQUIRE_FALSE(PatternCompiler::compileOne("([a-z", err));
    REQUIRE_FALSE(err.empty());
    err.clear();
    REQUIRE(PatternCompiler::compileOne("[a-z]+", err));
    REQUIRE(err.empty());
}

TEST_CASE("Prefilter can be disabled") {
    EngineOptions opts;
    opts.prefilter = false;
    auto set = PatternCompiler::compile({make_rule("a", "abc", "<A>")}, opts);
    REQUIRE(set->size() == 1);
    REQUIRE_FALSE(set->prefilter);
}

TEST_CASE("Snapshot hash depends on rule order") {
    auto a = PatternCompiler::compile({make_rule("x", "x", "<X>"), make_rule("y", "y", "<Y>")});
    auto b = PatternCompiler::compile({make_rule("y", "y", "<Y>"), make_rule("x", "x", "<X>")});
    auto c = PatternCompiler::compile({make_rule("x", "x", "<X>"), make_rule("y", "y", "<Y>")});
    REQUIRE(a->ruleset_hash.size() == 64);
    REQUIRE(a->ruleset_hash != b->ruleset_hash);
    REQUIRE(a->ruleset_hash == c->ruleset_hash);
}

TEST_CASE("Anchored patterns are kept out of the prefilter database") {
    REQUIRE(PatternMatcherHS::hasLineAnchor("token=\\w+$"));
    REQUIRE(PatternMatcherHS::hasLineAnchor("^secret"));
    REQUIRE(PatternMatcherHS::hasLineAnchor("end\\Z"));
    REQUIRE_FALSE(PatternMatcherHS::hasLineAnchor("[^\\s\"']+"));
    REQUIRE_FALSE(PatternMatcherHS::hasLineAnchor("price\\$[0-9]+"));
    REQUIRE_FALSE(PatternMatcherHS::hasLineAnchor("[$^]"));

    PatternMatcherHS hs;
    REQUIRE(hs.build({"abc", "^line$", "def"}));
    REQUIRE(hs.patternCount() == 3);
    REQUIRE(hs.filteredCount() == 2);

    std::vector<char> marks;
    REQUIRE(hs.candidates("nothing relevant", marks));
    REQUIRE(marks == std::vector<char>{0, 1, 0});
}
