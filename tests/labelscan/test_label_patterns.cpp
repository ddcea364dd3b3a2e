#include <catch2/catch_test_macros.hpp>
#include "labelscan/LabelPatterns.hpp"

using namespace labelscan;

namespace
{

std::string firstCapture(const MarkerPattern& pattern, const std::string& text)
{
    auto captures = pattern.captures(text);
    return captures.empty() ? std::string() : captures.front();
}

} // namespace

TEST_CASE("LabelPatterns - keyword validation", "[patterns]")
{
    REQUIRE_FALSE(validateKeyword("tag").has_value());
    REQUIRE_FALSE(validateKeyword("req-id").has_value());
    REQUIRE_FALSE(validateKeyword("c++").has_value());
    REQUIRE_FALSE(validateKeyword("ラベル").has_value());

    REQUIRE(validateKeyword("").has_value());
    REQUIRE(validateKeyword("two words").has_value());
    REQUIRE(validateKeyword("a\xC2\xA0" "b").has_value());
    REQUIRE(validateKeyword("a:b").has_value());
    REQUIRE(validateKeyword("[x").has_value());
    REQUIRE(validateKeyword("x]").has_value());
    REQUIRE(validateKeyword("\xff").has_value());
}

TEST_CASE("LabelPatterns - default patterns", "[patterns]")
{
    auto patterns = PatternSet::defaults();

    SECTION("Keyword patterns use the scanner") {
        REQUIRE(patterns.tag().isKeyword());
        REQUIRE(patterns.ref().isKeyword());
        REQUIRE(patterns.file().isKeyword());
        REQUIRE(patterns.dir().isKeyword());
    }

    SECTION("forKind returns the matching pattern") {
        REQUIRE(firstCapture(patterns.forKind(MarkerKind::Tag), "[tag:a]") == "a");
        REQUIRE(firstCapture(patterns.forKind(MarkerKind::Reference), "[ref:b]") == "b");
        REQUIRE(firstCapture(patterns.forKind(MarkerKind::FileLabel), "[file:c]") == "c");
        REQUIRE(firstCapture(patterns.forKind(MarkerKind::DirLabel), "[dir:d]") == "d");
    }

    SECTION("Kinds do not match each other's markers") {
        REQUIRE(firstCapture(patterns.tag(), "[ref:a] [file:b] [dir:c]").empty());
        REQUIRE(firstCapture(patterns.dir(), "[tag:a] [ref:b] [file:c]").empty());
    }

    SECTION("Whitespace is trimmed by the pattern itself") {
        REQUIRE(firstCapture(patterns.tag(), "[ \t Tag \t:\t label \t]") == "label");
    }

    SECTION("All matches on a line") {
        auto captures = patterns.ref().captures("[ref:a] text [REF: b ] [ref:]");
        REQUIRE(captures == std::vector<std::string>{ "a", "b" });
    }
}

TEST_CASE("LabelPatterns - custom keywords", "[patterns]")
{
    SECTION("Metacharacters in keywords match literally") {
        auto patterns = PatternSet::fromKeywords("t.g", "r+f", "f?le", "d|r");
        REQUIRE(firstCapture(patterns.tag(), "[t.g:x]") == "x");
        REQUIRE(firstCapture(patterns.tag(), "[tag:x]").empty());
        REQUIRE(firstCapture(patterns.ref(), "[R+F:y]") == "y");
        REQUIRE(firstCapture(patterns.file(), "[f?le:z]") == "z");
        REQUIRE(firstCapture(patterns.dir(), "[d|r:w]") == "w");
        REQUIRE(firstCapture(patterns.dir(), "[d:w]").empty());
    }

    SECTION("Non-ASCII keywords fold case") {
        auto pattern = MarkerPattern::fromKeyword("étiquette");
        REQUIRE(firstCapture(pattern, "[ÉTIQUETTE:x]") == "x");
    }

    SECTION("Invalid keywords are rejected") {
        REQUIRE_THROWS_AS(PatternSet::fromKeywords("", "ref", "file", "dir"), InvalidPattern);
        REQUIRE_THROWS_AS(PatternSet::fromKeywords("tag", "my ref", "file", "dir"), InvalidPattern);
        REQUIRE_THROWS_AS(PatternSet::fromKeywords("tag", "ref", "fi:le", "dir"), InvalidPattern);
        REQUIRE_THROWS_AS(PatternSet::fromKeywords("tag", "ref", "file", "dir]"), InvalidPattern);
        REQUIRE_THROWS_AS(MarkerPattern::fromKeyword("a\xE3\x80\x80" "b"), InvalidPattern);
    }
}

TEST_CASE("LabelPatterns - custom expressions", "[patterns]")
{
    SECTION("Valid expressions") {
        auto patterns = PatternSet::fromExpressions(R"(@tag\(([a-z]+)\))", R"(@ref\(([a-z]+)\))",
                                                    R"(@file\(([^)]+)\))", R"(@dir\(([^)]+)\))");
        REQUIRE_FALSE(patterns.tag().isKeyword());
        REQUIRE(firstCapture(patterns.tag(), "@TAG(abc)") == "abc");
        REQUIRE(firstCapture(patterns.file(), "@file(a/b.txt)") == "a/b.txt");
        REQUIRE(patterns.ref().captures("@ref(a) @ref(b)") == std::vector<std::string>{ "a", "b" });
    }

    SECTION("Malformed expression") {
        REQUIRE_THROWS_AS(compileMarkerPattern("[unclosed"), InvalidPattern);
        REQUIRE_THROWS_AS(MarkerPattern::fromExpression("(unclosed"), InvalidPattern);
    }

    SECTION("Wrong number of capture groups") {
        REQUIRE_THROWS_AS(compileMarkerPattern(R"(\[tag:[^\]]+\])"), InvalidPattern);
        REQUIRE_THROWS_AS(compileMarkerPattern(R"(\[(tag):([^\]]+)\])"), InvalidPattern);
    }
}
