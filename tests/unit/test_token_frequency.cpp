#include <catch2/catch_test_macros.hpp>
#include "TokenFrequencyCounter.hpp"

#include <clocale>
#include <sstream>
#include <string>
#include <vector>

namespace {
std::vector<TokenCount> top_of(const std::string& text, int top_n) {
    std::istringstream input(text);
    return TokenFrequencyCounter().count_top(input, top_n);
}
}

TEST_CASE("most frequent tokens come first") {
    const std::vector<TokenCount> expected = {{"b", 3}, {"a", 2}};
    CHECK(top_of("a a b b b c", 2) == expected);
}

TEST_CASE("equal counts keep first-seen order") {
    const std::vector<TokenCount> expected = {{"zeta", 2}, {"alpha", 2}, {"mid", 1}};
    CHECK(top_of("zeta alpha mid alpha zeta", 3) == expected);
}

TEST_CASE("empty input and non-positive top yield nothing") {
    CHECK(top_of("", 5).empty());
    CHECK(top_of("   \n\t ", 5).empty());
    CHECK(top_of("a b c", 0).empty());
    CHECK(top_of("a b c", -3).empty());
}

TEST_CASE("top larger than the vocabulary returns everything") {
    CHECK(top_of("one two", 10).size() == 2);
}

TEST_CASE("tokens are case-folded alphanumeric runs") {
    const std::vector<std::string> expected = {"hello", "world", "it", "s", "42nd", "street"};
    CHECK(TokenFrequencyCounter::tokenize("Hello, WORLD! It's 42nd-street.") == expected);
}

TEST_CASE("bytes outside ASCII separate tokens") {
    const std::vector<std::string> expected = {"caf", "bar"};
    CHECK(TokenFrequencyCounter::tokenize("caf\xc3\xa9 bar") == expected);
}

TEST_CASE("analyze reports wc-style counts") {
    std::istringstream input("The cat\nthe hat  sat\n\nlast line without newline");
    const TextReport report = TokenFrequencyCounter().analyze(input, 1);

    CHECK(report.lines == 3);
    CHECK(report.words == 9);
    CHECK(report.bytes == input.str().size());
    REQUIRE(report.top_tokens.size() == 1);
    CHECK(report.top_tokens.front() == TokenCount{"the", 2});
}

TEST_CASE("tokens spanning read chunks are counted once") {
    std::string text(70000, ' ');
    text.replace(65534, 4, "word");
    text += " word";
    std::istringstream input(text);
    const TextReport report = TokenFrequencyCounter().analyze(input, 5);

    const std::vector<TokenCount> expected = {{"word", 2}};
    CHECK(report.top_tokens == expected);
    CHECK(report.words == 2);
}

TEST_CASE("case folding ignores the process locale") {
    const std::string previous = std::setlocale(LC_CTYPE, nullptr);
    // Turkish single-byte locale folds 'I' to a dotless i where installed
    std::setlocale(LC_CTYPE, "tr_TR.ISO-8859-9");

    const std::vector<TokenCount> expected = {{"iris", 3}, {"x", 1}};
    const auto ranked = top_of("IRIS iris Iris \xDDx\xFD", 5);

    std::setlocale(LC_CTYPE, previous.c_str());
    CHECK(ranked == expected);
}
