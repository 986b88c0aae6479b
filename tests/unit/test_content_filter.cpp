#include <catch2/catch_test_macros.hpp>
#include "ContentFilter.hpp"
#include "AppException.hpp"
#include "FileScanner.hpp"
#include "TestHelpers.hpp"

#include <string>

using namespace std::string_literals;

TEST_CASE("matches carry path, line number and line text") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "a.txt", "first line\nneedle here\nthird\nanother needle\n");
    write_file(temp_dir.path() / "b.txt", "nothing to see\n");

    FileScanner scanner;
    ContentFilter filter("needle");
    const auto result = filter.filter(scanner.build(temp_dir.path()));

    REQUIRE(result.matches.size() == 2);
    CHECK(result.files_matched == 1);
    CHECK(result.matches[0].path == temp_dir.path() / "a.txt");
    CHECK(result.matches[0].line_number == 2);
    CHECK(result.matches[0].line_text == "needle here");
    CHECK(result.matches[1].line_number == 4);
    CHECK(result.skipped.empty());
}

TEST_CASE("patterns use the basic regular expression dialect") {
    ContentFilter anchored("^error");
    CHECK(anchored.matches_line("error: disk full"));
    CHECK_FALSE(anchored.matches_line("no error here"));

    // '+' and '|' are literal in basic syntax
    ContentFilter literal_plus("a+b");
    CHECK(literal_plus.matches_line("x a+b y"));
    CHECK_FALSE(literal_plus.matches_line("aab"));

    ContentFilter interval("ab\\{2\\}c");
    CHECK(interval.matches_line("abbc"));
    CHECK_FALSE(interval.matches_line("abc"));
}

TEST_CASE("malformed pattern is a usage error raised at construction") {
    try {
        ContentFilter filter("[unclosed");
        FAIL("expected USAGE_INVALID_PATTERN");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::USAGE_INVALID_PATTERN);
        CHECK(ex.is_usage_error());
    }
}

TEST_CASE("no match is an empty result, not an error") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "a.txt", "alpha\nbeta\n");

    FileScanner scanner;
    ContentFilter filter("gamma");
    const auto result = filter.filter(scanner.build(temp_dir.path()));
    CHECK(result.empty());
    CHECK(result.files_matched == 0);
}

TEST_CASE("binary files are skipped with a warning") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "blob.bin", "needle\0needle\n"s);
    write_file(temp_dir.path() / "text.txt", "needle\n");

    FileScanner scanner;
    ContentFilter filter("needle");
    const auto result = filter.filter(scanner.build(temp_dir.path()));

    REQUIRE(result.matches.size() == 1);
    CHECK(result.matches.front().path.filename() == "text.txt");
    REQUIRE(result.skipped.size() == 1);
    CHECK(result.skipped.front().find("blob.bin") != std::string::npos);
}

TEST_CASE("files that vanished before the search are skipped") {
    TempDir temp_dir;
    const std::vector<FileEntry> entries = {{temp_dir.path() / "gone.txt", 10}};

    ContentFilter filter("x");
    const auto result = filter.filter(entries);
    CHECK(result.empty());
    CHECK(result.skipped.size() == 1);
}

TEST_CASE("last line without a trailing newline is searched") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "tail.txt", "one\ntwo needle");

    FileScanner scanner;
    ContentFilter filter("needle");
    const auto result = filter.filter(scanner.build(temp_dir.path()));
    REQUIRE(result.matches.size() == 1);
    CHECK(result.matches.front().line_number == 2);
    CHECK(result.matches.front().line_text == "two needle");
}

TEST_CASE("backtracking pattern on a very long line completes") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "min.js", "a" + std::string(200000, 'x') + "\n");
    write_file(temp_dir.path() / "hit.txt", "a" + std::string(200000, 'x') + "b\n");

    FileScanner scanner;
    ContentFilter filter("a.*b");
    const auto result = filter.filter(scanner.build(temp_dir.path()));

    REQUIRE(result.matches.size() == 1);
    CHECK(result.matches.front().path.filename() == "hit.txt");
    CHECK(result.matches.front().line_text.size() == 200002);
    CHECK(result.skipped.empty());
}
