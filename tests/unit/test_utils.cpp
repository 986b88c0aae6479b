#include <catch2/catch_test_macros.hpp>
#include "Utils.hpp"
#include "TestHooks.hpp"
#include "TestHelpers.hpp"
#include <optional>
#include <filesystem>
#include <fstream>

TEST_CASE("format_size follows du -h conventions") {
    CHECK(Utils::format_size(0) == "0B");
    CHECK(Utils::format_size(512) == "512B");
    CHECK(Utils::format_size(1024) == "1.0K");
    CHECK(Utils::format_size(1536) == "1.5K");
    CHECK(Utils::format_size(20 * 1024) == "20K");
    CHECK(Utils::format_size(3ULL * 1024 * 1024 * 1024) == "3.0G");
}

TEST_CASE("has_suffix is a literal suffix test") {
    CHECK(Utils::has_suffix("notes.txt", ".txt"));
    CHECK(Utils::has_suffix("draft~", "~"));
    CHECK_FALSE(Utils::has_suffix("txt", ".txt"));
    CHECK_FALSE(Utils::has_suffix("notes.TXT", ".txt"));
    CHECK(Utils::has_suffix("anything", ""));
}

TEST_CASE("relative_to_base accepts descendants only") {
    CHECK(Utils::relative_to_base("/data/root/a/b.txt", "/data/root") ==
          std::optional<std::filesystem::path>("a/b.txt"));
    CHECK(Utils::relative_to_base("/data/root/a/b.txt", "/data/root/") ==
          std::optional<std::filesystem::path>("a/b.txt"));
    CHECK(Utils::relative_to_base("/data/root/./a/../c.txt", "/data/root") ==
          std::optional<std::filesystem::path>("c.txt"));

    CHECK_FALSE(Utils::relative_to_base("/data/other/b.txt", "/data/root").has_value());
    CHECK_FALSE(Utils::relative_to_base("/data/root/../escape.txt", "/data/root").has_value());
    CHECK_FALSE(Utils::relative_to_base("/data/root", "/data/root").has_value());
}

TEST_CASE("relative_to_base resolves relative inputs against the working directory") {
    const auto cwd = std::filesystem::current_path();
    CHECK(Utils::relative_to_base(cwd / "dir" / "file", ".") ==
          std::optional<std::filesystem::path>("dir/file"));
}

TEST_CASE("is_writable_directory rejects files and missing paths") {
    TempDir temp_dir;
    const auto file = temp_dir.path() / "plain.txt";
    std::ofstream(file).put('x');

    CHECK(Utils::is_writable_directory(temp_dir.path()));
    CHECK_FALSE(Utils::is_valid_directory(file));
    CHECK_FALSE(Utils::is_writable_directory(temp_dir.path() / "missing"));
}

TEST_CASE("remove_file honors probe overrides") {
    struct ProbeGuard {
        ~ProbeGuard() { TestHooks::reset_file_removal_probe(); }
    } guard;

    TempDir temp_dir;
    const auto file = temp_dir.path() / "keep.tmp";
    std::ofstream(file).put('x');

    TestHooks::set_file_removal_probe([](const std::filesystem::path&, std::error_code& ec) {
        ec = std::make_error_code(std::errc::permission_denied);
        return false;
    });
    std::error_code ec;
    CHECK_FALSE(TestHooks::remove_file(file, ec));
    CHECK(ec == std::errc::permission_denied);
    CHECK(std::filesystem::exists(file));

    TestHooks::reset_file_removal_probe();
    ec.clear();
    CHECK(TestHooks::remove_file(file, ec));
    CHECK_FALSE(ec);
    CHECK_FALSE(std::filesystem::exists(file));
}
