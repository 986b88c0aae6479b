#include <catch2/catch_test_macros.hpp>
#include "CommandRunner.hpp"
#include "TestHelpers.hpp"
#include <app_version.hpp>

#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct RunOutcome {
    int exit_code{0};
    std::string out;
    std::string err;
};

RunOutcome run(const std::vector<std::string>& args, const fs::path& proc_root = "/proc") {
    std::ostringstream out;
    std::ostringstream err;
    CommandRunner runner(out, err, proc_root);
    RunOutcome outcome;
    outcome.exit_code = runner.run(args);
    outcome.out = out.str();
    outcome.err = err.str();
    return outcome;
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

}

TEST_CASE("no arguments prints usage and succeeds") {
    const auto outcome = run({});
    CHECK(outcome.exit_code == CommandRunner::kExitSuccess);
    CHECK(contains(outcome.out, "Usage:"));
    CHECK(outcome.err.empty());
}

TEST_CASE("version prints the project version") {
    const auto outcome = run({"version"});
    CHECK(outcome.exit_code == 0);
    CHECK(outcome.out == APP_VERSION.to_string() + "\n");
}

TEST_CASE("unknown command is a usage error on stderr") {
    const auto outcome = run({"explode"});
    CHECK(outcome.exit_code == CommandRunner::kExitFailure);
    CHECK(outcome.out.empty());
    CHECK(contains(outcome.err, "Error: Unknown command: explode"));
    CHECK(contains(outcome.err, "Try 'systoolkit help'."));
}

TEST_CASE("inspect of a missing directory fails") {
    TempDir temp_dir;
    const auto outcome = run({"inspect", (temp_dir.path() / "nope").string()});
    CHECK(outcome.exit_code == 1);
    CHECK(contains(outcome.err, "Error: Not a directory"));
    CHECK_FALSE(contains(outcome.err, "Try 'systoolkit help'."));
}

TEST_CASE("inspect with a pattern that matches nothing still succeeds") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "a.txt", "alpha\n");

    const auto outcome = run({"inspect", temp_dir.path().string(), "--pattern", "omega"});
    CHECK(outcome.exit_code == 0);
    CHECK(contains(outcome.out, "No matches found for 'omega'"));
}

TEST_CASE("inspect prints matches and summary") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "a.txt", "alpha\nbeta\n");

    const auto outcome = run({"inspect", temp_dir.path().string(), "--pattern", "beta", "--ext", ".txt"});
    CHECK(outcome.exit_code == 0);
    CHECK(contains(outcome.out, "Matching files: 1"));
    CHECK(contains(outcome.out, (temp_dir.path() / "a.txt").string() + ":2:beta"));
}

TEST_CASE("inspect with an invalid pattern is a usage error") {
    TempDir temp_dir;
    const auto outcome = run({"inspect", temp_dir.path().string(), "--pattern", "[oops"});
    CHECK(outcome.exit_code == 1);
    CHECK(contains(outcome.err, "Invalid search pattern"));
}

TEST_CASE("backup writes the archive and survives spaces in names") {
    TempDir source;
    TempDir output;
    write_file(source.path() / "my notes.txt", "hi");
    const fs::path destination = output.path() / "out.tar.gz";

    const auto outcome = run({"backup", source.path().string(), "--output", destination.string()});
    CHECK(outcome.exit_code == 0);
    CHECK(fs::exists(destination));
    CHECK(contains(outcome.out, "1 file(s)"));
}

TEST_CASE("backup without output is rejected before anything is written") {
    TempDir source;
    const auto outcome = run({"backup", source.path().string()});
    CHECK(outcome.exit_code == 1);
    CHECK(contains(outcome.err, "Missing required option"));
}

TEST_CASE("cleanup dry run keeps files and reports them") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "old.tmp");

    const auto outcome = run({"cleanup", temp_dir.path().string(), "--dry-run"});
    CHECK(outcome.exit_code == 0);
    CHECK(contains(outcome.out, "old.tmp"));
    CHECK(fs::exists(temp_dir.path() / "old.tmp"));

    const auto live = run({"cleanup", temp_dir.path().string()});
    CHECK(live.exit_code == 0);
    CHECK_FALSE(fs::exists(temp_dir.path() / "old.tmp"));
}

TEST_CASE("cleanup with nothing to remove succeeds") {
    TempDir temp_dir;
    const auto outcome = run({"cleanup", temp_dir.path().string()});
    CHECK(outcome.exit_code == 0);
    CHECK(contains(outcome.out, "No files to clean up."));
}

TEST_CASE("process reports statistics and top tokens") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "words.txt", "a a b b b c\n");

    const auto outcome = run({"process", (temp_dir.path() / "words.txt").string(), "--top", "2"});
    CHECK(outcome.exit_code == 0);
    CHECK(contains(outcome.out, "Lines: 1"));
    CHECK(contains(outcome.out, "Words: 6"));
    CHECK(contains(outcome.out, "      3 b\n      2 a\n"));
    CHECK_FALSE(contains(outcome.out, " c\n"));
}

TEST_CASE("process of a missing file fails") {
    TempDir temp_dir;
    const auto outcome = run({"process", (temp_dir.path() / "absent.txt").string()});
    CHECK(outcome.exit_code == 1);
    CHECK(contains(outcome.err, "Error: File not found"));

    const auto directory = run({"process", temp_dir.path().string()});
    CHECK(directory.exit_code == 1);
}

TEST_CASE("monitor prints every section even when sources are missing") {
    TempDir empty_proc;
    const auto outcome = run({"monitor"}, empty_proc.path());
    CHECK(outcome.exit_code == 0);
    CHECK(contains(outcome.out, "Date: "));
    CHECK(contains(outcome.out, "Kernel: "));
    CHECK(contains(outcome.out, "Disks:"));
    CHECK(contains(outcome.out, "Largest directories:"));
    CHECK(contains(outcome.out, "Busiest processes:"));
}
