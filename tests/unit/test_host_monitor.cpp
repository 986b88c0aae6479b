#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "HostMonitor.hpp"
#include "FileScanner.hpp"
#include "TestHelpers.hpp"

#include <fmt/format.h>

#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::string stat_line(int pid, const std::string& command, long utime, long stime,
                      long start, long rss) {
    return fmt::format("{} ({}) S 1 1 1 0 -1 0 0 0 0 0 {} {} 0 0 20 0 1 0 {} 1000 {} 0 0\n",
                       pid, command, utime, stime, start, rss);
}

// Minimal /proc replacement with two processes and a mount table
void build_fake_proc(const fs::path& root, long hz) {
    write_file(root / "uptime", "1000.00 4000.00\n");
    write_file(root / "meminfo", "MemTotal:        1000 kB\nMemFree:          500 kB\n");
    write_file(root / "mounts",
               "/dev/root / ext4 rw 0 0\n"
               "/dev/root / ext4 rw 0 0\n"
               "ghost /definitely/not/mounted tmpfs rw 0 0\n");
    // 500 s of CPU over 1000 s of life
    write_file(root / "100" / "stat", stat_line(100, "busy worker", 400 * hz, 100 * hz, 0, 10));
    // 100 s of CPU over the last 500 s
    write_file(root / "200" / "stat", stat_line(200, "idle", 60 * hz, 40 * hz, 500 * hz, 5));
    write_file(root / "self" / "stat", "not a pid directory\n");
    write_file(root / "300" / "stat", "garbage\n");
}

}

TEST_CASE("parse_proc_stat handles commands with spaces and parentheses") {
    const auto stat = HostMonitor::parse_proc_stat(stat_line(4242, "odd (name) here", 7, 3, 900, 12));
    REQUIRE(stat.has_value());
    CHECK(stat->pid == 4242);
    CHECK(stat->command == "odd (name) here");
    CHECK(stat->utime_ticks == 7);
    CHECK(stat->stime_ticks == 3);
    CHECK(stat->start_ticks == 900);
    CHECK(stat->rss_pages == 12);
}

TEST_CASE("parse_proc_stat rejects truncated lines") {
    CHECK_FALSE(HostMonitor::parse_proc_stat("12 (short) S 1 2 3").has_value());
    CHECK_FALSE(HostMonitor::parse_proc_stat("no parentheses at all").has_value());
    CHECK_FALSE(HostMonitor::parse_proc_stat("").has_value());
}

TEST_CASE("mount table escapes are decoded") {
    CHECK(HostMonitor::decode_mount_field("/mnt/my\\040disk") == "/mnt/my disk");
    CHECK(HostMonitor::decode_mount_field("/a\\134b") == "/a\\b");
    CHECK(HostMonitor::decode_mount_field("/plain") == "/plain");
    CHECK(HostMonitor::decode_mount_field("/trailing\\") == "/trailing\\");
}

TEST_CASE("busiest processes are ranked by lifetime cpu share") {
    TempDir proc;
    const long hz = ::sysconf(_SC_CLK_TCK);
    build_fake_proc(proc.path(), hz);

    FileScanner scanner;
    HostMonitor monitor(scanner, proc.path());
    const auto processes = monitor.busiest_processes(5);

    REQUIRE(processes.size() == 2);
    CHECK(processes[0].pid == 100);
    CHECK(processes[0].command == "busy worker");
    CHECK_THAT(processes[0].cpu_percent, Catch::Matchers::WithinAbs(50.0, 0.01));
    CHECK(processes[1].pid == 200);
    CHECK_THAT(processes[1].cpu_percent, Catch::Matchers::WithinAbs(20.0, 0.01));
    CHECK(processes[0].mem_percent > 0.0);
}

TEST_CASE("disk usage skips duplicates and unreachable mounts") {
    TempDir proc;
    build_fake_proc(proc.path(), 100);

    FileScanner scanner;
    HostMonitor monitor(scanner, proc.path());
    const auto disks = monitor.disk_usage(HostMonitor::kDiskLimit);
    REQUIRE(disks.size() == 1);
    CHECK(disks.front().mount_point == "/");
    CHECK(disks.front().total_bytes > 0);
    CHECK(disks.front().used_percent() <= 100);
}

TEST_CASE("largest directories include the working directory itself") {
    TempDir work;
    write_file(work.path() / "root.bin", std::string(10, 'r'));
    write_file(work.path() / "big" / "a.bin", std::string(300, 'a'));
    write_file(work.path() / "big" / "inner" / "b.bin", std::string(200, 'b'));
    write_file(work.path() / "small" / "c.bin", std::string(50, 'c'));

    FileScanner scanner;
    HostMonitor monitor(scanner);
    const auto directories = monitor.largest_directories(work.path(), 3);

    REQUIRE(directories.size() == 3);
    CHECK(directories[0].path == work.path());
    CHECK(directories[0].size_bytes == 560);
    CHECK(directories[1].path == work.path() / "big");
    CHECK(directories[1].size_bytes == 500);
    CHECK(directories[2].path == work.path() / "big" / "inner");
}

TEST_CASE("missing sources leave their sections empty") {
    TempDir empty_proc;
    TempDir work;

    FileScanner scanner;
    HostMonitor monitor(scanner, empty_proc.path());
    const auto snapshot = monitor.snapshot(work.path() / "missing");

    CHECK(snapshot.disks.empty());
    CHECK(snapshot.busiest_processes.empty());
    CHECK(snapshot.largest_directories.empty());
    CHECK(snapshot.taken_at > 0);
}
