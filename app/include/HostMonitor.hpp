#ifndef HOST_MONITOR_HPP
#define HOST_MONITOR_HPP

#include "FileScanner.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct DiskUsage {
    std::string device;
    std::string mount_point;
    std::uintmax_t total_bytes{0};
    std::uintmax_t used_bytes{0};
    std::uintmax_t available_bytes{0};

    int used_percent() const {
        const std::uintmax_t usable = used_bytes + available_bytes;
        if (usable == 0) {
            return 0;
        }
        return static_cast<int>((used_bytes * 100 + usable - 1) / usable);
    }
};

struct DirectoryUsage {
    std::filesystem::path path;
    std::uintmax_t size_bytes{0};
};

struct ProcessUsage {
    int pid{0};
    std::string command;
    double cpu_percent{0.0};
    double mem_percent{0.0};
};

struct HostSnapshot {
    std::time_t taken_at{0};
    std::string host_name;
    std::string kernel;
    std::vector<DiskUsage> disks;
    std::vector<DirectoryUsage> largest_directories;
    std::vector<ProcessUsage> busiest_processes;
};

/**
 * @brief Fields of /proc/<pid>/stat needed to rank processes.
 */
struct ProcStat {
    int pid{0};
    std::string command;
    std::uint64_t utime_ticks{0};
    std::uint64_t stime_ticks{0};
    std::uint64_t start_ticks{0};
    std::int64_t rss_pages{0};
};

/**
 * @brief Point-in-time view of the host for the `monitor` command.
 *
 * Reads /proc (or the directory given at construction) for mounts, memory
 * and processes. A source that cannot be read leaves its section empty.
 */
class HostMonitor {
public:
    static constexpr std::size_t kDiskLimit = 4;
    static constexpr std::size_t kDirectoryLimit = 5;
    static constexpr std::size_t kProcessLimit = 5;

    explicit HostMonitor(FileScanner& scanner, std::filesystem::path proc_root = "/proc");

    HostSnapshot snapshot(const std::filesystem::path& work_dir) const;

    std::vector<DiskUsage> disk_usage(std::size_t limit) const;
    std::vector<DirectoryUsage> largest_directories(const std::filesystem::path& work_dir,
                                                    std::size_t limit) const;
    std::vector<ProcessUsage> busiest_processes(std::size_t limit) const;

    static std::optional<ProcStat> parse_proc_stat(const std::string& line);
    static std::string decode_mount_field(const std::string& field);

private:
    std::optional<double> read_uptime_seconds() const;
    std::optional<std::uint64_t> read_mem_total_bytes() const;

    FileScanner& scanner;
    std::filesystem::path proc_root_;
};

#endif
