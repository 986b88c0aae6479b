#include "HostMonitor.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <string_view>
#include <system_error>

#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
template <typename T>
bool parse_number(std::string_view text, T& value)
{
    const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    return result.ec == std::errc() && result.ptr == text.data() + text.size();
}

bool is_pid_name(const std::string& name)
{
    return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
}

std::string read_host_name()
{
    std::array<char, 256> buffer{};
    if (::gethostname(buffer.data(), buffer.size() - 1) != 0) {
        return {};
    }
    return std::string(buffer.data());
}

std::string read_kernel()
{
    struct utsname info{};
    if (::uname(&info) != 0) {
        return {};
    }
    return std::string(info.sysname) + " " + info.release;
}
}

HostMonitor::HostMonitor(FileScanner& scanner, fs::path proc_root)
    : scanner(scanner),
      proc_root_(std::move(proc_root))
{
}


HostSnapshot HostMonitor::snapshot(const fs::path& work_dir) const
{
    auto logger = Logger::get_logger("core_logger");
    HostSnapshot snapshot;
    snapshot.taken_at = std::time(nullptr);
    snapshot.host_name = read_host_name();
    snapshot.kernel = read_kernel();
    if (logger && (snapshot.host_name.empty() || snapshot.kernel.empty())) {
        logger->warn("Host identification is incomplete");
    }
    snapshot.disks = disk_usage(kDiskLimit);
    snapshot.largest_directories = largest_directories(work_dir, kDirectoryLimit);
    snapshot.busiest_processes = busiest_processes(kProcessLimit);
    return snapshot;
}


std::vector<DiskUsage> HostMonitor::disk_usage(std::size_t limit) const
{
    std::vector<DiskUsage> disks;
    std::ifstream mounts(proc_root_ / "mounts");
    if (!mounts.is_open()) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Cannot read mount table from '{}'", Utils::path_to_utf8(proc_root_ / "mounts"));
        }
        return disks;
    }

    std::set<std::string> seen_mount_points;
    std::string line;
    while (disks.size() < limit && std::getline(mounts, line)) {
        std::istringstream fields(line);
        std::string device;
        std::string mount_point;
        if (!(fields >> device >> mount_point)) {
            continue;
        }
        mount_point = decode_mount_field(mount_point);
        if (!seen_mount_points.insert(mount_point).second) {
            continue;
        }

        struct statvfs info{};
        if (::statvfs(mount_point.c_str(), &info) != 0 || info.f_blocks == 0) {
            continue;
        }
        const std::uintmax_t block = info.f_frsize ? info.f_frsize : info.f_bsize;
        DiskUsage usage;
        usage.device = decode_mount_field(device);
        usage.mount_point = mount_point;
        usage.total_bytes = static_cast<std::uintmax_t>(info.f_blocks) * block;
        usage.used_bytes = static_cast<std::uintmax_t>(info.f_blocks - info.f_bfree) * block;
        usage.available_bytes = static_cast<std::uintmax_t>(info.f_bavail) * block;
        disks.push_back(std::move(usage));
    }
    return disks;
}


std::vector<DirectoryUsage> HostMonitor::largest_directories(const fs::path& work_dir,
                                                             std::size_t limit) const
{
    std::vector<FileEntry> files;
    try {
        files = scanner.build(work_dir);
    } catch (const ErrorCodes::AppException& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Cannot measure directories under '{}': {}",
                         Utils::path_to_utf8(work_dir), ex.what());
        }
        return {};
    }

    std::map<fs::path, std::uintmax_t> totals;
    totals[work_dir] = 0;
    for (const auto& file : files) {
        totals[work_dir] += file.size_bytes;
        const fs::path relative = file.path.lexically_relative(work_dir);
        fs::path current = work_dir;
        for (const auto& component : relative.parent_path()) {
            current /= component;
            totals[current] += file.size_bytes;
        }
    }

    std::vector<DirectoryUsage> directories;
    directories.reserve(totals.size());
    for (const auto& [path, size] : totals) {
        directories.push_back(DirectoryUsage{path, size});
    }
    std::sort(directories.begin(), directories.end(),
              [](const DirectoryUsage& lhs, const DirectoryUsage& rhs) {
                  if (lhs.size_bytes != rhs.size_bytes) {
                      return lhs.size_bytes > rhs.size_bytes;
                  }
                  return lhs.path.native() < rhs.path.native();
              });
    if (directories.size() > limit) {
        directories.resize(limit);
    }
    return directories;
}


std::vector<ProcessUsage> HostMonitor::busiest_processes(std::size_t limit) const
{
    auto logger = Logger::get_logger("core_logger");
    const auto uptime = read_uptime_seconds();
    const long ticks_per_second = ::sysconf(_SC_CLK_TCK);
    if (!uptime || ticks_per_second <= 0) {
        if (logger) {
            logger->warn("Cannot read system uptime; process list unavailable");
        }
        return {};
    }
    const long page_size = ::sysconf(_SC_PAGESIZE);
    const auto mem_total = read_mem_total_bytes();
    const double hz = static_cast<double>(ticks_per_second);

    std::vector<ProcessUsage> processes;
    std::error_code ec;
    fs::directory_iterator it(proc_root_, ec);
    const fs::directory_iterator end;
    while (!ec && it != end) {
        const std::string name = Utils::path_to_utf8(it->path().filename());
        if (is_pid_name(name)) {
            std::ifstream stat_file(it->path() / "stat");
            std::string line;
            // Processes routinely exit between listing and reading
            if (stat_file.is_open() && std::getline(stat_file, line)) {
                if (const auto stat = parse_proc_stat(line)) {
                    ProcessUsage usage;
                    usage.pid = stat->pid;
                    usage.command = stat->command;
                    const double elapsed = *uptime - static_cast<double>(stat->start_ticks) / hz;
                    if (elapsed > 0.0) {
                        const double cpu_seconds =
                            static_cast<double>(stat->utime_ticks + stat->stime_ticks) / hz;
                        usage.cpu_percent = 100.0 * cpu_seconds / elapsed;
                    }
                    if (mem_total && *mem_total > 0 && page_size > 0 && stat->rss_pages > 0) {
                        const double rss_bytes = static_cast<double>(stat->rss_pages) * page_size;
                        usage.mem_percent = 100.0 * rss_bytes / static_cast<double>(*mem_total);
                    }
                    processes.push_back(std::move(usage));
                }
            }
        }
        it.increment(ec);
    }
    if (ec && logger) {
        logger->warn("Process list from '{}' is incomplete: {}",
                     Utils::path_to_utf8(proc_root_), ec.message());
    }

    std::sort(processes.begin(), processes.end(), [](const ProcessUsage& lhs, const ProcessUsage& rhs) {
        if (lhs.cpu_percent != rhs.cpu_percent) {
            return lhs.cpu_percent > rhs.cpu_percent;
        }
        return lhs.pid < rhs.pid;
    });
    if (processes.size() > limit) {
        processes.resize(limit);
    }
    return processes;
}


std::optional<ProcStat> HostMonitor::parse_proc_stat(const std::string& line)
{
    // pid (comm) state ppid ...; comm may itself contain spaces and parentheses
    const auto open = line.find('(');
    const auto close = line.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }

    ProcStat stat;
    std::string pid_text = line.substr(0, open);
    pid_text.erase(std::remove(pid_text.begin(), pid_text.end(), ' '), pid_text.end());
    if (!parse_number(pid_text, stat.pid)) {
        return std::nullopt;
    }
    stat.command = line.substr(open + 1, close - open - 1);

    std::istringstream rest(line.substr(close + 1));
    std::vector<std::string> fields;
    std::string field;
    while (rest >> field) {
        fields.push_back(field);
    }
    // fields[0] is field 3 of the stat line (state)
    constexpr std::size_t utime_index = 14 - 3;
    constexpr std::size_t stime_index = 15 - 3;
    constexpr std::size_t start_index = 22 - 3;
    constexpr std::size_t rss_index = 24 - 3;
    if (fields.size() <= rss_index) {
        return std::nullopt;
    }
    if (!parse_number(fields[utime_index], stat.utime_ticks)
        || !parse_number(fields[stime_index], stat.stime_ticks)
        || !parse_number(fields[start_index], stat.start_ticks)
        || !parse_number(fields[rss_index], stat.rss_pages)) {
        return std::nullopt;
    }
    return stat;
}


std::string HostMonitor::decode_mount_field(const std::string& field)
{
    // The mount table escapes space, tab, newline and backslash as \ooo
    std::string decoded;
    decoded.reserve(field.size());
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            int value = 0;
            bool octal = true;
            for (std::size_t k = 1; k <= 3; ++k) {
                const char digit = field[i + k];
                if (digit < '0' || digit > '7') {
                    octal = false;
                    break;
                }
                value = value * 8 + (digit - '0');
            }
            if (octal) {
                decoded.push_back(static_cast<char>(value));
                i += 3;
                continue;
            }
        }
        decoded.push_back(field[i]);
    }
    return decoded;
}


std::optional<double> HostMonitor::read_uptime_seconds() const
{
    std::ifstream uptime_file(proc_root_ / "uptime");
    double uptime = 0.0;
    if (!(uptime_file >> uptime)) {
        return std::nullopt;
    }
    return uptime;
}


std::optional<std::uint64_t> HostMonitor::read_mem_total_bytes() const
{
    std::ifstream meminfo(proc_root_ / "meminfo");
    std::string line;
    while (std::getline(meminfo, line)) {
        std::istringstream fields(line);
        std::string key;
        std::uint64_t kilobytes = 0;
        if ((fields >> key >> kilobytes) && key == "MemTotal:") {
            return kilobytes * 1024;
        }
    }
    return std::nullopt;
}
