#include "FileScanner.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <filesystem>
#include <iterator>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

struct FileScanner::ScanContext {
    NamePredicate predicate;
    std::vector<fs::path> pending_directories;
    std::size_t skipped{0};
    std::shared_ptr<spdlog::logger> logger;
};

std::vector<FileEntry>
FileScanner::build(const fs::path& root, const std::optional<std::string>& extension) const
{
    return build_matching(root, extension_predicate(extension));
}


std::vector<FileEntry>
FileScanner::build_matching(const fs::path& root, const NamePredicate& predicate) const
{
    auto logger = Logger::get_logger("core_logger");
    const std::string root_label = Utils::path_to_utf8(root);

    if (!Utils::is_valid_directory(root)) {
        if (logger) {
            logger->debug("Refusing to scan '{}': not a directory", root_label);
        }
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_INVALID, root_label);
    }

    ScanContext context;
    context.predicate = predicate;
    context.pending_directories.push_back(root);
    context.logger = logger;

    std::vector<FileEntry> entries;
    while (!context.pending_directories.empty()) {
        const fs::path directory = std::move(context.pending_directories.back());
        context.pending_directories.pop_back();
        scan_directory(directory, context, entries);
    }

    sort_by_path(entries);

    if (logger) {
        logger->debug("Scan of '{}' complete: {} file(s) selected, {} entr(ies) skipped",
                      root_label, entries.size(), context.skipped);
    }
    return entries;
}


NamePredicate FileScanner::extension_predicate(const std::optional<std::string>& extension)
{
    if (!extension || extension->empty()) {
        return [](const std::string&) { return true; };
    }
    return [suffix = *extension](const std::string& file_name) {
        return Utils::has_suffix(file_name, suffix);
    };
}


std::vector<FileEntry> FileScanner::select(const std::vector<FileEntry>& entries,
                                           const NamePredicate& predicate)
{
    std::vector<FileEntry> selected;
    selected.reserve(entries.size());
    std::copy_if(entries.begin(), entries.end(), std::back_inserter(selected),
                 [&predicate](const FileEntry& entry) {
                     return predicate(Utils::path_to_utf8(entry.path.filename()));
                 });
    return selected;
}


void FileScanner::sort_by_path(std::vector<FileEntry>& entries)
{
    std::sort(entries.begin(), entries.end(), [](const FileEntry& lhs, const FileEntry& rhs) {
        return lhs.path.native() < rhs.path.native();
    });
}


void FileScanner::scan_directory(const fs::path& directory,
                                 ScanContext& context,
                                 std::vector<FileEntry>& entries) const
{
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        ++context.skipped;
        if (context.logger) {
            context.logger->warn("Cannot open directory '{}': {}",
                                 Utils::path_to_utf8(directory), ec.message());
        }
        return;
    }

    const fs::directory_iterator end;
    while (it != end) {
        if (auto entry = build_entry(*it, context)) {
            entries.push_back(std::move(*entry));
        }
        it.increment(ec);
        if (ec) {
            ++context.skipped;
            if (context.logger) {
                context.logger->warn("Stopped reading directory '{}': {}",
                                     Utils::path_to_utf8(directory), ec.message());
            }
            return;
        }
    }
}


std::optional<FileEntry> FileScanner::build_entry(const fs::directory_entry& entry,
                                                  ScanContext& context) const
{
    const fs::path& entry_path = entry.path();
    std::error_code ec;
    const fs::file_status status = entry.symlink_status(ec);
    if (ec) {
        ++context.skipped;
        if (context.logger) {
            context.logger->warn("Cannot read status of '{}': {}",
                                 Utils::path_to_utf8(entry_path), ec.message());
        }
        return std::nullopt;
    }

    if (fs::is_symlink(status)) {
        if (context.logger) {
            context.logger->trace("Skipping symbolic link '{}'", Utils::path_to_utf8(entry_path));
        }
        return std::nullopt;
    }
    if (fs::is_directory(status)) {
        context.pending_directories.push_back(entry_path);
        return std::nullopt;
    }
    if (!fs::is_regular_file(status)) {
        return std::nullopt;
    }

    if (!context.predicate(Utils::path_to_utf8(entry_path.filename()))) {
        return std::nullopt;
    }

    const std::uintmax_t size = entry.file_size(ec);
    if (ec) {
        // Removed between listing and stat
        ++context.skipped;
        if (context.logger) {
            context.logger->warn("Cannot read size of '{}': {}",
                                 Utils::path_to_utf8(entry_path), ec.message());
        }
        return std::nullopt;
    }
    return FileEntry{entry_path, size};
}
