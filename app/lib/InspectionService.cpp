#include "InspectionService.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <numeric>
#include <system_error>

#include <sys/stat.h>

namespace {
ListingType listing_type_of(mode_t mode)
{
    if (S_ISREG(mode)) {
        return ListingType::File;
    }
    if (S_ISDIR(mode)) {
        return ListingType::Directory;
    }
    if (S_ISLNK(mode)) {
        return ListingType::Symlink;
    }
    return ListingType::Other;
}
}

InspectionService::InspectionService(FileScanner& scanner)
    : scanner(scanner)
{
}


InspectionReport InspectionService::inspect(const SelectionCriteria& criteria) const
{
    // Compile first so a malformed pattern fails before any file is touched
    std::optional<ContentFilter> content_filter;
    if (criteria.pattern && !criteria.pattern->empty()) {
        content_filter.emplace(*criteria.pattern);
    }

    const std::vector<FileEntry> all_files = scanner.build(criteria.root);
    const std::vector<FileEntry> selected =
        FileScanner::select(all_files, FileScanner::extension_predicate(criteria.extension));

    InspectionReport report;
    DirectorySummary& summary = report.summary;
    summary.root = criteria.root;
    summary.total_size_bytes = std::accumulate(
        all_files.begin(), all_files.end(), std::uintmax_t{0},
        [](std::uintmax_t total, const FileEntry& entry) { return total + entry.size_bytes; });
    summary.listing = list_directory(criteria.root, kListingPreviewLimit, summary.listing_total);

    if (content_filter) {
        report.pattern = content_filter->pattern();
        report.content = content_filter->filter(selected);
        summary.file_count = report.content->files_matched;
    } else {
        summary.file_count = selected.size();
        summary.largest_files = largest_files(selected, kLargestFilesLimit);
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Inspected '{}': {} file(s), {} selected, {} counted",
                      Utils::path_to_utf8(criteria.root), all_files.size(),
                      selected.size(), summary.file_count);
    }
    return report;
}


std::vector<ListingEntry> InspectionService::list_directory(const fs::path& root,
                                                            std::size_t limit,
                                                            std::size_t& total) const
{
    auto logger = Logger::get_logger("core_logger");
    std::vector<fs::path> children;
    std::error_code ec;
    fs::directory_iterator it(root, ec);
    const fs::directory_iterator end;
    while (!ec && it != end) {
        children.push_back(it->path());
        it.increment(ec);
    }
    if (ec && logger) {
        logger->warn("Directory listing of '{}' is incomplete: {}",
                     Utils::path_to_utf8(root), ec.message());
    }

    std::sort(children.begin(), children.end(), [](const fs::path& lhs, const fs::path& rhs) {
        return lhs.filename().native() < rhs.filename().native();
    });
    total = children.size();

    std::vector<ListingEntry> listing;
    for (const auto& child : children) {
        if (listing.size() >= limit) {
            break;
        }
        if (auto entry = describe(child)) {
            listing.push_back(std::move(*entry));
        } else if (logger) {
            logger->warn("Cannot stat '{}'", Utils::path_to_utf8(child));
        }
    }
    return listing;
}


std::vector<FileEntry> InspectionService::largest_files(std::vector<FileEntry> files,
                                                        std::size_t limit)
{
    const auto by_size = [](const FileEntry& lhs, const FileEntry& rhs) {
        if (lhs.size_bytes != rhs.size_bytes) {
            return lhs.size_bytes > rhs.size_bytes;
        }
        return lhs.path.native() < rhs.path.native();
    };
    const std::size_t count = std::min(limit, files.size());
    std::partial_sort(files.begin(), files.begin() + static_cast<std::ptrdiff_t>(count),
                      files.end(), by_size);
    files.resize(count);
    return files;
}


std::optional<ListingEntry> InspectionService::describe(const fs::path& path)
{
    struct stat info{};
    if (::lstat(path.c_str(), &info) != 0) {
        return std::nullopt;
    }

    ListingEntry entry;
    entry.name = Utils::path_to_utf8(path.filename());
    entry.type = listing_type_of(info.st_mode);
    entry.permissions = static_cast<fs::perms>(info.st_mode & 07777);
    entry.size_bytes = static_cast<std::uintmax_t>(info.st_size);
    entry.modified = info.st_mtime;
    if (entry.type == ListingType::Symlink) {
        std::error_code ec;
        const fs::path target = fs::read_symlink(path, ec);
        if (!ec) {
            entry.link_target = Utils::path_to_utf8(target);
        }
    }
    return entry;
}
