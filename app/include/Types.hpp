#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct SelectionCriteria {
    std::filesystem::path root;
    std::optional<std::string> extension;
    std::optional<std::string> pattern;
};

struct FileEntry {
    std::filesystem::path path;
    std::uintmax_t size_bytes{0};
};

inline bool operator==(const FileEntry& lhs, const FileEntry& rhs) {
    return lhs.path == rhs.path && lhs.size_bytes == rhs.size_bytes;
}

struct MatchResult {
    std::filesystem::path path;
    std::size_t line_number{1};
    std::string line_text;
};

struct ArchiveJob {
    std::vector<FileEntry> entries;
    std::filesystem::path destination;
    std::filesystem::path base_dir;
};

struct TokenCount {
    std::string token;
    std::size_t count{1};
};

inline bool operator==(const TokenCount& lhs, const TokenCount& rhs) {
    return lhs.token == rhs.token && lhs.count == rhs.count;
}

struct TextReport {
    std::uintmax_t lines{0};
    std::uintmax_t words{0};
    std::uintmax_t bytes{0};
    std::vector<TokenCount> top_tokens;
};

enum class ListingType {File, Directory, Symlink, Other};

/**
 * @brief One line of the directory preview shown by `inspect`.
 */
struct ListingEntry {
    std::string name;
    ListingType type{ListingType::Other};
    std::filesystem::perms permissions{std::filesystem::perms::none};
    std::uintmax_t size_bytes{0};
    std::time_t modified{0};
    std::string link_target;
};

struct DirectorySummary {
    std::filesystem::path root;
    std::uintmax_t total_size_bytes{0};
    std::vector<ListingEntry> listing;
    std::size_t listing_total{0};
    std::size_t file_count{0};
    std::vector<FileEntry> largest_files;
};

struct CleanupResult {
    bool dry_run{true};
    std::vector<FileEntry> matched;
    std::size_t removed{0};
    std::vector<std::string> failures;
};

#endif
