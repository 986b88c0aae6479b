#ifndef CLEANER_HPP
#define CLEANER_HPP

#include "FileScanner.hpp"
#include "Types.hpp"

#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Named set of file-name suffixes that mark a file as junk.
 */
class CleanupRules {
public:
    /**
     * @brief Throws AppException(VALIDATION_INVALID_ARGUMENT) on an empty suffix,
     * which would otherwise match every file.
     */
    explicit CleanupRules(std::vector<std::string> suffixes);

    // Temporary files, logs, editor backups (~) and .bak copies
    static const CleanupRules& defaults();

    bool matches(const std::string& file_name) const;
    NamePredicate as_predicate() const;

    const std::vector<std::string>& suffixes() const { return suffixes_; }

private:
    std::vector<std::string> suffixes_;
};

class Cleaner {
public:
    explicit Cleaner(FileScanner& scanner);

    CleanupResult clean(const std::filesystem::path& root,
                        const CleanupRules& rules,
                        bool dry_run) const;

    /**
     * @brief List what a sweep would remove. Never modifies the filesystem.
     */
    CleanupResult preview(const std::filesystem::path& root, const CleanupRules& rules) const;

    /**
     * @brief Remove every matched file, continuing past individual failures.
     */
    CleanupResult sweep(const std::filesystem::path& root, const CleanupRules& rules) const;

private:
    bool remove_entry(const FileEntry& entry, std::string& failure) const;

    FileScanner& scanner;
};

#endif
