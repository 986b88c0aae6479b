#ifndef FILE_SCANNER_HPP
#define FILE_SCANNER_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"

namespace fs = std::filesystem;

// Predicate evaluated against a file name (not the full path)
using NamePredicate = std::function<bool(const std::string& file_name)>;

class FileScanner {
public:
    FileScanner() = default;

    /**
     * @brief Collect every regular file below @p root, sorted by path string.
     *
     * Symbolic links are neither followed nor returned. When @p extension is
     * set and non-empty, only files whose name ends with it are kept.
     * Throws AppException(DIRECTORY_INVALID) when @p root is not a directory.
     */
    std::vector<FileEntry> build(const fs::path& root,
                                 const std::optional<std::string>& extension = std::nullopt) const;

    std::vector<FileEntry> build_matching(const fs::path& root,
                                          const NamePredicate& predicate) const;

    static NamePredicate extension_predicate(const std::optional<std::string>& extension);

    // Keeps the entries of an existing PathSet accepted by @p predicate
    static std::vector<FileEntry> select(const std::vector<FileEntry>& entries,
                                         const NamePredicate& predicate);

    static void sort_by_path(std::vector<FileEntry>& entries);

private:
    struct ScanContext;
    void scan_directory(const fs::path& directory,
                        ScanContext& context,
                        std::vector<FileEntry>& entries) const;
    std::optional<FileEntry> build_entry(const fs::directory_entry& entry,
                                         ScanContext& context) const;
};

#endif
