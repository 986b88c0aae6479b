#ifndef ARCHIVER_HPP
#define ARCHIVER_HPP

#include "FileScanner.hpp"
#include "Types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct archive;

struct ArchiveSummary {
    std::filesystem::path destination;
    std::size_t stored{0};
    std::uintmax_t stored_bytes{0};
    // Files that disappeared or became unreadable before they could be stored
    std::vector<std::string> skipped;
};

/**
 * @brief Packs a PathSet into a gzip-compressed tar archive.
 *
 * Entries are named relative to the job's base directory. The archive is
 * written to a hidden staging file next to the destination and renamed into
 * place only once it is complete, so the destination is either untouched or
 * a finished archive. Failures throw ErrorCodes::AppException.
 */
class Archiver {
public:
    explicit Archiver(FileScanner& scanner);

    /**
     * @brief Validate @p root, enumerate it and build the job (the archive itself is excluded).
     */
    ArchiveJob prepare(const std::filesystem::path& root,
                       const std::filesystem::path& destination,
                       const std::optional<std::string>& extension = std::nullopt) const;

    ArchiveSummary archive(const ArchiveJob& job) const;

    ArchiveSummary backup(const std::filesystem::path& root,
                          const std::filesystem::path& destination,
                          const std::optional<std::string>& extension = std::nullopt) const;

    /**
     * @brief Name under which @p path is stored; throws PATH_ESCAPES_ROOT when it is not below @p base_dir.
     */
    static std::filesystem::path entry_name(const std::filesystem::path& path,
                                            const std::filesystem::path& base_dir);

    static std::filesystem::path staging_path_for(const std::filesystem::path& destination);

private:
    void validate(const ArchiveJob& job) const;
    void write_entry(struct archive* writer,
                     const FileEntry& entry,
                     const std::filesystem::path& name,
                     ArchiveSummary& summary) const;

    FileScanner& scanner;
};

#endif
