#ifndef INSPECTION_SERVICE_HPP
#define INSPECTION_SERVICE_HPP

#include "ContentFilter.hpp"
#include "FileScanner.hpp"
#include "Types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

struct InspectionReport {
    DirectorySummary summary;
    // Present only when a content pattern was requested
    std::optional<ContentFilterResult> content;
    std::optional<std::string> pattern;
};

/**
 * @brief Gathers everything `inspect` prints from a single walk of the tree.
 */
class InspectionService {
public:
    static constexpr std::size_t kListingPreviewLimit = 20;
    static constexpr std::size_t kLargestFilesLimit = 5;

    explicit InspectionService(FileScanner& scanner);

    InspectionReport inspect(const SelectionCriteria& criteria) const;

    /**
     * @brief Describe the direct children of @p root sorted by name, at most @p limit of them.
     * @param total Receives the number of children before truncation.
     */
    std::vector<ListingEntry> list_directory(const fs::path& root,
                                             std::size_t limit,
                                             std::size_t& total) const;

    // Largest first; equal sizes ordered by path ascending
    static std::vector<FileEntry> largest_files(std::vector<FileEntry> files, std::size_t limit);

    static std::optional<ListingEntry> describe(const fs::path& path);

private:
    FileScanner& scanner;
};

#endif
