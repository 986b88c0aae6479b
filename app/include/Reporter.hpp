#ifndef REPORTER_HPP
#define REPORTER_HPP

#include "Archiver.hpp"
#include "HostMonitor.hpp"
#include "InspectionService.hpp"
#include "Types.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

/**
 * @brief Renders command results as plain text.
 *
 * The reporter only formats; it never inspects the filesystem itself.
 */
class Reporter {
public:
    explicit Reporter(std::ostream& out);

    void render_inspection(const InspectionReport& report);
    void render_directory_summary(const DirectorySummary& summary, bool show_largest);
    void render_matches(const std::vector<MatchResult>& matches, const std::string& pattern);
    void render_archive(const ArchiveSummary& summary);
    void render_cleanup(const CleanupResult& result);
    void render_text_report(const std::filesystem::path& source, const TextReport& report);
    void render_host_snapshot(const HostSnapshot& snapshot);

    /**
     * @brief One `ls -la` style line: mode string, size, mtime, name and symlink target.
     */
    static std::string format_listing_line(const ListingEntry& entry);

    static std::string format_permissions(ListingType type, std::filesystem::perms permissions);

private:
    std::ostream& out;
};

#endif
