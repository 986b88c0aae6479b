#include "Reporter.hpp"
#include "ErrorMessages.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <array>
#include <utility>

namespace fs = std::filesystem;

namespace {
char type_char(ListingType type)
{
    switch (type) {
        case ListingType::Directory:
            return 'd';
        case ListingType::Symlink:
            return 'l';
        case ListingType::File:
            return '-';
        case ListingType::Other:
        default:
            return '?';
    }
}

bool has_bit(fs::perms permissions, fs::perms bit)
{
    return (permissions & bit) != fs::perms::none;
}
}

Reporter::Reporter(std::ostream& out)
    : out(out)
{
}


void Reporter::render_inspection(const InspectionReport& report)
{
    render_directory_summary(report.summary, !report.content.has_value());
    if (report.content) {
        render_matches(report.content->matches, report.pattern.value_or(std::string()));
    }
}


void Reporter::render_directory_summary(const DirectorySummary& summary, bool show_largest)
{
    out << fmt::format(fmt::runtime(_("Directory: {}")), Utils::path_to_utf8(summary.root)) << '\n';
    out << fmt::format(fmt::runtime(_("Total size: {}")), Utils::format_size(summary.total_size_bytes)) << '\n';

    if (summary.listing_total > summary.listing.size()) {
        out << fmt::format(fmt::runtime(_("Contents (first {} of {}):")),
                           summary.listing.size(), summary.listing_total) << '\n';
    } else {
        out << _("Contents:") << '\n';
    }
    for (const auto& entry : summary.listing) {
        out << "  " << format_listing_line(entry) << '\n';
    }

    out << fmt::format(fmt::runtime(_("Matching files: {}")), summary.file_count) << '\n';

    if (!show_largest) {
        return;
    }
    out << fmt::format(fmt::runtime(_("Top {} files by size:")), summary.largest_files.size()) << '\n';
    for (const auto& file : summary.largest_files) {
        out << fmt::format("  {:>6}  {}", Utils::format_size(file.size_bytes),
                           Utils::path_to_utf8(file.path)) << '\n';
    }
}


void Reporter::render_matches(const std::vector<MatchResult>& matches, const std::string& pattern)
{
    if (matches.empty()) {
        out << fmt::format(fmt::runtime(MSG_NO_MATCHES), pattern) << '\n';
        return;
    }
    for (const auto& match : matches) {
        out << Utils::path_to_utf8(match.path) << ':' << match.line_number << ':'
            << match.line_text << '\n';
    }
}


void Reporter::render_archive(const ArchiveSummary& summary)
{
    out << fmt::format(fmt::runtime(_("Archive created: {} ({} file(s), {})")),
                       Utils::path_to_utf8(summary.destination), summary.stored,
                       Utils::format_size(summary.stored_bytes)) << '\n';
    for (const auto& skipped : summary.skipped) {
        out << fmt::format(fmt::runtime(_("  skipped: {}")), skipped) << '\n';
    }
}


void Reporter::render_cleanup(const CleanupResult& result)
{
    if (result.matched.empty()) {
        out << MSG_NOTHING_TO_CLEAN << '\n';
        return;
    }

    out << (result.dry_run ? _("Dry run, these files would be removed:")
                           : _("Removing temporary files:")) << '\n';
    for (const auto& entry : result.matched) {
        out << "  " << Utils::path_to_utf8(entry.path) << '\n';
    }
    if (result.dry_run) {
        out << fmt::format(fmt::runtime(_("{} file(s) would be removed.")), result.matched.size()) << '\n';
        return;
    }

    for (const auto& failure : result.failures) {
        out << fmt::format(fmt::runtime(_("  failed: {}")), failure) << '\n';
    }
    out << fmt::format(fmt::runtime(_("Removed {} of {} file(s).")),
                       result.removed, result.matched.size()) << '\n';
}


void Reporter::render_text_report(const fs::path& source, const TextReport& report)
{
    out << fmt::format(fmt::runtime(_("Statistics for '{}'")), Utils::path_to_utf8(source)) << '\n';
    out << fmt::format(fmt::runtime(_("Lines: {}")), report.lines) << '\n';
    out << fmt::format(fmt::runtime(_("Words: {}")), report.words) << '\n';
    out << fmt::format(fmt::runtime(_("Bytes: {}")), report.bytes) << '\n';

    if (report.top_tokens.empty()) {
        return;
    }
    out << fmt::format(fmt::runtime(_("Top {} tokens:")), report.top_tokens.size()) << '\n';
    for (const auto& token : report.top_tokens) {
        out << fmt::format("{:>7} {}", token.count, token.token) << '\n';
    }
}


void Reporter::render_host_snapshot(const HostSnapshot& snapshot)
{
    out << fmt::format(fmt::runtime(_("Date: {}")),
                       Utils::format_timestamp(snapshot.taken_at, "%a %d %b %Y %H:%M:%S %Z")) << '\n';
    out << fmt::format(fmt::runtime(_("Host: {}")), snapshot.host_name) << '\n';
    out << fmt::format(fmt::runtime(_("Kernel: {}")), snapshot.kernel) << '\n';

    out << _("Disks:") << '\n';
    if (!snapshot.disks.empty()) {
        out << fmt::format("  {:<20} {:>6} {:>6} {:>6} {:>4}  {}", _("Filesystem"), _("Size"),
                           _("Used"), _("Avail"), _("Use%"), _("Mounted on")) << '\n';
    }
    for (const auto& disk : snapshot.disks) {
        out << fmt::format("  {:<20} {:>6} {:>6} {:>6} {:>3}%  {}", disk.device,
                           Utils::format_size(disk.total_bytes),
                           Utils::format_size(disk.used_bytes),
                           Utils::format_size(disk.available_bytes),
                           disk.used_percent(), disk.mount_point) << '\n';
    }

    out << _("Largest directories:") << '\n';
    for (const auto& directory : snapshot.largest_directories) {
        out << fmt::format("  {:>6}  {}", Utils::format_size(directory.size_bytes),
                           Utils::path_to_utf8(directory.path)) << '\n';
    }

    out << _("Busiest processes:") << '\n';
    if (!snapshot.busiest_processes.empty()) {
        out << fmt::format("  {:>7} {:<16} {:>5} {:>5}", _("PID"), _("COMMAND"), _("%CPU"), _("%MEM")) << '\n';
    }
    for (const auto& process : snapshot.busiest_processes) {
        out << fmt::format("  {:>7} {:<16} {:>5.1f} {:>5.1f}", process.pid, process.command,
                           process.cpu_percent, process.mem_percent) << '\n';
    }
}


std::string Reporter::format_listing_line(const ListingEntry& entry)
{
    std::string line = fmt::format("{} {:>6} {} {}",
                                   format_permissions(entry.type, entry.permissions),
                                   Utils::format_size(entry.size_bytes),
                                   Utils::format_timestamp(entry.modified),
                                   entry.name);
    if (entry.type == ListingType::Symlink && !entry.link_target.empty()) {
        line += " -> " + entry.link_target;
    }
    return line;
}


std::string Reporter::format_permissions(ListingType type, fs::perms permissions)
{
    static constexpr std::array<std::pair<fs::perms, char>, 9> bits = {{
        {fs::perms::owner_read, 'r'}, {fs::perms::owner_write, 'w'}, {fs::perms::owner_exec, 'x'},
        {fs::perms::group_read, 'r'}, {fs::perms::group_write, 'w'}, {fs::perms::group_exec, 'x'},
        {fs::perms::others_read, 'r'}, {fs::perms::others_write, 'w'}, {fs::perms::others_exec, 'x'},
    }};

    std::string text(1, type_char(type));
    for (const auto& [bit, symbol] : bits) {
        text.push_back(has_bit(permissions, bit) ? symbol : '-');
    }
    if (has_bit(permissions, fs::perms::sticky_bit)) {
        text.back() = has_bit(permissions, fs::perms::others_exec) ? 't' : 'T';
    }
    return text;
}
