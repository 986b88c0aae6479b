#include "Cleaner.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "TestHooks.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <system_error>

CleanupRules::CleanupRules(std::vector<std::string> suffixes)
    : suffixes_(std::move(suffixes))
{
    const bool has_empty = std::any_of(suffixes_.begin(), suffixes_.end(),
                                       [](const std::string& suffix) { return suffix.empty(); });
    if (has_empty) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_ARGUMENT,
                            "Cleanup suffixes must not be empty", "CleanupRules");
    }
}


const CleanupRules& CleanupRules::defaults()
{
    static const CleanupRules rules({".tmp", ".log", "~", ".bak"});
    return rules;
}


bool CleanupRules::matches(const std::string& file_name) const
{
    return std::any_of(suffixes_.begin(), suffixes_.end(), [&file_name](const std::string& suffix) {
        return Utils::has_suffix(file_name, suffix);
    });
}


NamePredicate CleanupRules::as_predicate() const
{
    return [rules = *this](const std::string& file_name) { return rules.matches(file_name); };
}


Cleaner::Cleaner(FileScanner& scanner)
    : scanner(scanner)
{
}


CleanupResult Cleaner::clean(const std::filesystem::path& root,
                             const CleanupRules& rules,
                             bool dry_run) const
{
    if (dry_run) {
        return preview(root, rules);
    }
    return sweep(root, rules);
}


CleanupResult Cleaner::preview(const std::filesystem::path& root, const CleanupRules& rules) const
{
    CleanupResult result;
    result.dry_run = true;
    result.matched = scanner.build_matching(root, rules.as_predicate());

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Dry run over '{}': {} file(s) would be removed",
                      Utils::path_to_utf8(root), result.matched.size());
    }
    return result;
}


CleanupResult Cleaner::sweep(const std::filesystem::path& root, const CleanupRules& rules) const
{
    auto logger = Logger::get_logger("core_logger");
    CleanupResult result;
    result.dry_run = false;
    // Enumerate completely before the first removal
    result.matched = scanner.build_matching(root, rules.as_predicate());

    for (const auto& entry : result.matched) {
        std::string failure;
        if (remove_entry(entry, failure)) {
            ++result.removed;
            continue;
        }
        if (logger) {
            logger->warn("Could not delete '{}': {}", Utils::path_to_utf8(entry.path), failure);
        }
        result.failures.push_back(fmt::format("{}: {}", Utils::path_to_utf8(entry.path), failure));
    }

    if (logger) {
        logger->debug("Cleanup of '{}': {} removed, {} failed",
                      Utils::path_to_utf8(root), result.removed, result.failures.size());
    }
    return result;
}


bool Cleaner::remove_entry(const FileEntry& entry, std::string& failure) const
{
    std::error_code ec;
    const bool removed = TestHooks::remove_file(entry.path, ec);
    if (ec) {
        failure = ec.message();
        return false;
    }
    if (!removed) {
        failure = "file no longer exists";
        return false;
    }
    return true;
}
