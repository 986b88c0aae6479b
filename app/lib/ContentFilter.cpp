#include "ContentFilter.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <array>
#include <fstream>
#include <iterator>
#include <utility>

void ContentFilter::CompiledPatternDeleter::operator()(regex_t* compiled) const
{
    regfree(compiled);
    delete compiled;
}


// Stack use of regexec does not grow with the line length
ContentFilter::CompiledPatternPtr ContentFilter::compile(const std::string& pattern)
{
    auto compiled = std::make_unique<regex_t>();
    const int status = regcomp(compiled.get(), pattern.c_str(), REG_NOSUB);
    if (status != 0) {
        std::array<char, 256> reason{};
        regerror(status, compiled.get(), reason.data(), reason.size());
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("Rejected pattern '{}': {}", pattern, reason.data());
        }
        THROW_APP_ERROR(ErrorCodes::Code::USAGE_INVALID_PATTERN, pattern);
    }
    return CompiledPatternPtr(compiled.release());
}


ContentFilter::ContentFilter(std::string pattern)
    : pattern_(std::move(pattern)),
      compiled_(compile(pattern_))
{
}


bool ContentFilter::matches_line(const std::string& line) const
{
    return regexec(compiled_.get(), line.c_str(), 0, nullptr, 0) == 0;
}


ContentFilterResult ContentFilter::filter(const std::vector<FileEntry>& entries) const
{
    auto logger = Logger::get_logger("core_logger");
    ContentFilterResult result;

    for (const auto& entry : entries) {
        const std::string label = Utils::path_to_utf8(entry.path);
        std::vector<MatchResult> file_matches;

        switch (search_file(entry.path, file_matches)) {
            case FileOutcome::Searched:
                if (!file_matches.empty()) {
                    ++result.files_matched;
                    result.matches.insert(result.matches.end(),
                                          std::make_move_iterator(file_matches.begin()),
                                          std::make_move_iterator(file_matches.end()));
                }
                break;
            case FileOutcome::Unreadable:
                result.skipped.push_back(fmt::format("Cannot read '{}'", label));
                if (logger) {
                    logger->warn("Skipping unreadable file '{}'", label);
                }
                break;
            case FileOutcome::Binary:
                result.skipped.push_back(fmt::format("Binary file '{}' not searched", label));
                if (logger) {
                    logger->warn("Skipping binary file '{}'", label);
                }
                break;
        }
    }

    if (logger) {
        logger->debug("Pattern '{}' matched {} line(s) in {} of {} file(s)",
                      pattern_, result.matches.size(), result.files_matched, entries.size());
    }
    return result;
}


ContentFilter::FileOutcome ContentFilter::search_file(const std::filesystem::path& path,
                                                      std::vector<MatchResult>& matches) const
{
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return FileOutcome::Unreadable;
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (line.find('\0') != std::string::npos) {
            matches.clear();
            return FileOutcome::Binary;
        }
        if (matches_line(line)) {
            matches.push_back(MatchResult{path, line_number, line});
        }
    }

    if (input.bad()) {
        matches.clear();
        return FileOutcome::Unreadable;
    }
    return FileOutcome::Searched;
}
