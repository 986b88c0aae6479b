#ifndef CONTENT_FILTER_HPP
#define CONTENT_FILTER_HPP

#include "Types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <regex.h>

struct ContentFilterResult {
    std::vector<MatchResult> matches;
    std::size_t files_matched{0};
    /**
     * @brief One warning per file that could not be searched (unreadable or binary).
     */
    std::vector<std::string> skipped;

    bool empty() const { return matches.empty(); }
};

/**
 * @brief Line-oriented content search over a PathSet.
 *
 * The pattern is a POSIX basic regular expression, the dialect plain grep
 * uses, searched anywhere in each line. A pattern without metacharacters is
 * therefore a substring search.
 */
class ContentFilter {
public:
    /**
     * @brief Compile @p pattern; throws AppException(USAGE_INVALID_PATTERN) when it is malformed.
     */
    explicit ContentFilter(std::string pattern);

    ContentFilterResult filter(const std::vector<FileEntry>& entries) const;

    bool matches_line(const std::string& line) const;

    const std::string& pattern() const { return pattern_; }

private:
    enum class FileOutcome {Searched, Unreadable, Binary};

    FileOutcome search_file(const std::filesystem::path& path,
                            std::vector<MatchResult>& matches) const;

    struct CompiledPatternDeleter {
        void operator()(regex_t* compiled) const;
    };
    using CompiledPatternPtr = std::unique_ptr<regex_t, CompiledPatternDeleter>;

    static CompiledPatternPtr compile(const std::string& pattern);

    std::string pattern_;
    CompiledPatternPtr compiled_;
};

#endif
