#include "TokenFrequencyCounter.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <array>

namespace {
constexpr std::size_t kReadChunkSize = 64 * 1024;

// Classification and folding are ASCII only, whatever LC_CTYPE says
bool is_token_byte(unsigned char ch)
{
    return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

bool is_space_byte(unsigned char ch)
{
    return ch == ' ' || (ch >= '\t' && ch <= '\r');
}

char fold(unsigned char ch)
{
    return static_cast<char>(ch >= 'A' && ch <= 'Z' ? ch + ('a' - 'A') : ch);
}
}


void TokenFrequencyCounter::Tally::add(const std::string& token)
{
    const auto [it, inserted] = index_.try_emplace(token, counts_.size());
    if (inserted) {
        counts_.push_back(TokenCount{token, 1});
    } else {
        ++counts_[it->second].count;
    }
}


std::vector<TokenCount> TokenFrequencyCounter::Tally::top(int top_n) const
{
    if (top_n <= 0) {
        return {};
    }
    // counts_ is in first-seen order; a stable sort keeps it among equal counts
    std::vector<TokenCount> ranked = counts_;
    std::stable_sort(ranked.begin(), ranked.end(), [](const TokenCount& lhs, const TokenCount& rhs) {
        return lhs.count > rhs.count;
    });
    if (ranked.size() > static_cast<std::size_t>(top_n)) {
        ranked.resize(static_cast<std::size_t>(top_n));
    }
    return ranked;
}


std::vector<TokenCount> TokenFrequencyCounter::count_top(std::istream& input, int top_n) const
{
    return analyze(input, top_n).top_tokens;
}


TextReport TokenFrequencyCounter::analyze(std::istream& input, int top_n) const
{
    TextReport report;
    Tally tally;
    std::string token;
    bool in_word = false;

    std::array<char, kReadChunkSize> buffer{};
    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto count = static_cast<std::size_t>(input.gcount());
        report.bytes += count;

        for (std::size_t i = 0; i < count; ++i) {
            const auto ch = static_cast<unsigned char>(buffer[i]);
            if (ch == '\n') {
                ++report.lines;
            }

            if (is_space_byte(ch)) {
                in_word = false;
            } else if (!in_word) {
                in_word = true;
                ++report.words;
            }

            if (is_token_byte(ch)) {
                token.push_back(fold(ch));
            } else if (!token.empty()) {
                tally.add(token);
                token.clear();
            }
        }
    }
    if (!token.empty()) {
        tally.add(token);
    }

    report.top_tokens = tally.top(top_n);

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Analyzed {} byte(s): {} line(s), {} word(s), {} ranked token(s)",
                      report.bytes, report.lines, report.words, report.top_tokens.size());
    }
    return report;
}


std::vector<std::string> TokenFrequencyCounter::tokenize(std::string_view text)
{
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char ch : text) {
        if (is_token_byte(ch)) {
            current.push_back(fold(ch));
        } else if (!current.empty()) {
            tokens.emplace_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.emplace_back(std::move(current));
    }
    return tokens;
}
