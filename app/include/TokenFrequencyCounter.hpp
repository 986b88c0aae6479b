#ifndef TOKEN_FREQUENCY_COUNTER_HPP
#define TOKEN_FREQUENCY_COUNTER_HPP

#include "Types.hpp"

#include <istream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

/**
 * @brief Single-pass token counting and wc-style statistics over a text stream.
 *
 * A token is a maximal run of ASCII letters and digits, lower-cased. Every
 * other byte, including bytes of multi-byte UTF-8 sequences, separates tokens.
 * Ranking is by count descending; equal counts keep the order in which the
 * tokens first appeared. A non-positive top_n yields an empty ranking.
 */
class TokenFrequencyCounter {
public:
    static constexpr int kDefaultTop = 10;

    std::vector<TokenCount> count_top(std::istream& input, int top_n) const;

    TextReport analyze(std::istream& input, int top_n) const;

    static std::vector<std::string> tokenize(std::string_view text);

private:
    class Tally {
    public:
        void add(const std::string& token);
        std::vector<TokenCount> top(int top_n) const;

    private:
        std::unordered_map<std::string, std::size_t> index_;
        std::vector<TokenCount> counts_;
    };
};

#endif
