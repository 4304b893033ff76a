#pragma once
#include <vector>
#include <tuple>
#include <string_view>
#include <string>
#include <cstdint>

namespace rkrGST {

/**
 * @brief A common substring tile between a pattern and a text.
 *
 * pattern[pattern_index, pattern_index + length) equals
 * text[text_index, text_index + length). Matches compare by value,
 * ordered by (pattern_index, text_index, length).
 */
struct Match {
    uint64_t pattern_index;  /**< Offset of the tile in the pattern */
    uint64_t text_index;     /**< Offset of the tile in the text */
    uint64_t length;         /**< Number of tokens covered on each side */
};

inline bool operator==(const Match& a, const Match& b) {
    return a.pattern_index == b.pattern_index && a.text_index == b.text_index && a.length == b.length;
}

inline bool operator!=(const Match& a, const Match& b) {
    return !(a == b);
}

inline bool operator<(const Match& a, const Match& b) {
    return std::tie(a.pattern_index, a.text_index, a.length) <
           std::tie(b.pattern_index, b.text_index, b.length);
}

// Core tiling functions

/**
 * @brief Tiles two byte sequences with maximal non-overlapping common substrings.
 *
 * Runs Running Karp-Rabin Greedy String Tiling: passes with a shrinking search
 * length collect common substrings through a rolling Adler-32 index of the
 * text, and each pass greedily accepts the longest candidates whose spans are
 * still unmarked on both sides.
 *
 * @param pattern First sequence
 * @param text Second sequence
 * @param initial_search_length Search length of the first pass (> 0)
 * @param minimum_match_length Shortest tile that can be reported (> 0, <= initial_search_length)
 * @return Accepted tiles, in the order they were accepted
 *
 * @throws std::invalid_argument If a length is zero or the minimum exceeds the initial length
 * @note Pattern spans are pairwise disjoint, and so are text spans
 */
std::vector<Match> tile(std::string_view pattern, std::string_view text,
                        size_t initial_search_length, size_t minimum_match_length);

/**
 * @brief Tiles two sequences of integer tokens.
 *
 * Same algorithm as tile(), for callers that tokenize their input (source
 * code, words) before comparing it.
 *
 * @see tile()
 */
std::vector<Match> tile_tokens(const std::vector<uint32_t>& pattern, const std::vector<uint32_t>& text,
                               size_t initial_search_length, size_t minimum_match_length);

// Summary functions

/**
 * @brief Counts the tiles between two byte sequences without storing them.
 *
 * @see tile()
 */
size_t count_tiles(std::string_view pattern, std::string_view text,
                   size_t initial_search_length, size_t minimum_match_length);

/**
 * @brief Total length of all tiles between two byte sequences.
 *
 * This is the number of pattern positions (equivalently text positions)
 * covered by the tiling.
 *
 * @see tile()
 */
size_t tiled_length(std::string_view pattern, std::string_view text,
                    size_t initial_search_length, size_t minimum_match_length);

}
