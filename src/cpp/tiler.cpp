#include "tiler.hpp"
#include "rolling_hash.hpp"
#include <sdsl/bit_vectors.hpp>
#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace rkrGST {

/// Rolling hash of a window -> start offsets of the text windows with that hash.
using hash_index_t = std::unordered_map<uint32_t, std::vector<size_t>>;

static uint32_t token_value(char c) { return static_cast<unsigned char>(c); }
static uint32_t token_value(uint32_t t) { return t; }

/**
 * @brief Tests k > 2 * s without overflowing.
 */
static bool exceeds_twice(size_t k, size_t s) {
    return k > s && k - s > s;
}

/**
 * @brief Mutable state of one tiling run.
 *
 * The sequences are borrowed; the mark bitmaps and the candidate buffer
 * belong to the run. A set mark bit is never cleared.
 */
template<class Token>
struct TilingState {
    const Token* pattern;
    size_t pattern_len;
    const Token* text;
    size_t text_len;
    sdsl::bit_vector pattern_mark;
    sdsl::bit_vector text_mark;
    std::vector<Match> matches;  // candidates of the current pass
};

/**
 * @brief Visits every unmarked window of width s with its rolling checksum.
 *
 * Windows never contain a marked position: the walk jumps past the last
 * marked position of a window, hashes the first window of the unmarked run
 * from scratch and then rolls the checksum until the token entering the
 * window is marked.
 *
 * @param seq Sequence to walk
 * @param n Length of the sequence
 * @param mark Mark bitmap of the sequence
 * @param s Window width
 * @param visit Called as visit(start, hash); returning false stops the walk
 * @return false if visit stopped the walk, true if every window was visited
 */
template<class Token, class Visit>
static bool for_each_unmarked_window(const Token* seq, size_t n, const sdsl::bit_vector& mark,
                                     size_t s, Visit&& visit) {
    if (s > n) return true;
    const size_t last_start = n - s;

    size_t i = 0;
    while (i <= last_start) {
        size_t j = i + s;
        bool marked = false;
        while (j > i) {
            --j;
            if (mark[j]) { marked = true; break; }
        }
        if (marked) {
            i = j + 1;
            continue;
        }

        auto hash = RollingAdler32::of_window(seq + i, s);
        while (true) {
            if (!visit(i, hash.hash())) return false;
            ++i;
            if (i > last_start || mark[i + s - 1]) break;
            hash.remove(s, token_value(seq[i - 1]));
            hash.update(token_value(seq[i + s - 1]));
        }
    }
    return true;
}

/**
 * @brief Indexes the unmarked text windows of width s by their rolling hash.
 *
 * Offsets are stored in increasing order within each bucket.
 */
template<class Token>
static hash_index_t build_text_index(const TilingState<Token>& st, size_t s) {
    hash_index_t index;
    for_each_unmarked_window(st.text, st.text_len, st.text_mark, s, [&](size_t i, uint32_t h) {
        index[h].push_back(i);
        return true;
    });
    return index;
}

/**
 * @brief Length of the common unmarked run starting at the given offsets.
 */
template<class Token>
static size_t common_extension(const TilingState<Token>& st, size_t pattern_index, size_t text_index) {
    size_t k = 0;
    while (pattern_index + k < st.pattern_len
           && text_index + k < st.text_len
           && st.pattern[pattern_index + k] == st.text[text_index + k]
           && !st.text_mark[text_index + k]
           && !st.pattern_mark[pattern_index + k]) {
        ++k;
    }
    return k;
}

/**
 * @brief One scan pass: collects all common substrings of length >= s.
 *
 * Every pattern window whose hash hits the text index is verified token by
 * token against each text offset in the bucket and extended forward as far
 * as the tokens agree and both sides are unmarked. Extensions of at least s
 * become candidates in st.matches.
 *
 * @return The longest candidate length (0 if none). If some extension is
 *         longer than 2 * s the pass stops there, the candidates are dropped
 *         and that extension length is returned instead.
 */
template<class Token>
static size_t scan_pattern(TilingState<Token>& st, size_t s) {
    const hash_index_t index = build_text_index(st, s);

    st.matches.clear();
    size_t max_match = 0;
    size_t long_match = 0;
    bool complete = for_each_unmarked_window(st.pattern, st.pattern_len, st.pattern_mark, s,
        [&](size_t pattern_index, uint32_t h) {
            auto bucket = index.find(h);
            if (bucket == index.end()) return true;
            for (size_t text_index : bucket->second) {
                size_t k = common_extension(st, pattern_index, text_index);
                if (exceeds_twice(k, s)) {
                    long_match = k;
                    return false;
                }
                if (k >= s) {
                    st.matches.push_back({static_cast<uint64_t>(pattern_index),
                                          static_cast<uint64_t>(text_index),
                                          static_cast<uint64_t>(k)});
                    max_match = std::max(max_match, k);
                }
            }
            return true;
        });

    if (!complete) {
        st.matches.clear();
        return long_match;
    }
    return max_match;
}

static bool span_unmarked(const sdsl::bit_vector& mark, uint64_t start, uint64_t length) {
    for (uint64_t i = start; i < start + length; ++i) {
        if (mark[i]) return false;
    }
    return true;
}

static void mark_span(sdsl::bit_vector& mark, uint64_t start, uint64_t length) {
    for (uint64_t i = start; i < start + length; ++i) mark[i] = 1;
}

/**
 * @brief Greedily turns the candidates of the last pass into tiles.
 *
 * Candidates are taken longest first; equal lengths keep their discovery
 * order. A candidate is accepted only if its whole span is unmarked in both
 * sequences, in which case both spans are marked and the match is emitted.
 *
 * @return Number of accepted tiles
 */
template<class Token, class Sink>
static size_t mark_tiles(TilingState<Token>& st, Sink& sink) {
    std::stable_sort(st.matches.begin(), st.matches.end(),
                     [](const Match& a, const Match& b) { return a.length > b.length; });

    size_t accepted = 0;
    for (const Match& m : st.matches) {
        if (!span_unmarked(st.pattern_mark, m.pattern_index, m.length)) continue;
        if (!span_unmarked(st.text_mark, m.text_index, m.length)) continue;

        mark_span(st.pattern_mark, m.pattern_index, m.length);
        mark_span(st.text_mark, m.text_index, m.length);
        sink(m);
        ++accepted;
    }
    st.matches.clear();
    return accepted;
}

static void check_lengths(size_t initial_search_length, size_t minimum_match_length) {
    if (initial_search_length == 0) {
        throw std::invalid_argument("tile: initial_search_length must be positive");
    }
    if (minimum_match_length == 0) {
        throw std::invalid_argument("tile: minimum_match_length must be positive");
    }
    if (minimum_match_length > initial_search_length) {
        throw std::invalid_argument("tile: minimum_match_length (" + std::to_string(minimum_match_length) +
                                    ") exceeds initial_search_length (" +
                                    std::to_string(initial_search_length) + ")");
    }
}

// ---------- generic, sink-driven RKR-GST ----------

/**
 * @brief Core Running Karp-Rabin Greedy String Tiling loop.
 *
 * Alternates scan passes and tiling passes. A pass that finds a match longer
 * than twice the search length is repeated with that length; otherwise its
 * candidates are tiled and the search length is halved, floored at the
 * minimum match length. The loop ends after the pass at the minimum.
 *
 * @tparam Token char for byte sequences, uint32_t for token sequences
 * @tparam Sink Callable that accepts Match objects
 * @return Number of tiles emitted
 *
 * @throws std::invalid_argument On invalid lengths, before any work is done
 */
template<class Token, class Sink>
static size_t rkr_gst(const Token* pattern, size_t pattern_len, const Token* text, size_t text_len,
                      size_t initial_search_length, size_t minimum_match_length, Sink&& sink) {
    check_lengths(initial_search_length, minimum_match_length);

    TilingState<Token> st{pattern, pattern_len, text, text_len,
                          sdsl::bit_vector(pattern_len, 0), sdsl::bit_vector(text_len, 0), {}};

    size_t count = 0;
    size_t s = initial_search_length;
    while (true) {
        size_t lmax = scan_pattern(st, s);
        if (exceeds_twice(lmax, s)) {
            s = lmax;
            continue;
        }

        count += mark_tiles(st, sink);

        if (exceeds_twice(s, minimum_match_length)) {
            s /= 2;
        } else if (s > minimum_match_length) {
            s = minimum_match_length;
        } else {
            break;
        }
    }
    return count;
}

// ------------- public wrappers -------------

/**
 * @brief Tiles two byte sequences, handing each accepted tile to a sink.
 *
 * @tparam Sink Callable that accepts Match objects
 * @return Number of tiles emitted
 *
 * @see tile() for the version that returns a vector
 */
template<class Sink>
size_t tile_stream(std::string_view pattern, std::string_view text,
                   size_t initial_search_length, size_t minimum_match_length, Sink&& sink) {
    return rkr_gst(pattern.data(), pattern.size(), text.data(), text.size(),
                   initial_search_length, minimum_match_length, std::forward<Sink>(sink));
}

/**
 * @brief Tiles two token sequences, handing each accepted tile to a sink.
 *
 * @see tile_tokens() for the version that returns a vector
 */
template<class Sink>
size_t tile_tokens_stream(const std::vector<uint32_t>& pattern, const std::vector<uint32_t>& text,
                          size_t initial_search_length, size_t minimum_match_length, Sink&& sink) {
    return rkr_gst(pattern.data(), pattern.size(), text.data(), text.size(),
                   initial_search_length, minimum_match_length, std::forward<Sink>(sink));
}

std::vector<Match> tile(std::string_view pattern, std::string_view text,
                        size_t initial_search_length, size_t minimum_match_length) {
    std::vector<Match> out;
    tile_stream(pattern, text, initial_search_length, minimum_match_length,
                [&](const Match& m){ out.push_back(m); });
    return out;
}

std::vector<Match> tile_tokens(const std::vector<uint32_t>& pattern, const std::vector<uint32_t>& text,
                               size_t initial_search_length, size_t minimum_match_length) {
    std::vector<Match> out;
    tile_tokens_stream(pattern, text, initial_search_length, minimum_match_length,
                       [&](const Match& m){ out.push_back(m); });
    return out;
}

/**
 * @brief Counts tiles without storing them.
 *
 * @note Uses the sink-based loop with a counting lambda
 */
size_t count_tiles(std::string_view pattern, std::string_view text,
                   size_t initial_search_length, size_t minimum_match_length) {
    size_t n = 0;
    tile_stream(pattern, text, initial_search_length, minimum_match_length,
                [&](const Match&){ ++n; });
    return n;
}

size_t tiled_length(std::string_view pattern, std::string_view text,
                    size_t initial_search_length, size_t minimum_match_length) {
    size_t covered = 0;
    tile_stream(pattern, text, initial_search_length, minimum_match_length,
                [&](const Match& m){ covered += static_cast<size_t>(m.length); });
    return covered;
}

} // namespace rkrGST
