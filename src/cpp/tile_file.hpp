#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "tiler.hpp"

namespace rkrGST {

/// "RKRGST01" read as a little-endian uint64_t.
constexpr uint64_t TILE_FILE_MAGIC = 0x3130545347524B52ULL;

/**
 * @brief Footer appended after the tiles of a binary tile file.
 *
 * Tiles and footer are raw uint64_t values in host byte order. A file read on
 * a host of the other byte order fails the magic check.
 */
struct TileFileFooter {
    uint64_t magic;                  /**< TILE_FILE_MAGIC */
    uint64_t num_tiles;              /**< Number of Match records before the footer */
    uint64_t pattern_length;         /**< Length of the pattern input in bytes */
    uint64_t text_length;            /**< Length of the text input in bytes */
    uint64_t initial_search_length;  /**< Parameters the tiles were computed with */
    uint64_t minimum_match_length;
    uint64_t footer_size;            /**< sizeof(TileFileFooter) */
};

/**
 * @brief Contents of a binary tile file.
 */
struct TileFile {
    std::vector<Match> tiles;  /**< Tiles in acceptance order */
    TileFileFooter footer;
};

/**
 * @brief Tiles the contents of two files.
 *
 * Both inputs are read through zlib, so gzip-compressed files are
 * decompressed transparently.
 *
 * @param pattern_path Path to the pattern file
 * @param text_path Path to the text file
 * @param initial_search_length Search length of the first pass
 * @param minimum_match_length Shortest tile that can be reported
 * @return Accepted tiles, in the order they were accepted
 *
 * @throws std::runtime_error If a file cannot be read
 * @throws std::invalid_argument On invalid lengths
 * @see tile()
 */
std::vector<Match> tile_files(const std::string& pattern_path, const std::string& text_path,
                              size_t initial_search_length, size_t minimum_match_length);

/**
 * @brief Tiles two files and writes the tiles to a binary file.
 *
 * Each tile is written as three uint64_t values (pattern_index, text_index,
 * length), in acceptance order, followed by a TileFileFooter.
 *
 * @param pattern_path Path to the pattern file
 * @param text_path Path to the text file
 * @param out_path Path of the binary tile file
 * @param initial_search_length Search length of the first pass
 * @param minimum_match_length Shortest tile that can be reported
 * @param compress Gzip-compress the output
 * @return Number of tiles written
 *
 * @warning This function overwrites the output file if it exists
 */
size_t write_tiles_binary_file(const std::string& pattern_path, const std::string& text_path,
                               const std::string& out_path,
                               size_t initial_search_length, size_t minimum_match_length,
                               bool compress = false);

/**
 * @brief Reads a binary tile file written by write_tiles_binary_file().
 *
 * @param path Path to a plain or gzip-compressed tile file
 * @return The tiles and the footer
 *
 * @throws std::runtime_error If the file cannot be read or is not a valid tile file
 */
TileFile read_tiles_binary_file(const std::string& path);

}
