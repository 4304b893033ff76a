#include "tile_file.hpp"
#include "gzip_io.hpp"
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace rkrGST {

static_assert(sizeof(Match) == 3 * sizeof(uint64_t), "Match must be three packed uint64_t");
static_assert(sizeof(TileFileFooter) == 7 * sizeof(uint64_t), "TileFileFooter must be seven packed uint64_t");

/**
 * @brief Loads a whole input file, decompressing it if it is gzipped.
 *
 * An empty input is not an error (it simply produces no tiles), but it is
 * reported since it usually means a wrong path or a truncated file.
 */
static std::string load_sequence(const std::string& path) {
    GzipReader reader(path);
    std::string data = reader.read_all();
    if (data.empty()) {
        std::cerr << "Warning: input file is empty: " << path << std::endl;
    }
    return data;
}

std::vector<Match> tile_files(const std::string& pattern_path, const std::string& text_path,
                              size_t initial_search_length, size_t minimum_match_length) {
    std::string pattern = load_sequence(pattern_path);
    std::string text = load_sequence(text_path);
    return tile(pattern, text, initial_search_length, minimum_match_length);
}

size_t write_tiles_binary_file(const std::string& pattern_path, const std::string& text_path,
                               const std::string& out_path,
                               size_t initial_search_length, size_t minimum_match_length,
                               bool compress) {
    std::string pattern = load_sequence(pattern_path);
    std::string text = load_sequence(text_path);
    std::vector<Match> tiles = tile(pattern, text, initial_search_length, minimum_match_length);

    GzipWriter writer(out_path, compress);
    if (!tiles.empty()) {
        writer.write(tiles.data(), tiles.size() * sizeof(Match));
    }

    TileFileFooter footer;
    footer.magic = TILE_FILE_MAGIC;
    footer.num_tiles = tiles.size();
    footer.pattern_length = pattern.size();
    footer.text_length = text.size();
    footer.initial_search_length = initial_search_length;
    footer.minimum_match_length = minimum_match_length;
    footer.footer_size = sizeof(TileFileFooter);
    writer.write(&footer, sizeof(footer));
    writer.close();

    return tiles.size();
}

TileFile read_tiles_binary_file(const std::string& path) {
    GzipReader reader(path);
    std::string data = reader.read_all();

    if (data.size() < sizeof(TileFileFooter)) {
        throw std::runtime_error("Tile file too short for footer: " + path);
    }

    TileFile result;
    std::memcpy(&result.footer, data.data() + data.size() - sizeof(TileFileFooter), sizeof(TileFileFooter));
    const TileFileFooter& footer = result.footer;

    if (footer.magic != TILE_FILE_MAGIC) {
        throw std::runtime_error("Not a tile file (bad magic): " + path);
    }
    if (footer.footer_size != sizeof(TileFileFooter)) {
        throw std::runtime_error("Unsupported tile file footer size " + std::to_string(footer.footer_size) +
                                 ": " + path);
    }

    const size_t body_size = data.size() - sizeof(TileFileFooter);
    if (body_size % sizeof(Match) != 0 || body_size / sizeof(Match) != footer.num_tiles) {
        throw std::runtime_error("Tile count mismatch: footer says " + std::to_string(footer.num_tiles) +
                                 ", file holds " + std::to_string(body_size) + " bytes of tiles: " + path);
    }

    result.tiles.resize(footer.num_tiles);
    if (body_size > 0) {
        std::memcpy(result.tiles.data(), data.data(), body_size);
    }
    return result;
}

} // namespace rkrGST
