/**
 * @file bindings.cpp
 * @brief Python bindings for the rkrGST greedy string tiling library.
 *
 * The module exposes the following functions:
 * - tile(): Tile two in-memory byte sequences
 * - tile_tokens(): Tile two lists of integer tokens
 * - count_tiles(): Count tiles between two byte sequences
 * - tiled_length(): Total length covered by the tiles
 * - tile_files(): Tile the contents of two (optionally gzipped) files
 * - write_tiles_binary_file(): Tile two files and write the tiles to a binary file
 * - read_tiles_binary_file(): Read a binary tile file back
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/pytypes.h>
#include <string>
#include <string_view>
#include <stdexcept>
#include "tiler.hpp"
#include "tile_file.hpp"
#include "version.hpp"

namespace py = pybind11;

/**
 * @brief Views a Python bytes-like object as a string_view.
 *
 * The caller must keep the buffer alive while the view is used.
 */
static std::string_view as_bytes(const py::buffer_info& info, const char* fn, const char* arg) {
    if (info.itemsize != 1) {
        throw std::invalid_argument(std::string(fn) + ": " + arg + " must be a bytes-like object with itemsize==1");
    }
    if (info.ndim != 1) {
        throw std::invalid_argument(std::string(fn) + ": " + arg + " must be a 1-dimensional bytes-like object");
    }
    return std::string_view(static_cast<const char*>(info.ptr), static_cast<size_t>(info.size));
}

static py::list to_tuples(const std::vector<rkrGST::Match>& tiles) {
    py::list out;
    for (auto &m : tiles) out.append(py::make_tuple(m.pattern_index, m.text_index, m.length));
    return out;
}

PYBIND11_MODULE(_rkrGST, m) {
    m.doc() = "Running Karp-Rabin Greedy String Tiling\n\n"
              "This module tiles two sequences with maximal non-overlapping common substrings.";

    // Results are returned as tuples; Match is for callers that build and compare tiles themselves.
    py::class_<rkrGST::Match>(m, "Match", "A common substring tile between a pattern and a text.\n\n"
                                          "Functions return (pattern_index, text_index, length) tuples;\n"
                                          "Match(*t) turns one into a comparable record.")
        .def(py::init<uint64_t, uint64_t, uint64_t>(),
             py::arg("pattern_index"), py::arg("text_index"), py::arg("length"))
        .def_readonly("pattern_index", &rkrGST::Match::pattern_index, "Offset of the tile in the pattern")
        .def_readonly("text_index", &rkrGST::Match::text_index, "Offset of the tile in the text")
        .def_readonly("length", &rkrGST::Match::length, "Number of tokens covered on each side")
        .def("__eq__", [](const rkrGST::Match& a, const rkrGST::Match& b) { return a == b; })
        .def("__lt__", [](const rkrGST::Match& a, const rkrGST::Match& b) { return a < b; })
        .def("__repr__", [](const rkrGST::Match& a) {
            return "Match(pattern_index=" + std::to_string(a.pattern_index) +
                   ", text_index=" + std::to_string(a.text_index) +
                   ", length=" + std::to_string(a.length) + ")";
        });

    m.def("tile", [](py::buffer pattern, py::buffer text, size_t initial_search_length, size_t minimum_match_length) {
        py::buffer_info pattern_info = pattern.request();
        py::buffer_info text_info = text.request();
        std::string_view p = as_bytes(pattern_info, "tile", "pattern");
        std::string_view t = as_bytes(text_info, "tile", "text");

        // Release GIL while doing heavy C++ work
        py::gil_scoped_release release;
        auto tiles = rkrGST::tile(p, t, initial_search_length, minimum_match_length);
        py::gil_scoped_acquire acquire;

        return to_tuples(tiles);
    }, py::arg("pattern"), py::arg("text"), py::arg("initial_search_length"), py::arg("minimum_match_length"),
    R"doc(Tile two byte sequences with maximal non-overlapping common substrings.

Args:
    pattern: Python bytes-like object
    text: Python bytes-like object
    initial_search_length: Search length of the first pass (> 0)
    minimum_match_length: Shortest tile reported (> 0, <= initial_search_length)

Returns:
    List of (pattern_index, text_index, length) tuples in acceptance order

Raises:
    ValueError: if an argument is not a valid bytes-like object or a length is invalid

Note:
    GIL is released during computation for better performance with large data.
)doc");

    m.def("tile_tokens", [](const std::vector<uint32_t>& pattern, const std::vector<uint32_t>& text,
                            size_t initial_search_length, size_t minimum_match_length) {
        py::gil_scoped_release release;
        auto tiles = rkrGST::tile_tokens(pattern, text, initial_search_length, minimum_match_length);
        py::gil_scoped_acquire acquire;

        return to_tuples(tiles);
    }, py::arg("pattern"), py::arg("text"), py::arg("initial_search_length"), py::arg("minimum_match_length"),
    R"doc(Tile two sequences of integer tokens (0 <= token < 2**32).

Returns:
    List of (pattern_index, text_index, length) tuples in acceptance order
)doc");

    m.def("count_tiles", [](py::buffer pattern, py::buffer text, size_t initial_search_length, size_t minimum_match_length) {
        py::buffer_info pattern_info = pattern.request();
        py::buffer_info text_info = text.request();
        std::string_view p = as_bytes(pattern_info, "count_tiles", "pattern");
        std::string_view t = as_bytes(text_info, "count_tiles", "text");

        py::gil_scoped_release release;
        size_t count = rkrGST::count_tiles(p, t, initial_search_length, minimum_match_length);
        py::gil_scoped_acquire acquire;

        return count;
    }, py::arg("pattern"), py::arg("text"), py::arg("initial_search_length"), py::arg("minimum_match_length"),
    R"doc(Count the tiles between two byte sequences without building the list.)doc");

    m.def("tiled_length", [](py::buffer pattern, py::buffer text, size_t initial_search_length, size_t minimum_match_length) {
        py::buffer_info pattern_info = pattern.request();
        py::buffer_info text_info = text.request();
        std::string_view p = as_bytes(pattern_info, "tiled_length", "pattern");
        std::string_view t = as_bytes(text_info, "tiled_length", "text");

        py::gil_scoped_release release;
        size_t covered = rkrGST::tiled_length(p, t, initial_search_length, minimum_match_length);
        py::gil_scoped_acquire acquire;

        return covered;
    }, py::arg("pattern"), py::arg("text"), py::arg("initial_search_length"), py::arg("minimum_match_length"),
    R"doc(Total number of pattern positions covered by the tiles.)doc");

    m.def("tile_files", [](const std::string& pattern_path, const std::string& text_path,
                           size_t initial_search_length, size_t minimum_match_length) {
        py::gil_scoped_release release;
        auto tiles = rkrGST::tile_files(pattern_path, text_path, initial_search_length, minimum_match_length);
        py::gil_scoped_acquire acquire;

        return to_tuples(tiles);
    }, py::arg("pattern_path"), py::arg("text_path"), py::arg("initial_search_length"), py::arg("minimum_match_length"),
    R"doc(Tile the contents of two files.

Plain and gzip-compressed files are both accepted.

Returns:
    List of (pattern_index, text_index, length) tuples in acceptance order

Raises:
    RuntimeError: If a file cannot be read
)doc");

    m.def("write_tiles_binary_file", [](const std::string& pattern_path, const std::string& text_path,
                                        const std::string& out_path,
                                        size_t initial_search_length, size_t minimum_match_length, bool compress) {
        py::gil_scoped_release release;
        size_t count = rkrGST::write_tiles_binary_file(pattern_path, text_path, out_path,
                                                       initial_search_length, minimum_match_length, compress);
        py::gil_scoped_acquire acquire;

        return count;
    }, py::arg("pattern_path"), py::arg("text_path"), py::arg("out_path"),
       py::arg("initial_search_length"), py::arg("minimum_match_length"), py::arg("compress") = false,
    R"doc(Tile two files and write the tiles to a binary file.

Returns:
    Number of tiles written

Note:
    Binary format: each tile is 24 bytes (3 x uint64_t: pattern_index, text_index, length),
    followed by a 56-byte footer (magic "RKRGST01", num_tiles, pattern_length, text_length,
    initial_search_length, minimum_match_length, footer_size).
    This function overwrites the output file if it exists.
)doc");

    m.def("read_tiles_binary_file", [](const std::string& path) {
        py::gil_scoped_release release;
        auto file = rkrGST::read_tiles_binary_file(path);
        py::gil_scoped_acquire acquire;

        py::dict py_result;
        py_result["tiles"] = to_tuples(file.tiles);
        py_result["pattern_length"] = file.footer.pattern_length;
        py_result["text_length"] = file.footer.text_length;
        py_result["initial_search_length"] = file.footer.initial_search_length;
        py_result["minimum_match_length"] = file.footer.minimum_match_length;
        return py_result;
    }, py::arg("path"), R"doc(Read a binary tile file (plain or gzip-compressed).

Returns:
    Dictionary with 'tiles', 'pattern_length', 'text_length',
    'initial_search_length' and 'minimum_match_length'

Raises:
    RuntimeError: If the file cannot be read or is not a tile file
)doc");

    // Version information
    m.attr("__version__") = std::to_string(rkrGST::VERSION_MAJOR) + "." + std::to_string(rkrGST::VERSION_MINOR) + "." + std::to_string(rkrGST::VERSION_PATCH);
}
