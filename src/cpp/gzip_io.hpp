#pragma once
#include <string>
#include <stdexcept>
#include <zlib.h>

namespace rkrGST {

/**
 * @brief Builds the message of a failed zlib file operation.
 */
inline std::string gz_error_message(gzFile file, const std::string& what, const std::string& path) {
    int errnum = Z_OK;
    const char* errmsg = gzerror(file, &errnum);
    return what + " " + path + ": " + std::string(errmsg ? errmsg : "unknown error");
}

/**
 * @brief RAII wrapper for writing a binary file, optionally gzip-compressed.
 *
 * Without compression the file is opened in zlib's transparent mode ("wT"),
 * so both variants share the same write path.
 */
class GzipWriter {
private:
    gzFile file_;
    std::string path_;

public:
    /**
     * @brief Opens a file for writing, truncating it.
     *
     * @param path Output file path
     * @param compress Write gzip-compressed data instead of raw bytes
     * @param compression_level Compression level (0-9, default 6), used with compress
     * @throws std::runtime_error If file cannot be opened
     */
    GzipWriter(const std::string& path, bool compress, int compression_level = 6)
        : file_(nullptr), path_(path) {
        std::string mode = compress ? "wb" + std::to_string(compression_level) : "wbT";
        file_ = gzopen(path.c_str(), mode.c_str());
        if (file_ == nullptr) {
            throw std::runtime_error("Cannot open file for writing: " + path);
        }
    }

    ~GzipWriter() {
        if (file_ != nullptr) gzclose(file_);
    }

    GzipWriter(const GzipWriter&) = delete;
    GzipWriter& operator=(const GzipWriter&) = delete;

    /**
     * @brief Writes binary data to the file.
     *
     * @throws std::runtime_error If the write is short
     */
    void write(const void* data, size_t size) {
        if (file_ == nullptr) {
            throw std::runtime_error("Attempt to write to closed file: " + path_);
        }
        if (size == 0) return;
        size_t written = gzfwrite(data, 1, size, file_);
        if (written != size) {
            throw std::runtime_error(gz_error_message(file_, "Failed to write to file", path_));
        }
    }

    /**
     * @brief Flushes and closes the file, reporting any deferred write error.
     *
     * @throws std::runtime_error If closing fails
     */
    void close() {
        if (file_ == nullptr) return;
        int rc = gzclose(file_);
        file_ = nullptr;
        if (rc != Z_OK) {
            throw std::runtime_error("Failed to close file " + path_ + " (zlib error " + std::to_string(rc) + ")");
        }
    }
};

/**
 * @brief RAII wrapper for reading a file that may or may not be gzip-compressed.
 *
 * zlib detects the gzip header itself and passes plain files through unchanged.
 */
class GzipReader {
private:
    gzFile file_;
    std::string path_;

public:
    /**
     * @brief Opens a file for reading.
     *
     * @throws std::runtime_error If file cannot be opened
     */
    explicit GzipReader(const std::string& path)
        : file_(nullptr), path_(path) {
        file_ = gzopen(path.c_str(), "rb");
        if (file_ == nullptr) {
            throw std::runtime_error("Cannot open file for reading: " + path);
        }
    }

    ~GzipReader() {
        if (file_ != nullptr) gzclose(file_);
    }

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    /**
     * @brief Reads up to size bytes.
     *
     * @return Number of bytes read (less than size only at end of file)
     * @throws std::runtime_error If the read fails
     */
    size_t read(void* data, size_t size) {
        size_t n = gzfread(data, 1, size, file_);
        if (n < size && !gzeof(file_)) {
            throw std::runtime_error(gz_error_message(file_, "Failed to read from file", path_));
        }
        return n;
    }

    /**
     * @brief Reads the rest of the file (decompressed) into a string.
     *
     * @throws std::runtime_error If a read fails
     */
    std::string read_all() {
        std::string out;
        std::string buf(1 << 20, '\0');  // 1 MB chunks
        while (true) {
            size_t n = read(&buf[0], buf.size());
            out.append(buf.data(), n);
            if (n < buf.size()) break;
        }
        return out;
    }
};

} // namespace rkrGST
