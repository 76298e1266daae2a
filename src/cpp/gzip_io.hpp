#pragma once
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <zlib.h>

namespace strsearch {

/**
 * @brief Formats the last zlib error on @p file for an exception message.
 */
inline std::string gz_error_message(gzFile file, const std::string& action, const std::string& path) {
    int errnum = 0;
    const char* errmsg = gzerror(file, &errnum);
    return "Failed to " + action + " " + path + ": " + std::string(errmsg ? errmsg : "unknown zlib error");
}

/**
 * @brief RAII reader for plain or gzip-compressed files.
 *
 * zlib detects the gzip header itself and passes uncompressed files
 * through unchanged, so callers never need to know which kind they have.
 */
class GzipReader {
private:
    gzFile file_;
    std::string path_;

public:
    /**
     * @throws std::runtime_error If the file cannot be opened
     */
    explicit GzipReader(const std::string& path)
        : file_(gzopen(path.c_str(), "rb")), path_(path) {
        if (file_ == nullptr) {
            throw std::runtime_error("Cannot open file for reading: " + path);
        }
    }

    ~GzipReader() {
        if (file_ != nullptr && gzclose(file_) != Z_OK) {
            std::cerr << "Warning: Failed to close input file: " << path_ << std::endl;
        }
    }

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    /**
     * @brief Reads up to @p size uncompressed bytes.
     * @return Bytes read, 0 at end of file
     * @throws std::runtime_error On a read or decompression error
     */
    size_t read(void* data, size_t size) {
        int bytes_read = gzread(file_, data, static_cast<unsigned int>(size));
        if (bytes_read < 0) {
            throw std::runtime_error(gz_error_message(file_, "read from", path_));
        }
        return static_cast<size_t>(bytes_read);
    }

    /**
     * @brief Reads the remaining uncompressed contents into a string.
     */
    std::string read_all() {
        std::string out;
        char buf[1 << 16];
        size_t n;
        while ((n = read(buf, sizeof(buf))) > 0) {
            out.append(buf, n);
        }
        return out;
    }
};

/**
 * @brief RAII writer producing either a gzip-compressed or a plain file.
 *
 * The destructor closes the file but cannot report failures; call close()
 * to have a failed final flush raised as an exception.
 */
class GzipWriter {
private:
    gzFile file_;
    std::string path_;

public:
    /**
     * @param path Output file path
     * @param compress gzip-compress the output when true, write it raw otherwise
     * @param compression_level zlib level 0-9
     * @throws std::runtime_error If the file cannot be opened
     */
    GzipWriter(const std::string& path, bool compress, int compression_level = 6)
        : file_(nullptr), path_(path) {
        // "T" asks zlib for transparent (uncompressed) writing
        std::string mode = compress ? "wb" + std::to_string(compression_level) : "wbT";
        file_ = gzopen(path.c_str(), mode.c_str());
        if (file_ == nullptr) {
            throw std::runtime_error("Cannot open file for writing: " + path);
        }
    }

    ~GzipWriter() {
        if (file_ != nullptr && gzclose(file_) != Z_OK) {
            std::cerr << "Warning: Failed to close output file: " << path_ << std::endl;
        }
    }

    GzipWriter(const GzipWriter&) = delete;
    GzipWriter& operator=(const GzipWriter&) = delete;

    /**
     * @throws std::runtime_error If the write fails or the writer is closed
     */
    void write(const void* data, size_t size) {
        if (file_ == nullptr) {
            throw std::runtime_error("Attempt to write to closed file: " + path_);
        }
        int written = gzwrite(file_, data, static_cast<unsigned int>(size));
        if (written != static_cast<int>(size)) {
            throw std::runtime_error(gz_error_message(file_, "write to", path_));
        }
    }

    /**
     * @brief Flushes and closes the file.
     * @throws std::runtime_error If the final flush fails
     */
    void close() {
        if (file_ == nullptr) return;
        int rc = gzclose(file_);
        file_ = nullptr;
        if (rc != Z_OK) {
            throw std::runtime_error("Failed to close " + path_ + " (zlib error " + std::to_string(rc) + ")");
        }
    }
};

/**
 * @brief True if @p path names a gzip output by extension.
 */
inline bool has_gz_extension(std::string_view path) {
    return path.size() >= 3 && path.substr(path.size() - 3) == ".gz";
}

} // namespace strsearch
