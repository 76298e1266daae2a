#pragma once
#include "pattern.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace strsearch {

/**
 * @brief Reads an entire file, decompressing it first if it is gzipped.
 *
 * @param path Path to a plain or gzip-compressed file
 * @return The uncompressed contents
 * @throws std::runtime_error If the file cannot be opened or decompressed
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Finds every (possibly overlapping) occurrence of @p pattern in a file.
 *
 * The file is read with read_text_file(). Forward patterns yield ascending
 * offsets, Reverse patterns descending ones.
 *
 * @param pattern Compiled pattern
 * @param path Path to a plain or gzip-compressed file
 * @return Offsets into the uncompressed contents
 * @throws std::runtime_error If the file cannot be read
 */
std::vector<size_t> find_all_file(const CompiledPattern& pattern, const std::string& path);

/**
 * @brief Counts occurrences of @p pattern in a file without storing them.
 * @throws std::runtime_error If the file cannot be read
 */
size_t count_matches_file(const CompiledPattern& pattern, const std::string& path);

/**
 * @brief Splits the contents of a file along @p separator.
 *
 * @return Owned copies of every slice
 * @throws InvalidArgumentError If @p separator is empty
 * @throws std::runtime_error If the file cannot be read
 */
std::vector<std::string> split_file(const std::string& path, std::string_view separator);

/**
 * @brief Writes the match offsets of @p pattern in a file to a binary output file.
 *
 * Each offset is written as one uint64_t in host byte order. When
 * @p out_path ends in ".gz" the output is gzip-compressed.
 *
 * @param pattern Compiled pattern
 * @param in_path Plain or gzip-compressed input file
 * @param out_path Output file, overwritten if it exists
 * @return Number of offsets written
 * @throws std::runtime_error If either file cannot be opened or written
 */
size_t write_matches_binary_file(const CompiledPattern& pattern, const std::string& in_path,
                                 const std::string& out_path);

} // namespace strsearch
