#pragma once
#include "pattern.hpp"
#include "slice.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace strsearch {

/**
 * @brief Lazy, single-pass sequence of the slices between separator occurrences.
 *
 * Produced by split_all(). Each call to next() searches forward from the end
 * of the previous separator and yields the slice in between; once no further
 * separator exists it yields the trailing slice (possibly empty) and then
 * std::nullopt forever.
 *
 * Separators are consumed left-to-right without overlap, so
 * split_all("a--b----c--", "--") yields "a", "b", "", "c", "".
 *
 * The haystack storage must outlive the stream and every slice it yields.
 */
class SliceStream {
public:
    /**
     * @throws InvalidArgumentError If @p separator is empty
     */
    SliceStream(std::string_view haystack, std::string_view separator);

    std::optional<Slice> next();

private:
    std::optional<size_t> find_separator() const;

    std::string_view haystack_;
    std::optional<CompiledPattern> pattern_;  // unset for one-byte separators
    char byte_;
    size_t sep_len_;
    size_t pos_;
    bool done_;
};

/**
 * @brief Lazily splits @p haystack along every occurrence of @p separator.
 *
 * @param haystack Text to split, its storage must outlive the stream
 * @param separator Non-empty literal separator
 * @return A stream of slices; concatenating them with @p separator
 *         reinserted reproduces @p haystack
 * @throws InvalidArgumentError If @p separator is empty
 */
SliceStream split_all(std::string_view haystack, std::string_view separator);

/**
 * @brief Eager split_all() returning the slices as views.
 */
std::vector<Slice> split_all_slices(std::string_view haystack, std::string_view separator);

/**
 * @brief Eager split_all() returning owned copies of every slice.
 */
std::vector<std::string> split_all_copy(std::string_view haystack, std::string_view separator);

/**
 * @brief Splits on the leftmost occurrence of @p separator.
 *
 * @return (before, after) or std::nullopt if @p separator does not occur
 * @throws InvalidArgumentError If @p separator is empty
 */
std::optional<std::pair<Slice, Slice>> split_first(std::string_view haystack, std::string_view separator);

/**
 * @brief Splits on the rightmost occurrence of @p separator, found by reverse search.
 *
 * @return (before, after) or std::nullopt if @p separator does not occur
 * @throws InvalidArgumentError If @p separator is empty
 */
std::optional<std::pair<Slice, Slice>> split_last(std::string_view haystack, std::string_view separator);

/**
 * @brief split_first() for callers that treat absence as exceptional.
 * @throws NotFoundError If @p separator does not occur
 */
std::pair<Slice, Slice> split_first_or_throw(std::string_view haystack, std::string_view separator);

/**
 * @brief split_last() for callers that treat absence as exceptional.
 * @throws NotFoundError If @p separator does not occur
 */
std::pair<Slice, Slice> split_last_or_throw(std::string_view haystack, std::string_view separator);

// Line helpers

/**
 * @brief Splits @p s along '\n'. A trailing newline yields a trailing empty line.
 */
std::vector<std::string> lines(std::string_view s);

/**
 * @brief Joins @p parts with '\n'; unlines(lines(s)) == s.
 */
std::string unlines(const std::vector<std::string>& parts);

/**
 * @brief Concatenates @p parts, inserting @p separator between each pair.
 */
std::string join(const std::vector<std::string>& parts, std::string_view separator);

} // namespace strsearch
