#pragma once
#include "pattern.hpp"
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace strsearch {

/**
 * @brief Lazy, single-pass sequence of match offsets.
 *
 * Produced by find_all(). Each call to next() resumes the KMP scan where the
 * previous one stopped and yields the start offset of the next occurrence,
 * or std::nullopt once the haystack is exhausted. After a full match the
 * pattern cursor falls back through the failure table instead of resetting,
 * so overlapping occurrences are all reported.
 *
 * Offsets ascend for Forward patterns and descend for Reverse ones.
 *
 * The stream refers to the CompiledPattern and the haystack storage without
 * owning them; both must outlive it. A stream cannot be rewound: call
 * find_all() again to rescan.
 */
class MatchStream {
public:
    MatchStream(const CompiledPattern& pattern, std::string_view haystack, size_t start);

    /**
     * @brief Advances to the next occurrence.
     * @return Start offset of the occurrence, or std::nullopt when none remain
     */
    std::optional<size_t> next();

private:
    std::optional<size_t> next_forward();
    std::optional<size_t> next_reverse();

    const CompiledPattern* pattern_;
    std::string_view haystack_;
    size_t pos_;      // forward: next byte to read; reverse: bytes left of the cursor
    size_t matched_;  // length of the pattern prefix currently matched
};

// Single-match search

/**
 * @brief Finds the next occurrence of a compiled pattern.
 *
 * Forward patterns return the smallest offset i >= @p start at which the
 * pattern occurs. Reverse patterns treat @p start as an exclusive right
 * boundary and return the largest offset i with i + |pattern| <= start.
 *
 * @param pattern Compiled pattern
 * @param haystack Text to search
 * @param start Cursor, 0 <= start <= haystack.size()
 * @return Offset of the occurrence, or std::nullopt if there is none
 * @throws InvalidIndexError If @p start > haystack.size()
 */
std::optional<size_t> find(const CompiledPattern& pattern, std::string_view haystack, size_t start);

/**
 * @brief find() from the natural end for the pattern's direction
 * (0 for Forward, haystack.size() for Reverse).
 */
std::optional<size_t> find(const CompiledPattern& pattern, std::string_view haystack);

/**
 * @brief Compiles @p sub and returns its first occurrence at or after @p start.
 *
 * Intended for one-off searches; compile once and reuse the CompiledPattern
 * when searching repeatedly.
 *
 * @throws InvalidPatternError If @p sub is empty
 * @throws InvalidIndexError If @p start > haystack.size()
 */
std::optional<size_t> find(std::string_view sub, std::string_view haystack, size_t start = 0);

/**
 * @brief Compiles @p sub in reverse and returns its last occurrence in @p haystack.
 *
 * @throws InvalidPatternError If @p sub is empty
 */
std::optional<size_t> rfind(std::string_view sub, std::string_view haystack);

// All-matches search

/**
 * @brief Lazily enumerates every (possibly overlapping) occurrence.
 *
 * @param pattern Compiled pattern, must outlive the stream
 * @param haystack Text to search, its storage must outlive the stream
 * @param start Cursor, 0 <= start <= haystack.size()
 * @throws InvalidIndexError If @p start > haystack.size()
 */
MatchStream find_all(const CompiledPattern& pattern, std::string_view haystack, size_t start);

MatchStream find_all(const CompiledPattern& pattern, std::string_view haystack);

/**
 * @brief Collects all occurrences into a vector.
 *
 * @see find_all() for the lazy version
 */
std::vector<size_t> find_all_list(const CompiledPattern& pattern, std::string_view haystack, size_t start);

std::vector<size_t> find_all_list(const CompiledPattern& pattern, std::string_view haystack);

/**
 * @brief Feeds every occurrence to a sink.
 *
 * @tparam Sink Callable accepting a size_t offset
 * @return Number of occurrences emitted
 * @throws InvalidIndexError If @p start > haystack.size()
 */
template<class Sink>
size_t find_all_stream(const CompiledPattern& pattern, std::string_view haystack, size_t start, Sink&& sink) {
    MatchStream stream = find_all(pattern, haystack, start);
    size_t n = 0;
    while (auto offset = stream.next()) {
        sink(*offset);
        ++n;
    }
    return n;
}

/**
 * @brief Counts occurrences, overlapping ones included.
 */
size_t count_matches(const CompiledPattern& pattern, std::string_view haystack, size_t start);

size_t count_matches(const CompiledPattern& pattern, std::string_view haystack);

/**
 * @brief True iff the pattern occurs in @p haystack at or after @p start
 * (before @p start for Reverse patterns).
 */
bool contains(const CompiledPattern& pattern, std::string_view haystack, size_t start);

bool contains(const CompiledPattern& pattern, std::string_view haystack);

} // namespace strsearch
