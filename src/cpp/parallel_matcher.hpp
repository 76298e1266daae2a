#pragma once
#include "matcher.hpp"
#include <cstddef>
#include <string_view>
#include <vector>

namespace strsearch {

/** Minimum haystack bytes per worker before auto-detection adds another thread. */
constexpr size_t DEFAULT_MIN_CHARS_PER_THREAD = 10000;

/**
 * @brief Options for ParallelMatcher.
 */
struct ParallelOptions {
    size_t num_threads = 0;                                     /**< Worker count, 0 for auto-detection */
    size_t min_chars_per_thread = DEFAULT_MIN_CHARS_PER_THREAD; /**< Auto-detection granularity */
};

/**
 * @brief Work assignment for one worker thread.
 */
struct ChunkContext {
    size_t thread_id;             // Thread identifier
    size_t start_pos;             // First offset this thread may report
    size_t end_pos;               // Offsets >= end_pos belong to the next thread
    size_t scan_end;              // Bytes read, extends |pattern| - 1 past end_pos
    std::vector<size_t> matches;  // Offsets found in [start_pos, end_pos)
};

/**
 * @brief Multi-threaded find_all() over a single haystack.
 *
 * The haystack is cut into one contiguous chunk per thread. Every worker
 * shares the same CompiledPattern read-only and scans its chunk plus the
 * |pattern| - 1 bytes that follow it, so occurrences straddling a chunk
 * boundary are found by exactly one worker: the one owning their start
 * offset. The per-thread results are concatenated in chunk order, giving
 * exactly the output of the sequential find_all_list().
 */
class ParallelMatcher {
public:
    ParallelMatcher() = default;
    ~ParallelMatcher() = default;

    /**
     * @brief Finds every (possibly overlapping) occurrence using several threads.
     *
     * @param pattern Forward compiled pattern
     * @param haystack Text to search
     * @param opts Thread configuration
     * @return Ascending match offsets, identical to find_all_list(pattern, haystack, 0)
     * @throws InvalidArgumentError If @p pattern is not a Forward pattern
     */
    std::vector<size_t> find_all(const CompiledPattern& pattern, std::string_view haystack,
                                 const ParallelOptions& opts = {});

    /**
     * @brief Counts occurrences using several threads.
     */
    size_t count_matches(const CompiledPattern& pattern, std::string_view haystack,
                         const ParallelOptions& opts = {});

    /**
     * @brief Number of workers that would be used for a haystack of @p text_length bytes.
     */
    static size_t resolve_thread_count(size_t text_length, const ParallelOptions& opts);

private:
    std::vector<ChunkContext> run(const CompiledPattern& pattern, std::string_view haystack,
                                  const ParallelOptions& opts);

    /**
     * @brief Worker body: scans one chunk and records the offsets it owns.
     */
    void search_chunk(const CompiledPattern& pattern, std::string_view haystack, ChunkContext& ctx);
};

} // namespace strsearch
