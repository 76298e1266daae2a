#include "parallel_matcher.hpp"
#include "errors.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <thread>

namespace strsearch {

/**
 * @brief Picks the worker count for a haystack.
 *
 * With num_threads == 0 the count is the number of hardware threads, but no
 * more than the number of min_chars_per_thread-sized chunks the input
 * provides. An explicit request larger than the input length is clamped so
 * that no worker receives an empty chunk.
 */
size_t ParallelMatcher::resolve_thread_count(size_t text_length, const ParallelOptions& opts) {
    size_t num_threads = opts.num_threads;
    if (num_threads == 0) {
        size_t min_chars = std::max<size_t>(1, opts.min_chars_per_thread);
        size_t max_useful_threads = text_length / min_chars;
        size_t hardware_threads = std::thread::hardware_concurrency();
        num_threads = std::min(hardware_threads, max_useful_threads);
        num_threads = std::max<size_t>(1, num_threads);
    } else if (text_length > 0 && num_threads > text_length) {
        std::cerr << "Warning: requested " << num_threads << " threads for " << text_length
                  << " bytes, using " << text_length << std::endl;
        num_threads = text_length;
    }
    return num_threads;
}

void ParallelMatcher::search_chunk(const CompiledPattern& pattern, std::string_view haystack,
                                   ChunkContext& ctx) {
    // The window is the chunk plus enough lookahead to finish any match starting inside it
    std::string_view window = haystack.substr(0, ctx.scan_end);
    MatchStream stream = strsearch::find_all(pattern, window, ctx.start_pos);
    while (auto offset = stream.next()) {
        if (*offset >= ctx.end_pos) break;
        ctx.matches.push_back(*offset);
    }
}

/**
 * @brief Splits the haystack into chunks and runs one worker per chunk.
 *
 * 1. Resolves the thread count from the options and the input size
 * 2. Assigns chunk i the offsets [i * chunk_size, (i + 1) * chunk_size), the
 *    last chunk also taking the remainder
 * 3. Extends each scan window by |pattern| - 1 bytes of lookahead
 * 4. Starts the workers on the shared pattern and joins them all
 *
 * @return The chunk contexts with their matches, in chunk order
 * @throws InvalidArgumentError If @p pattern is not a Forward pattern
 */
std::vector<ChunkContext> ParallelMatcher::run(const CompiledPattern& pattern, std::string_view haystack,
                                               const ParallelOptions& opts) {
    if (pattern.direction() != Direction::Forward) {
        throw InvalidArgumentError("ParallelMatcher: only Forward patterns are supported");
    }
    if (haystack.empty()) return {};

    const size_t num_threads = resolve_thread_count(haystack.size(), opts);
    const size_t lookahead = pattern.size() - 1;

    // Divide work among threads
    std::vector<ChunkContext> contexts(num_threads);
    const size_t chunk_size = haystack.size() / num_threads;
    for (size_t i = 0; i < num_threads; ++i) {
        contexts[i].thread_id = i;
        contexts[i].start_pos = i * chunk_size;
        contexts[i].end_pos = (i + 1 < num_threads) ? (i + 1) * chunk_size : haystack.size();
        contexts[i].scan_end = std::min(haystack.size(), contexts[i].end_pos + lookahead);
    }

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        threads.emplace_back(&ParallelMatcher::search_chunk, this,
                             std::cref(pattern), haystack, std::ref(contexts[i]));
    }

    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    return contexts;
}

std::vector<size_t> ParallelMatcher::find_all(const CompiledPattern& pattern, std::string_view haystack,
                                              const ParallelOptions& opts) {
    auto contexts = run(pattern, haystack, opts);

    size_t total = 0;
    for (const auto& ctx : contexts) total += ctx.matches.size();

    std::vector<size_t> out;
    out.reserve(total);
    for (const auto& ctx : contexts) {
        out.insert(out.end(), ctx.matches.begin(), ctx.matches.end());
    }
    return out;
}

size_t ParallelMatcher::count_matches(const CompiledPattern& pattern, std::string_view haystack,
                                      const ParallelOptions& opts) {
    size_t total = 0;
    for (const auto& ctx : run(pattern, haystack, opts)) total += ctx.matches.size();
    return total;
}

} // namespace strsearch
