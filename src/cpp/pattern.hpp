#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace strsearch {

/**
 * @brief Scanning direction a pattern is compiled for.
 */
enum class Direction {
    Forward,  /**< Haystack is scanned left-to-right */
    Reverse   /**< Haystack is scanned right-to-left from a right boundary */
};

class CompiledPattern;

/**
 * @brief Compiles a literal pattern into a reusable search structure.
 *
 * Builds the Knuth-Morris-Pratt failure function over the pattern read in
 * the scanning orientation of @p direction. The resulting structure bounds
 * every subsequent search to O(|pattern| + |haystack scanned|) byte
 * comparisons, independent of alphabet size.
 *
 * @param pattern Literal pattern, must be non-empty
 * @param direction Forward (default) or Reverse
 * @return The compiled pattern
 * @throws InvalidPatternError If @p pattern is empty
 */
CompiledPattern compile(std::string_view pattern, Direction direction = Direction::Forward);

/**
 * @brief An immutable, reusable KMP search structure for one literal pattern.
 *
 * The pattern bytes are stored in scanning orientation (reversed for
 * Direction::Reverse) together with the failure table built over that
 * orientation, so the matcher's inner loop does not depend on the direction.
 * The direction is fixed at construction.
 *
 * A CompiledPattern holds no mutable state and may be shared by any number of
 * concurrent searches.
 */
class CompiledPattern {
public:
    /**
     * @brief Length of the pattern in bytes (always > 0).
     */
    size_t size() const { return oriented_.size(); }

    Direction direction() const { return direction_; }

    /**
     * @brief The pattern in its original reading order.
     */
    std::string pattern() const;

    /**
     * @brief The pattern bytes in scanning orientation.
     */
    std::string_view oriented() const { return oriented_; }

    /**
     * @brief KMP failure table, |pattern| + 1 entries.
     *
     * failure()[k] is the length of the longest proper prefix of oriented()
     * that is also a suffix of oriented()[0, k).
     */
    const std::vector<size_t>& failure() const { return failure_; }

private:
    CompiledPattern(std::string oriented, std::vector<size_t> failure, Direction direction)
        : oriented_(std::move(oriented)), failure_(std::move(failure)), direction_(direction) {}

    friend CompiledPattern compile(std::string_view pattern, Direction direction);

    std::string oriented_;
    std::vector<size_t> failure_;
    Direction direction_;
};

/**
 * @brief Shorthand for compile(pattern, Direction::Reverse).
 */
CompiledPattern compile_reversed(std::string_view pattern);

} // namespace strsearch
