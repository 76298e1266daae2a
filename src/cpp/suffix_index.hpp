#pragma once
#include <sdsl/suffix_trees.hpp>
#include <cstddef>
#include <string_view>
#include <vector>

namespace strsearch {

using cst_t = sdsl::cst_sada<>;

/**
 * @brief Compressed suffix tree over one fixed haystack.
 *
 * Where a CompiledPattern is reused across many haystacks, a SuffixIndex is
 * reused across many patterns: after an O(n) construction every query costs
 * time proportional to the pattern length (plus the number of occurrences
 * for locate()), independent of the haystack size.
 *
 * The index copies the text; the caller's storage may be released after
 * construction. Queries are const and safe to run concurrently.
 */
class SuffixIndex {
public:
    /**
     * @brief Builds the index in memory.
     *
     * @param text Haystack to index; may be empty but must not contain NUL
     *             bytes, which sdsl reserves for the sentinel
     * @throws InvalidArgumentError If @p text contains a NUL byte
     */
    explicit SuffixIndex(std::string_view text);

    /**
     * @brief Length of the indexed text in bytes.
     */
    size_t size() const { return text_size_; }

    /**
     * @brief Number of (possibly overlapping) occurrences of @p pattern.
     * @throws InvalidPatternError If @p pattern is empty
     */
    size_t count(std::string_view pattern) const;

    /**
     * @brief Start offsets of every occurrence of @p pattern, ascending.
     *
     * Returns the same offsets as find_all_list(compile(pattern), text).
     *
     * @throws InvalidPatternError If @p pattern is empty
     */
    std::vector<size_t> locate(std::string_view pattern) const;

    bool contains(std::string_view pattern) const { return count(pattern) > 0; }

    /**
     * @brief Length of the longest common prefix of the suffixes starting at @p i and @p j.
     *
     * Computed as the string depth of the lowest common ancestor of the two
     * leaves.
     *
     * @throws InvalidIndexError If @p i or @p j is not a valid text offset
     */
    size_t longest_common_prefix(size_t i, size_t j) const;

private:
    cst_t cst_;
    size_t text_size_;
};

} // namespace strsearch
