#pragma once
#include <cstddef>
#include <string_view>

namespace strsearch {

/**
 * @brief Computes the Levenshtein distance between two strings.
 *
 * The result is the minimum number of single-byte insertions, deletions and
 * substitutions turning @p a into @p b. It is a metric: zero exactly on equal
 * inputs, symmetric, and satisfies the triangle inequality.
 *
 * Runs the classic dynamic program in O(|a| * |b|) time but keeps only two
 * rows, each sized to the shorter input, so memory is O(min(|a|, |b|)).
 *
 * @param a First string
 * @param b Second string
 * @return The edit distance; edit_distance("", s) == s.size()
 */
size_t edit_distance(std::string_view a, std::string_view b);

} // namespace strsearch
