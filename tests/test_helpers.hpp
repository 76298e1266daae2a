#pragma once
#include <cstddef>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace strsearch_test {

/**
 * @brief Every offset i with haystack[i, i + |sub|) == sub, overlapping, ascending.
 */
inline std::vector<size_t> brute_force_offsets(std::string_view haystack, std::string_view sub) {
    std::vector<size_t> out;
    if (sub.size() > haystack.size()) return out;
    for (size_t i = 0; i + sub.size() <= haystack.size(); ++i) {
        if (haystack.compare(i, sub.size(), sub) == 0) out.push_back(i);
    }
    return out;
}

/**
 * @brief Number of non-overlapping occurrences scanned left-to-right.
 */
inline size_t brute_force_non_overlapping(std::string_view haystack, std::string_view sub) {
    size_t n = 0;
    size_t i = 0;
    while (i + sub.size() <= haystack.size()) {
        if (haystack.compare(i, sub.size(), sub) == 0) {
            ++n;
            i += sub.size();
        } else {
            ++i;
        }
    }
    return n;
}

/**
 * @brief Random string of @p length bytes drawn from @p alphabet.
 *
 * Small alphabets make repeated and overlapping occurrences common.
 */
inline std::string random_string(std::mt19937& rng, size_t length, std::string_view alphabet) {
    std::uniform_int_distribution<size_t> pick(0, alphabet.size() - 1);
    std::string s(length, '\0');
    for (auto& c : s) c = alphabet[pick(rng)];
    return s;
}

inline size_t random_size(std::mt19937& rng, size_t lo, size_t hi) {
    return std::uniform_int_distribution<size_t>(lo, hi)(rng);
}

} // namespace strsearch_test
