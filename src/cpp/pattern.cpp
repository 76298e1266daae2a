#include "pattern.hpp"
#include "errors.hpp"
#include <algorithm>

namespace strsearch {

/**
 * @brief Computes the KMP failure function of @p p.
 *
 * fail[0] and fail[1] are 0. For k >= 2 the candidate border is extended by
 * one byte when possible and otherwise shortened through the table itself,
 * giving O(|p|) total work.
 */
static std::vector<size_t> build_failure(std::string_view p) {
    std::vector<size_t> fail(p.size() + 1, 0);
    size_t k = 0;
    for (size_t i = 1; i < p.size(); ++i) {
        while (k > 0 && p[i] != p[k]) k = fail[k];
        if (p[i] == p[k]) ++k;
        fail[i + 1] = k;
    }
    return fail;
}

std::string CompiledPattern::pattern() const {
    if (direction_ == Direction::Forward) return oriented_;
    return std::string(oriented_.rbegin(), oriented_.rend());
}

CompiledPattern compile(std::string_view pattern, Direction direction) {
    if (pattern.empty()) {
        throw InvalidPatternError("compile: pattern must be non-empty");
    }

    std::string oriented(pattern);
    if (direction == Direction::Reverse) {
        std::reverse(oriented.begin(), oriented.end());
    }
    auto fail = build_failure(oriented);
    return CompiledPattern(std::move(oriented), std::move(fail), direction);
}

CompiledPattern compile_reversed(std::string_view pattern) {
    return compile(pattern, Direction::Reverse);
}

} // namespace strsearch
