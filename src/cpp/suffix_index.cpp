#include "suffix_index.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstdint>
#include <string>

namespace strsearch {

/**
 * @brief Pattern bytes as unsigned symbols, the alphabet sdsl indexes by.
 */
static std::vector<uint8_t> symbols(const char* fn, std::string_view pattern) {
    if (pattern.empty()) {
        throw InvalidPatternError(std::string(fn) + ": pattern must be non-empty");
    }
    return std::vector<uint8_t>(pattern.begin(), pattern.end());
}

SuffixIndex::SuffixIndex(std::string_view text) : text_size_(text.size()) {
    if (text.find('\0') != std::string_view::npos) {
        throw InvalidArgumentError("SuffixIndex: text must not contain NUL bytes");
    }
    if (text.empty()) return;

    // sdsl-lite will automatically add the sentinel when needed
    std::string tmp(text);
    sdsl::construct_im(cst_, tmp, 1);
}

size_t SuffixIndex::count(std::string_view pattern) const {
    auto pat = symbols("SuffixIndex::count", pattern);
    if (pattern.size() > text_size_) return 0;
    return sdsl::count(cst_.csa, pat.begin(), pat.end());
}

std::vector<size_t> SuffixIndex::locate(std::string_view pattern) const {
    auto pat = symbols("SuffixIndex::locate", pattern);
    if (pattern.size() > text_size_) return {};

    auto occs = sdsl::locate(cst_.csa, pat.begin(), pat.end());
    std::vector<size_t> out(occs.begin(), occs.end());
    std::sort(out.begin(), out.end());
    return out;
}

size_t SuffixIndex::longest_common_prefix(size_t i, size_t j) const {
    if (i >= text_size_ || j >= text_size_) {
        throw InvalidIndexError("SuffixIndex::longest_common_prefix: offsets " + std::to_string(i) + ", " +
                                std::to_string(j) + " outside text of length " + std::to_string(text_size_));
    }
    if (i == j) return text_size_ - i;
    auto lca = cst_.lca(cst_.select_leaf(cst_.csa.isa[i] + 1), cst_.select_leaf(cst_.csa.isa[j] + 1));
    return cst_.depth(lca);
}

} // namespace strsearch
