#include "matcher.hpp"
#include "errors.hpp"
#include <string>

namespace strsearch {

/**
 * @brief Validates a search cursor before any scanning takes place.
 */
static void check_start(const char* fn, std::string_view haystack, size_t start) {
    if (start > haystack.size()) {
        throw InvalidIndexError(std::string(fn) + ": start " + std::to_string(start) +
                                " is outside [0, " + std::to_string(haystack.size()) + "]");
    }
}

/**
 * @brief Feeds one haystack byte to the KMP automaton.
 *
 * Shared by both directions: the pattern is already stored in scanning
 * orientation, so only the order in which bytes are fed differs.
 *
 * @return true when the whole pattern has just been matched
 */
static bool step(const CompiledPattern& cp, size_t& matched, char c) {
    const std::string_view p = cp.oriented();
    const auto& fail = cp.failure();
    while (matched > 0 && p[matched] != c) matched = fail[matched];
    if (p[matched] == c) ++matched;
    return matched == p.size();
}

MatchStream::MatchStream(const CompiledPattern& pattern, std::string_view haystack, size_t start)
    : pattern_(&pattern), haystack_(haystack), pos_(start), matched_(0) {
    check_start("find_all", haystack, start);
}

std::optional<size_t> MatchStream::next() {
    return pattern_->direction() == Direction::Forward ? next_forward() : next_reverse();
}

std::optional<size_t> MatchStream::next_forward() {
    const size_t m = pattern_->size();
    while (pos_ < haystack_.size()) {
        if (step(*pattern_, matched_, haystack_[pos_++])) {
            // Fall back instead of resetting so overlapping occurrences are found
            matched_ = pattern_->failure()[m];
            return pos_ - m;
        }
    }
    return std::nullopt;
}

std::optional<size_t> MatchStream::next_reverse() {
    const size_t m = pattern_->size();
    while (pos_ > 0) {
        if (step(*pattern_, matched_, haystack_[--pos_])) {
            matched_ = pattern_->failure()[m];
            // The byte just read is the leftmost byte of the occurrence
            return pos_;
        }
    }
    return std::nullopt;
}

// ------------- single match -------------

std::optional<size_t> find(const CompiledPattern& pattern, std::string_view haystack, size_t start) {
    check_start("find", haystack, start);
    return MatchStream(pattern, haystack, start).next();
}

std::optional<size_t> find(const CompiledPattern& pattern, std::string_view haystack) {
    return find(pattern, haystack, pattern.direction() == Direction::Forward ? 0 : haystack.size());
}

std::optional<size_t> find(std::string_view sub, std::string_view haystack, size_t start) {
    check_start("find", haystack, start);
    auto cp = compile(sub, Direction::Forward);
    return find(cp, haystack, start);
}

std::optional<size_t> rfind(std::string_view sub, std::string_view haystack) {
    auto cp = compile(sub, Direction::Reverse);
    return find(cp, haystack, haystack.size());
}

// ------------- all matches -------------

MatchStream find_all(const CompiledPattern& pattern, std::string_view haystack, size_t start) {
    return MatchStream(pattern, haystack, start);
}

MatchStream find_all(const CompiledPattern& pattern, std::string_view haystack) {
    return find_all(pattern, haystack, pattern.direction() == Direction::Forward ? 0 : haystack.size());
}

std::vector<size_t> find_all_list(const CompiledPattern& pattern, std::string_view haystack, size_t start) {
    std::vector<size_t> out;
    find_all_stream(pattern, haystack, start, [&](size_t offset){ out.push_back(offset); });
    return out;
}

std::vector<size_t> find_all_list(const CompiledPattern& pattern, std::string_view haystack) {
    return find_all_list(pattern, haystack, pattern.direction() == Direction::Forward ? 0 : haystack.size());
}

size_t count_matches(const CompiledPattern& pattern, std::string_view haystack, size_t start) {
    return find_all_stream(pattern, haystack, start, [](size_t){});
}

size_t count_matches(const CompiledPattern& pattern, std::string_view haystack) {
    return count_matches(pattern, haystack, pattern.direction() == Direction::Forward ? 0 : haystack.size());
}

bool contains(const CompiledPattern& pattern, std::string_view haystack, size_t start) {
    return find(pattern, haystack, start).has_value();
}

bool contains(const CompiledPattern& pattern, std::string_view haystack) {
    return find(pattern, haystack).has_value();
}

} // namespace strsearch
