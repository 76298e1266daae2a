#include "splitter.hpp"
#include "errors.hpp"
#include "matcher.hpp"

namespace strsearch {

static void check_separator(const char* fn, std::string_view separator) {
    if (separator.empty()) {
        throw InvalidArgumentError(std::string(fn) + ": separator must be non-empty");
    }
}

SliceStream::SliceStream(std::string_view haystack, std::string_view separator)
    : haystack_(haystack), byte_(0), sep_len_(separator.size()), pos_(0), done_(false) {
    check_separator("split_all", separator);
    // A single byte is located with a direct scan; longer separators get a KMP table
    if (separator.size() == 1) {
        byte_ = separator[0];
    } else {
        pattern_ = compile(separator, Direction::Forward);
    }
}

std::optional<size_t> SliceStream::find_separator() const {
    if (!pattern_) {
        size_t i = haystack_.find(byte_, pos_);
        if (i == std::string_view::npos) return std::nullopt;
        return i;
    }
    return find(*pattern_, haystack_, pos_);
}

/**
 * @brief Emits the slice up to the next separator and moves past it.
 *
 * The search for the following separator starts at the end of the one just
 * consumed, never inside it. When no separator remains the tail from the
 * cursor to the end of the haystack is emitted once, even if it is empty.
 *
 * @return The next slice, or std::nullopt after the trailing slice
 */
std::optional<Slice> SliceStream::next() {
    if (done_) return std::nullopt;

    auto match = find_separator();
    if (!match) {
        done_ = true;
        return Slice(haystack_, pos_, haystack_.size() - pos_);
    }
    Slice piece(haystack_, pos_, *match - pos_);
    pos_ = *match + sep_len_;
    return piece;
}

SliceStream split_all(std::string_view haystack, std::string_view separator) {
    return SliceStream(haystack, separator);
}

std::vector<Slice> split_all_slices(std::string_view haystack, std::string_view separator) {
    std::vector<Slice> out;
    SliceStream stream = split_all(haystack, separator);
    while (auto piece = stream.next()) out.push_back(*piece);
    return out;
}

std::vector<std::string> split_all_copy(std::string_view haystack, std::string_view separator) {
    std::vector<std::string> out;
    SliceStream stream = split_all(haystack, separator);
    while (auto piece = stream.next()) out.push_back(piece->copy());
    return out;
}

/**
 * @brief Builds the (before, after) pair around a separator occurrence at @p at.
 */
static std::pair<Slice, Slice> around(std::string_view haystack, size_t at, size_t sep_len) {
    return {Slice::make(haystack, 0, at),
            Slice::make(haystack, at + sep_len, haystack.size() - at - sep_len)};
}

std::optional<std::pair<Slice, Slice>> split_first(std::string_view haystack, std::string_view separator) {
    check_separator("split_first", separator);
    auto at = find(compile(separator, Direction::Forward), haystack, 0);
    if (!at) return std::nullopt;
    return around(haystack, *at, separator.size());
}

std::optional<std::pair<Slice, Slice>> split_last(std::string_view haystack, std::string_view separator) {
    check_separator("split_last", separator);
    auto at = find(compile(separator, Direction::Reverse), haystack, haystack.size());
    if (!at) return std::nullopt;
    return around(haystack, *at, separator.size());
}

std::pair<Slice, Slice> split_first_or_throw(std::string_view haystack, std::string_view separator) {
    auto parts = split_first(haystack, separator);
    if (!parts) {
        throw NotFoundError("split_first: separator \"" + std::string(separator) + "\" not found");
    }
    return *parts;
}

std::pair<Slice, Slice> split_last_or_throw(std::string_view haystack, std::string_view separator) {
    auto parts = split_last(haystack, separator);
    if (!parts) {
        throw NotFoundError("split_last: separator \"" + std::string(separator) + "\" not found");
    }
    return *parts;
}

std::vector<std::string> lines(std::string_view s) {
    return split_all_copy(s, "\n");
}

std::string unlines(const std::vector<std::string>& parts) {
    return join(parts, "\n");
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    size_t total = 0;
    for (const auto& p : parts) total += p.size();
    if (!parts.empty()) total += separator.size() * (parts.size() - 1);

    std::string out;
    out.reserve(total);
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out.append(separator);
        out.append(parts[i]);
    }
    return out;
}

} // namespace strsearch
