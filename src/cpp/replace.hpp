#pragma once
#include <string>
#include <string_view>

namespace strsearch {

/**
 * @brief Which occurrences replace() rewrites.
 */
enum class Which {
    Left,   /**< First occurrence from the left */
    Right,  /**< First occurrence from the right */
    All     /**< Every non-overlapping occurrence, scanned left-to-right */
};

/**
 * @brief Options for replace().
 */
struct ReplaceOptions {
    Which which = Which::All;  /**< Occurrences to replace */
};

/**
 * @brief Replaces occurrences of @p sub in @p s with @p by.
 *
 * replace("  abab cdabb a", "ab", "hello") == "  hellohello cdhellob a".
 * When @p sub does not occur the result is a copy of @p s.
 *
 * @param s Input string
 * @param sub Non-empty literal to replace
 * @param by Replacement text
 * @param opts Which occurrences to replace (default: all)
 * @return The rewritten string
 * @throws InvalidArgumentError If @p sub is empty
 */
std::string replace(std::string_view s, std::string_view sub, std::string_view by,
                    const ReplaceOptions& opts = {});

} // namespace strsearch
