#pragma once
#include <stdexcept>
#include <string>

namespace strsearch {

/**
 * @brief Thrown when an empty pattern is passed where a non-empty one is required.
 *
 * Callers that want "the empty pattern matches everywhere" semantics must
 * special-case the empty string before compiling.
 */
class InvalidPatternError : public std::invalid_argument {
public:
    explicit InvalidPatternError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Thrown when a cursor or slice bound lies outside [0, length].
 */
class InvalidIndexError : public std::out_of_range {
public:
    explicit InvalidIndexError(const std::string& what) : std::out_of_range(what) {}
};

/**
 * @brief Thrown for malformed arguments other than patterns and indices
 * (empty separators, unsupported directions, NUL bytes in indexed text).
 */
class InvalidArgumentError : public std::invalid_argument {
public:
    explicit InvalidArgumentError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Thrown only by the *_or_throw variants when a separator does not occur.
 */
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace strsearch
