#include "slice.hpp"
#include "errors.hpp"

namespace strsearch {

static void check_range(const char* fn, size_t total, size_t start, size_t length) {
    if (start > total || length > total - start) {
        throw InvalidIndexError(std::string(fn) + ": range [" + std::to_string(start) + ", " +
                                std::to_string(start) + "+" + std::to_string(length) +
                                ") exceeds length " + std::to_string(total));
    }
}

Slice Slice::make(std::string_view owner, size_t start, size_t length) {
    check_range("Slice::make", owner.size(), start, length);
    return Slice(owner, start, length);
}

char Slice::at(size_t i) const {
    if (i >= length_) {
        throw InvalidIndexError("Slice::at: index " + std::to_string(i) +
                                " out of range for slice of length " + std::to_string(length_));
    }
    return owner_[start_ + i];
}

Slice Slice::sub(size_t offset, size_t length) const {
    check_range("Slice::sub", length_, offset, length);
    return Slice(owner_, start_ + offset, length);
}

std::ostream& operator<<(std::ostream& os, const Slice& slice) {
    return os << '"' << slice.view() << '"';
}

} // namespace strsearch
