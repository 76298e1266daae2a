#pragma once
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace strsearch {

/**
 * @brief A non-owning (owner, start, length) view into a string.
 *
 * The owner is kept as a view of the whole underlying string so that the
 * slice can report its position and be re-sliced. The storage behind the
 * owner must outlive the slice; call copy() to obtain an owned string before
 * that storage goes away.
 *
 * Invariant: start() + size() <= underlying().size().
 */
class Slice {
public:
    Slice() = default;

    /**
     * @brief Creates a slice of @p owner covering [start, start + length).
     *
     * @throws InvalidIndexError If the range does not lie inside @p owner
     */
    static Slice make(std::string_view owner, size_t start, size_t length);

    /**
     * @brief A slice covering the whole of @p owner.
     */
    static Slice full(std::string_view owner) { return Slice(owner, 0, owner.size()); }

    size_t start() const { return start_; }
    size_t size() const { return length_; }
    bool empty() const { return length_ == 0; }

    /**
     * @brief The complete string this slice points into.
     */
    std::string_view underlying() const { return owner_; }

    std::string_view view() const { return owner_.substr(start_, length_); }

    /**
     * @brief Materializes the slice into an owned string.
     */
    std::string copy() const { return std::string(view()); }

    /**
     * @brief Byte at position @p i relative to the slice.
     * @throws InvalidIndexError If i >= size()
     */
    char at(size_t i) const;

    char operator[](size_t i) const { return owner_[start_ + i]; }

    /**
     * @brief Sub-slice [offset, offset + length) relative to this slice.
     * @throws InvalidIndexError If the range does not lie inside this slice
     */
    Slice sub(size_t offset, size_t length) const;

    friend bool operator==(const Slice& a, std::string_view b) { return a.view() == b; }
    friend bool operator==(std::string_view a, const Slice& b) { return a == b.view(); }
    friend bool operator!=(const Slice& a, std::string_view b) { return !(a == b); }
    friend bool operator!=(std::string_view a, const Slice& b) { return !(a == b); }

private:
    Slice(std::string_view owner, size_t start, size_t length)
        : owner_(owner), start_(start), length_(length) {}

    friend class SliceStream;

    std::string_view owner_;
    size_t start_ = 0;
    size_t length_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Slice& slice);

} // namespace strsearch
