/**
 * @file bindings.cpp
 * @brief Python bindings for the strsearch library.
 *
 * Exposes precompiled KMP search, splitting, replacement, edit distance,
 * file-based search and the suffix index. Haystacks are accepted as any
 * bytes-like object and searched without copying; the GIL is released while
 * the C++ code runs.
 *
 * Error mapping:
 * - InvalidPatternError, InvalidArgumentError -> ValueError
 * - InvalidIndexError -> IndexError
 * - NotFoundError -> KeyError
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/pytypes.h>
#include <optional>
#include <string>
#include <string_view>
#include <stdexcept>
#include "edit_distance.hpp"
#include "errors.hpp"
#include "file_search.hpp"
#include "matcher.hpp"
#include "parallel_matcher.hpp"
#include "pattern.hpp"
#include "replace.hpp"
#include "splitter.hpp"
#include "suffix_index.hpp"
#include "version.hpp"

namespace py = pybind11;
using namespace strsearch;

/**
 * @brief Views a 1-byte-per-item contiguous Python buffer as a string_view.
 */
static std::string_view buffer_view(const py::buffer_info& info, const char* fn) {
    if (info.itemsize != 1) {
        throw std::invalid_argument(std::string(fn) + ": buffer must be a bytes-like object with itemsize==1");
    }
    if (info.ndim != 1) {
        throw std::invalid_argument(std::string(fn) + ": buffer must be a 1-dimensional bytes-like object");
    }
    return std::string_view(static_cast<const char*>(info.ptr), static_cast<size_t>(info.size));
}

static size_t natural_start(const CompiledPattern& cp, std::string_view haystack, std::optional<size_t> start) {
    if (start) return *start;
    return cp.direction() == Direction::Forward ? 0 : haystack.size();
}

static py::tuple slice_pair(const std::pair<Slice, Slice>& parts) {
    return py::make_tuple(py::bytes(parts.first.copy()), py::bytes(parts.second.copy()));
}

PYBIND11_MODULE(_strsearch, m) {
    m.doc() = "Precompiled substring search, splitting and edit distance\n\n"
              "This module provides linear-time KMP search with forward and reverse patterns.";

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const NotFoundError& e) {
            PyErr_SetString(PyExc_KeyError, e.what());
        }
    });

    py::enum_<Direction>(m, "Direction", "Scanning direction of a compiled pattern")
        .value("Forward", Direction::Forward)
        .value("Reverse", Direction::Reverse);

    py::enum_<Which>(m, "Which", "Occurrences rewritten by replace()")
        .value("Left", Which::Left)
        .value("Right", Which::Right)
        .value("All", Which::All);

    py::class_<CompiledPattern>(m, "CompiledPattern", "Immutable KMP search structure for one literal pattern")
        .def_property_readonly("pattern", [](const CompiledPattern& cp) { return py::bytes(cp.pattern()); },
                               "The pattern in its original reading order")
        .def_property_readonly("direction", &CompiledPattern::direction, "Forward or Reverse")
        .def_property_readonly("failure", &CompiledPattern::failure, "KMP failure table over the oriented pattern")
        .def("__len__", &CompiledPattern::size);

    m.def("compile", [](const std::string& pattern, Direction direction) {
        return strsearch::compile(pattern, direction);
    }, py::arg("pattern"), py::arg("direction") = Direction::Forward, R"doc(Compile a literal pattern.

Args:
    pattern: Non-empty str or bytes
    direction: Direction.Forward (default) or Direction.Reverse

Returns:
    CompiledPattern reusable across any number of searches

Raises:
    ValueError: if pattern is empty
)doc");

    m.def("compile_reversed", [](const std::string& pattern) {
        return strsearch::compile_reversed(pattern);
    }, py::arg("pattern"), "Shorthand for compile(pattern, Direction.Reverse).");

    m.def("find", [](const CompiledPattern& cp, py::buffer b, std::optional<size_t> start) {
        py::buffer_info info = b.request();
        std::string_view sv = buffer_view(info, "find");
        size_t from = natural_start(cp, sv, start);

        py::gil_scoped_release release;
        return strsearch::find(cp, sv, from);
    }, py::arg("pattern"), py::arg("data"), py::arg("start") = py::none(), R"doc(Find the next occurrence of a compiled pattern.

Forward patterns search right of `start` (default 0); Reverse patterns treat
`start` as an exclusive right boundary (default len(data)).

Returns:
    Offset of the occurrence or None

Raises:
    IndexError: if start > len(data)
)doc");

    m.def("find_all", [](const CompiledPattern& cp, py::buffer b, std::optional<size_t> start) {
        py::buffer_info info = b.request();
        std::string_view sv = buffer_view(info, "find_all");
        size_t from = natural_start(cp, sv, start);

        py::gil_scoped_release release;
        return strsearch::find_all_list(cp, sv, from);
    }, py::arg("pattern"), py::arg("data"), py::arg("start") = py::none(), R"doc(Find every occurrence, overlapping ones included.

Returns:
    List of offsets, ascending for Forward and descending for Reverse patterns

Raises:
    IndexError: if start > len(data)
)doc");

    m.def("count_matches", [](const CompiledPattern& cp, py::buffer b) {
        py::buffer_info info = b.request();
        std::string_view sv = buffer_view(info, "count_matches");

        py::gil_scoped_release release;
        return strsearch::count_matches(cp, sv);
    }, py::arg("pattern"), py::arg("data"), "Count occurrences, overlapping ones included.");

    m.def("contains", [](const CompiledPattern& cp, py::buffer b) {
        py::buffer_info info = b.request();
        std::string_view sv = buffer_view(info, "contains");

        py::gil_scoped_release release;
        return strsearch::contains(cp, sv);
    }, py::arg("pattern"), py::arg("data"), "True iff the pattern occurs in data.");

    m.def("parallel_find_all", [](const CompiledPattern& cp, py::buffer b, size_t num_threads) {
        py::buffer_info info = b.request();
        std::string_view sv = buffer_view(info, "parallel_find_all");
        ParallelOptions opts;
        opts.num_threads = num_threads;

        py::gil_scoped_release release;
        ParallelMatcher matcher;
        return matcher.find_all(cp, sv, opts);
    }, py::arg("pattern"), py::arg("data"), py::arg("num_threads") = 0, R"doc(Multi-threaded find_all for Forward patterns.

Args:
    num_threads: Worker count, 0 to pick one from the input size

Raises:
    ValueError: if the pattern is not a Forward pattern
)doc");

    m.def("split_all", [](py::buffer b, const std::string& separator) {
        py::buffer_info info = b.request();
        std::string_view sv = buffer_view(info, "split_all");

        std::vector<std::pair<size_t, size_t>> out;
        {
            py::gil_scoped_release release;
            SliceStream stream = strsearch::split_all(sv, separator);
            while (auto piece = stream.next()) out.emplace_back(piece->start(), piece->size());
        }
        return out;
    }, py::arg("data"), py::arg("separator"), R"doc(Split data along every occurrence of separator.

Returns:
    List of (start, length) slices into data

Raises:
    ValueError: if separator is empty
)doc");

    m.def("split_all_copy", [](const std::string& data, const std::string& separator) {
        py::list out;
        for (auto& piece : strsearch::split_all_copy(data, separator)) out.append(py::bytes(piece));
        return out;
    }, py::arg("data"), py::arg("separator"), "split_all returning copies of every slice as bytes.");

    m.def("split_first", [](const std::string& data, const std::string& separator) -> py::object {
        auto parts = strsearch::split_first(data, separator);
        if (!parts) return py::none();
        return slice_pair(*parts);
    }, py::arg("data"), py::arg("separator"), "Split on the leftmost occurrence; None if absent.");

    m.def("split_last", [](const std::string& data, const std::string& separator) -> py::object {
        auto parts = strsearch::split_last(data, separator);
        if (!parts) return py::none();
        return slice_pair(*parts);
    }, py::arg("data"), py::arg("separator"), "Split on the rightmost occurrence; None if absent.");

    m.def("split_last_or_throw", [](const std::string& data, const std::string& separator) {
        return slice_pair(strsearch::split_last_or_throw(data, separator));
    }, py::arg("data"), py::arg("separator"), "Split on the rightmost occurrence; raises KeyError if absent.");

    m.def("replace", [](const std::string& s, const std::string& sub, const std::string& by, Which which) {
        ReplaceOptions opts;
        opts.which = which;
        return py::bytes(strsearch::replace(s, sub, by, opts));
    }, py::arg("s"), py::arg("sub"), py::arg("by"), py::arg("which") = Which::All,
       "Replace occurrences of sub by `by`; raises ValueError if sub is empty.");

    m.def("edit_distance", [](const std::string& a, const std::string& b) {
        py::gil_scoped_release release;
        return strsearch::edit_distance(a, b);
    }, py::arg("a"), py::arg("b"), "Levenshtein distance between two strings.");

    // File-based search
    m.def("find_all_file", [](const CompiledPattern& cp, const std::string& path) {
        py::gil_scoped_release release;
        return strsearch::find_all_file(cp, path);
    }, py::arg("pattern"), py::arg("path"), "find_all over a plain or gzip-compressed file.");

    m.def("count_matches_file", [](const CompiledPattern& cp, const std::string& path) {
        py::gil_scoped_release release;
        return strsearch::count_matches_file(cp, path);
    }, py::arg("pattern"), py::arg("path"), "count_matches over a plain or gzip-compressed file.");

    m.def("write_matches_binary_file", [](const CompiledPattern& cp, const std::string& in_path,
                                          const std::string& out_path) {
        py::gil_scoped_release release;
        return strsearch::write_matches_binary_file(cp, in_path, out_path);
    }, py::arg("pattern"), py::arg("in_path"), py::arg("out_path"), R"doc(Write match offsets to a binary file.

Each offset is one uint64 in host byte order; the output is gzip-compressed
when out_path ends in ".gz".

Returns:
    Number of offsets written
)doc");

    py::class_<SuffixIndex>(m, "SuffixIndex", "Compressed suffix tree over one haystack")
        .def(py::init([](py::buffer b) {
            py::buffer_info info = b.request();
            std::string_view sv = buffer_view(info, "SuffixIndex");
            py::gil_scoped_release release;
            return new SuffixIndex(sv);
        }), py::arg("data"))
        .def("count", [](const SuffixIndex& idx, const std::string& p) { return idx.count(p); }, py::arg("pattern"))
        .def("locate", [](const SuffixIndex& idx, const std::string& p) { return idx.locate(p); }, py::arg("pattern"))
        .def("contains", [](const SuffixIndex& idx, const std::string& p) { return idx.contains(p); }, py::arg("pattern"))
        .def("longest_common_prefix", &SuffixIndex::longest_common_prefix, py::arg("i"), py::arg("j"))
        .def("__len__", &SuffixIndex::size);

    // Version information
    m.attr("__version__") = std::to_string(strsearch::VERSION_MAJOR) + "." + std::to_string(strsearch::VERSION_MINOR) + "." + std::to_string(strsearch::VERSION_PATCH);
}
