#include "file_search.hpp"
#include "errors.hpp"
#include "gzip_io.hpp"
#include "matcher.hpp"
#include "splitter.hpp"
#include <cstdint>

namespace strsearch {

std::string read_text_file(const std::string& path) {
    GzipReader reader(path);
    return reader.read_all();
}

std::vector<size_t> find_all_file(const CompiledPattern& pattern, const std::string& path) {
    const std::string text = read_text_file(path);
    return find_all_list(pattern, text);
}

size_t count_matches_file(const CompiledPattern& pattern, const std::string& path) {
    const std::string text = read_text_file(path);
    return count_matches(pattern, text);
}

std::vector<std::string> split_file(const std::string& path, std::string_view separator) {
    if (separator.empty()) {
        throw InvalidArgumentError("split_file: separator must be non-empty");
    }
    const std::string text = read_text_file(path);
    return split_all_copy(text, separator);
}

size_t write_matches_binary_file(const CompiledPattern& pattern, const std::string& in_path,
                                 const std::string& out_path) {
    const std::string text = read_text_file(in_path);
    GzipWriter out(out_path, has_gz_extension(out_path));
    size_t n = find_all_stream(pattern, text, pattern.direction() == Direction::Forward ? 0 : text.size(),
                               [&](size_t offset){
        uint64_t value = static_cast<uint64_t>(offset);
        out.write(&value, sizeof(value));
    });
    out.close();
    return n;
}

} // namespace strsearch
