#include "replace.hpp"
#include "errors.hpp"
#include "matcher.hpp"

namespace strsearch {

static std::string splice(std::string_view s, size_t at, size_t len, std::string_view by) {
    std::string out;
    out.reserve(s.size() - len + by.size());
    out.append(s.substr(0, at));
    out.append(by);
    out.append(s.substr(at + len));
    return out;
}

std::string replace(std::string_view s, std::string_view sub, std::string_view by,
                    const ReplaceOptions& opts) {
    if (sub.empty()) {
        throw InvalidArgumentError("replace: sub must be non-empty");
    }

    switch (opts.which) {
    case Which::Left: {
        auto at = find(compile(sub, Direction::Forward), s, 0);
        return at ? splice(s, *at, sub.size(), by) : std::string(s);
    }
    case Which::Right: {
        auto at = find(compile(sub, Direction::Reverse), s, s.size());
        return at ? splice(s, *at, sub.size(), by) : std::string(s);
    }
    case Which::All:
        break;
    }

    // Restart the search past each replaced occurrence so replacements never overlap
    const auto cp = compile(sub, Direction::Forward);
    std::string out;
    size_t pos = 0;
    while (auto at = find(cp, s, pos)) {
        out.append(s.substr(pos, *at - pos));
        out.append(by);
        pos = *at + sub.size();
    }
    out.append(s.substr(pos));
    return out;
}

} // namespace strsearch
