#include "edit_distance.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace strsearch {

size_t edit_distance(std::string_view a, std::string_view b) {
    // Columns follow the shorter string
    if (b.size() > a.size()) std::swap(a, b);
    if (b.empty()) return a.size();

    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            if (a[i - 1] == b[j - 1]) {
                cur[j] = prev[j - 1];
            } else {
                cur[j] = 1 + std::min({prev[j], cur[j - 1], prev[j - 1]});
            }
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

} // namespace strsearch
