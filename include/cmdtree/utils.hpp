#ifndef CMDTREE_UTILS_HPP
#define CMDTREE_UTILS_HPP

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cmdtree::utils {

inline std::string_view trimWs(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// "a, ag ,x" -> {"a", "ag", "x"}. Empty parts are dropped.
inline std::vector<std::string> splitList(std::string_view s, char sep = ',') {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= s.size()) {
        const auto pos = s.find(sep, start);
        const auto part = trimWs(pos == std::string_view::npos ? s.substr(start) : s.substr(start, pos - start));
        if (!part.empty()) out.emplace_back(part);
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return out;
}

inline bool contains(const std::vector<std::string>& values, std::string_view v) {
    for (const auto& x : values) {
        if (x == v) return true;
    }
    return false;
}

} // namespace cmdtree::utils

#endif // CMDTREE_UTILS_HPP
