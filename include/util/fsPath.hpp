#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include <boost/algorithm/string.hpp>

namespace ferry::util {

inline std::string trim(const std::string& str) {
    return boost::algorithm::trim_copy(str);
}

inline bool hasWildcard(const std::string_view s) {
    return s.find_first_of("*?") != std::string_view::npos;
}

inline bool isSeparator(const char c) { return c == '/' || c == '\\'; }

inline bool hasTrailingSeparator(const std::string_view s) {
    return !s.empty() && isSeparator(s.back());
}

// Backslashes become forward slashes, runs of separators collapse to one.
inline std::string normalizeSeparators(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (const char c : path) {
        const char n = c == '\\' ? '/' : c;
        if (n == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(n);
    }
    return out;
}

inline std::vector<std::string> splitSegments(const std::string& path, const std::string& separators = "/") {
    std::vector<std::string> parts;
    boost::algorithm::split(parts, path, boost::algorithm::is_any_of(separators));
    std::erase_if(parts, [](const std::string& p) { return p.empty(); });
    return parts;
}

inline std::string joinSegments(const std::vector<std::string>& segments, const std::size_t count) {
    const auto end = segments.begin() + static_cast<std::ptrdiff_t>(std::min(count, segments.size()));
    return boost::algorithm::join(std::vector<std::string>(segments.begin(), end), "/");
}

inline std::string joinSegments(const std::vector<std::string>& segments) {
    return joinSegments(segments, segments.size());
}

inline std::string stripTrailingSeparators(std::string path) {
    while (path.size() > 1 && isSeparator(path.back())) path.pop_back();
    return path;
}

inline std::string firstSegment(const std::string& path) {
    const auto parts = splitSegments(path, "/\\");
    return parts.empty() ? std::string{} : parts.front();
}

}
