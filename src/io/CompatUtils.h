#ifndef NEUROPARCEL_COMPAT_UTILS_H
#define NEUROPARCEL_COMPAT_UTILS_H

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace neuroparcel {
namespace io {
namespace compat {

// C++17 compatible string ends_with function
inline bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.length() > str.length()) {
        return false;
    }
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

inline std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

inline std::string trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

// Splits on the delimiter and trims every piece; empty pieces are dropped
inline std::vector<std::string> split_trimmed(const std::string& str, char delimiter) {
    std::vector<std::string> pieces;
    size_t start = 0;
    while (start <= str.length()) {
        size_t end = str.find(delimiter, start);
        if (end == std::string::npos) {
            end = str.length();
        }
        std::string piece = trim(str.substr(start, end - start));
        if (!piece.empty()) {
            pieces.push_back(piece);
        }
        start = end + 1;
    }
    return pieces;
}

} // namespace compat
} // namespace io
} // namespace neuroparcel

#endif // NEUROPARCEL_COMPAT_UTILS_H
