#pragma once
/// @file textUtil.hpp
/// @brief String helpers shared by validation, search and configuration

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>

namespace ContactStore::util {

inline bool isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

// 앞뒤 ASCII 공백만 제거한다. 내부 공백("Bob  Brown")은 그대로 둔다.
inline std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isAsciiSpace(s[b]))
        ++b;
    while (e > b && isAsciiSpace(s[e - 1]))
        --e;
    return s.substr(b, e - b);
}

inline std::string toLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// @brief Lowercases every code point of a UTF-8 string
/// @details Uses the wide ctype facet of a UTF-8 locale ("C.UTF-8" or the
///          environment's). Bytes that do not form valid UTF-8 are copied as is.
///          Without any UTF-8 locale only ASCII letters are folded.
std::string foldCase(const std::string& s);

/// @brief Case-insensitive substring test, folding by code point
/// @note An empty needle is contained in every haystack.
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

/// @brief Number of code points in a UTF-8 string
/// @details Counts every byte that is not a continuation byte (10xxxxxx), so
///          malformed input still yields a count no greater than its byte length.
inline size_t utf8Length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80)
            ++n;
    }
    return n;
}

} // namespace ContactStore::util
