/// @file textUtil.cpp
/// @brief UTF-8 case folding

#include <contactstore/util/Log.hpp>
#include <contactstore/util/textUtil.hpp>

#include <cstdint>
#include <locale>
#include <stdexcept>

namespace ContactStore::util {

namespace {

const std::locale& foldLocale() {
    static const std::locale loc = [] {
        for (const char* name : {"C.UTF-8", "C.utf8", "en_US.UTF-8", ""}) {
            try {
                std::locale candidate(name);
                // "" 는 환경 locale. UTF-8이 아니면 비ASCII 문자를 접을 수 없으므로 건너뛴다.
                if (std::use_facet<std::ctype<wchar_t>>(candidate).tolower(L'\u00C9') == L'\u00E9')
                    return candidate;
            } catch (const std::runtime_error&) {
                // 이 이름의 locale이 설치되어 있지 않음. 다음 후보로.
            }
        }
        CONTACTSTORE_LOG_WARN("no UTF-8 locale available, case folding limited to ASCII");
        return std::locale::classic();
    }();
    return loc;
}

/// @brief Decodes one code point at s[i]
/// @return Byte length of the sequence, 0 if s[i] does not start valid UTF-8
size_t decodeUtf8(const std::string& s, size_t i, char32_t& cp) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    size_t len;
    if (b0 < 0x80) {
        cp = b0;
        return 1;
    } else if ((b0 & 0xE0) == 0xC0) {
        len = 2;
        cp = b0 & 0x1F;
    } else if ((b0 & 0xF0) == 0xE0) {
        len = 3;
        cp = b0 & 0x0F;
    } else if ((b0 & 0xF8) == 0xF0) {
        len = 4;
        cp = b0 & 0x07;
    } else {
        return 0;
    }
    if (i + len > s.size())
        return 0;
    for (size_t k = 1; k < len; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80)
            return 0;
        cp = (cp << 6) | (b & 0x3F);
    }
    // overlong, surrogate, out of range
    static const char32_t kMin[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < kMin[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return 0;
    return len;
}

void encodeUtf8(char32_t cp, std::string& out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // namespace

std::string foldCase(const std::string& s) {
    const auto& ctype = std::use_facet<std::ctype<wchar_t>>(foldLocale());
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        char32_t cp = 0;
        const size_t len = decodeUtf8(s, i, cp);
        if (len == 0) {
            out.push_back(s[i]);
            ++i;
            continue;
        }
        // Linux의 wchar_t는 32비트라 모든 code point를 그대로 담는다.
        const auto lowered = static_cast<char32_t>(ctype.tolower(static_cast<wchar_t>(cp)));
        encodeUtf8(lowered <= 0x10FFFF ? lowered : cp, out);
        i += len;
    }
    return out;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty())
        return true;
    return foldCase(haystack).find(foldCase(needle)) != std::string::npos;
}

} // namespace ContactStore::util
