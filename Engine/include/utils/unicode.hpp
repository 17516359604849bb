#pragma once

#include <string>
#include <cstdint>

namespace Lexigraph {

/**
 * @brief UTF-8 to UTF-32 conversion.
 *
 * Invalid lead bytes are skipped.
 */
inline std::u32string utf8_to_utf32(const std::string& s) {
    std::u32string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ) {
        uint8_t c = static_cast<uint8_t>(s[i]);
        char32_t cp = 0;
        size_t len = 0;

        if (c < 0x80) { cp = c; len = 1; }
        else if ((c >> 5) == 0x6) { cp = c & 0x1F; len = 2; }
        else if ((c >> 4) == 0xE) { cp = c & 0x0F; len = 3; }
        else if ((c >> 3) == 0x1E) { cp = c & 0x07; len = 4; }
        else { ++i; continue; } // Invalid start byte

        for (size_t j = 1; j < len && i + j < s.size(); ++j) {
            uint8_t cc = static_cast<uint8_t>(s[i + j]);
            if ((cc >> 6) != 0x2) { len = 1; break; } // Unexpected byte
            cp = (cp << 6) | (cc & 0x3F);
        }

        out.push_back(cp);
        i += len;
    }
    return out;
}

/**
 * @brief UTF-32 to UTF-8 conversion.
 */
inline std::string utf32_to_utf8(const std::u32string& s) {
    std::string out;
    out.reserve(s.size() * 3 / 2);
    for (char32_t cp : s) {
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
    return out;
}

inline std::string utf32_to_utf8(const char32_t* data, size_t len) {
    return utf32_to_utf8(std::u32string(data, len));
}

inline bool is_whitespace(char32_t cp) {
    return cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' || cp == U'\v' || cp == U'\f' ||
           cp == 0x00A0 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x3000;
}

inline bool is_control(char32_t cp) {
    return cp < 0x20 || (cp >= 0x7F && cp <= 0x9F);
}

inline bool is_ascii_punctuation(char32_t cp) {
    return (cp >= 0x21 && cp <= 0x2F) || (cp >= 0x3A && cp <= 0x40) ||
           (cp >= 0x5B && cp <= 0x60) || (cp >= 0x7B && cp <= 0x7E);
}

/**
 * @brief Lowercase mapping for ASCII, Latin-1, Latin Extended-A, Greek and Cyrillic.
 */
inline char32_t to_lower(char32_t cp) {
    if (cp >= U'A' && cp <= U'Z') return cp + 0x20;
    if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) return cp + 0x20;
    if (cp >= 0x0100 && cp <= 0x0137) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp >= 0x0139 && cp <= 0x0148) return (cp % 2 == 1) ? cp + 1 : cp;
    if (cp >= 0x014A && cp <= 0x0177) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp == 0x0178) return 0x00FF;
    if (cp >= 0x0179 && cp <= 0x017E) return (cp % 2 == 1) ? cp + 1 : cp;
    if (cp >= 0x0391 && cp <= 0x03A9 && cp != 0x03A2) return cp + 0x20;
    if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20;
    if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;
    return cp;
}

// IPA codepoint classes

inline bool is_stress_mark(char32_t cp) {
    return cp == 0x02C8 || cp == 0x02CC; // ˈ ˌ
}

inline bool is_tie_bar(char32_t cp) {
    return cp == 0x0361 || cp == 0x035C || cp == 0x203F;
}

inline bool is_combining_mark(char32_t cp) {
    return (cp >= 0x0300 && cp <= 0x036F) || (cp >= 0x1DC0 && cp <= 0x1DFF);
}

/**
 * @brief Spacing modifiers that belong to the preceding phoneme (ʰ ʷ ʲ ː ˞ ...).
 */
inline bool is_ipa_modifier(char32_t cp) {
    if (is_stress_mark(cp)) return false;
    return (cp >= 0x02B0 && cp <= 0x02FF) || (cp >= 0x1D2C && cp <= 0x1D6A) || cp == 0x207F;
}

} // namespace Lexigraph
