// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Utf8.hpp"

namespace ldsi::utf8 {

namespace {
constexpr bool inRange(char32_t cp, char32_t lo, char32_t hi) noexcept {
    return cp >= lo && cp <= hi;
}

constexpr bool isContinuation(unsigned char c) noexcept {
    return (c & 0xC0) == 0x80;
}
} // namespace

char32_t decode(std::string_view str, size_t& pos) noexcept {
    const auto lead = static_cast<unsigned char>(str[pos]);

    if (lead < 0x80) {
        ++pos;
        return lead;
    }

    size_t len;
    char32_t cp;
    char32_t min;
    if ((lead & 0xE0) == 0xC0) {
        len = 2; cp = lead & 0x1F; min = 0x80;
    }
    else if ((lead & 0xF0) == 0xE0) {
        len = 3; cp = lead & 0x0F; min = 0x800;
    }
    else if ((lead & 0xF8) == 0xF0) {
        len = 4; cp = lead & 0x07; min = 0x10000;
    }
    else {
        ++pos;
        return Invalid;
    }

    if (pos + len > str.size()) {
        ++pos;
        return Invalid;
    }

    for (size_t i = 1; i < len; ++i) {
        const auto c = static_cast<unsigned char>(str[pos + i]);
        if (!isContinuation(c)) {
            ++pos;
            return Invalid;
        }
        cp = (cp << 6) | (c & 0x3F);
    }

    // overlong encodings, surrogates and out of range values
    if (cp < min || cp > 0x10FFFF || inRange(cp, 0xD800, 0xDFFF)) {
        ++pos;
        return Invalid;
    }

    pos += len;
    return cp;
}

void append(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(char(cp));
    }
    else if (cp < 0x800) {
        out.push_back(char(0xC0 | (cp >> 6)));
        out.push_back(char(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000) {
        out.push_back(char(0xE0 | (cp >> 12)));
        out.push_back(char(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(char(0x80 | (cp & 0x3F)));
    }
    else {
        out.push_back(char(0xF0 | (cp >> 18)));
        out.push_back(char(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(char(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(char(0x80 | (cp & 0x3F)));
    }
}

bool isValid(std::string_view str) noexcept {
    size_t pos = 0;
    while (pos < str.size()) {
        if (decode(str, pos) == Invalid) return false;
    }
    return true;
}

bool isDigit(char32_t cp) noexcept {
    return inRange(cp, '0', '9')
        || inRange(cp, 0x0660, 0x0669) // arabic-indic
        || inRange(cp, 0x06F0, 0x06F9)
        || inRange(cp, 0x0966, 0x096F) // devanagari
        || inRange(cp, 0xFF10, 0xFF19); // fullwidth
}

bool isWhitespace(char32_t cp) noexcept {
    return cp == ' '
        || inRange(cp, 0x09, 0x0D)
        || cp == 0x85
        || cp == 0xA0
        || cp == 0x1680
        || inRange(cp, 0x2000, 0x200A)
        || cp == 0x2028
        || cp == 0x2029
        || cp == 0x202F
        || cp == 0x205F
        || cp == 0x3000;
}

bool isAlphabetic(char32_t cp) noexcept {
    if (cp < 0x80) {
        return inRange(cp, 'a', 'z') || inRange(cp, 'A', 'Z');
    }
    if (cp == Invalid) return false;

    // latin-1 block: only the letters and the three letter-like signs
    if (cp < 0xC0) {
        return cp == 0xAA || cp == 0xB5 || cp == 0xBA;
    }
    if (cp == 0xD7 || cp == 0xF7) return false;

    // everything below is punctuation, symbols, digits or non-characters
    if (isDigit(cp) || isWhitespace(cp)) return false;
    if (inRange(cp, 0x0600, 0x060F) || inRange(cp, 0x061B, 0x061F) || cp == 0x06D4) return false; // arabic punctuation
    if (inRange(cp, 0x0964, 0x0965)) return false; // danda
    if (inRange(cp, 0x2000, 0x2BFF)) return false; // punctuation, currency, arrows, math, box drawing, dingbats
    if (inRange(cp, 0x2E00, 0x2E7F)) return false; // supplemental punctuation
    if (inRange(cp, 0x3000, 0x303F)) return false; // cjk symbols and punctuation
    if (inRange(cp, 0xE000, 0xF8FF)) return false; // private use
    if (inRange(cp, 0xFE00, 0xFE0F)) return false; // variation selectors
    if (inRange(cp, 0xFE30, 0xFE6F)) return false; // cjk compatibility and small forms
    if (inRange(cp, 0xFF00, 0xFF20) || inRange(cp, 0xFF3B, 0xFF40) || inRange(cp, 0xFF5B, 0xFF65)) return false; // fullwidth punctuation
    if (inRange(cp, 0xFFF0, 0xFFFF)) return false; // specials
    if (inRange(cp, 0x1F000, 0x1FAFF)) return false; // emoji and pictographs
    if (inRange(cp, 0xE0000, 0xE007F)) return false; // tags

    return true;
}

char32_t toLower(char32_t cp) noexcept {
    if (inRange(cp, 'A', 'Z')) return cp + 32;
    if (cp < 0xC0) return cp;

    // latin-1
    if (inRange(cp, 0xC0, 0xDE) && cp != 0xD7) return cp + 32;

    // latin extended-a: pairs of upper/lower
    if (inRange(cp, 0x100, 0x137) || inRange(cp, 0x14A, 0x177)) {
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    if (inRange(cp, 0x139, 0x148) || inRange(cp, 0x179, 0x17E)) {
        return (cp % 2 == 1) ? cp + 1 : cp;
    }
    if (cp == 0x178) return 0xFF;

    // greek
    if (inRange(cp, 0x391, 0x3A9) && cp != 0x3A2) return cp + 32;
    if (cp == 0x386) return 0x3AC;
    if (inRange(cp, 0x388, 0x38A)) return cp + 37;
    if (cp == 0x38C) return 0x3CC;
    if (inRange(cp, 0x38E, 0x38F)) return cp + 63;

    // cyrillic
    if (inRange(cp, 0x410, 0x42F)) return cp + 32;
    if (inRange(cp, 0x400, 0x40F)) return cp + 80;

    return cp;
}

std::string toLower(std::string_view str) {
    std::string ret;
    ret.reserve(str.size());
    size_t pos = 0;
    while (pos < str.size()) {
        const size_t start = pos;
        auto cp = decode(str, pos);
        if (cp == Invalid) {
            // keep malformed bytes as they are
            ret.append(str.substr(start, pos - start));
        }
        else {
            append(ret, toLower(cp));
        }
    }
    return ret;
}

} // namespace ldsi::utf8
