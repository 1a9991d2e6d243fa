#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace memex::utf8 {

inline bool isContinuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/// Moves pos back to the start of the character it falls inside, never below floor
inline size_t boundaryAtOrBefore(std::string_view text, size_t pos, size_t floor = 0) {
    if (pos >= text.size()) {
        return text.size();
    }
    while (pos > floor && isContinuation(text[pos])) {
        --pos;
    }
    return pos;
}

/// Moves pos forward to the next character start
inline size_t boundaryAtOrAfter(std::string_view text, size_t pos) {
    while (pos < text.size() && isContinuation(text[pos])) {
        ++pos;
    }
    return pos;
}

/// At most maxBytes of text, never ending inside a multibyte sequence
inline std::string prefix(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return text;
    }
    return text.substr(0, boundaryAtOrBefore(text, maxBytes));
}

/**
 * @brief Copy of text with every malformed sequence replaced by U+FFFD
 *
 * Rejects overlong forms, surrogates and code points above U+10FFFF. Each
 * maximal invalid subpart yields one replacement character.
 */
inline std::string sanitize(std::string_view text) {
    static constexpr std::string_view kReplacement = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            out.push_back(text[i++]);
            continue;
        }
        size_t need = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            need = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            need = 2;
            if (lead == 0xE0) lo = 0xA0;
            if (lead == 0xED) hi = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            need = 3;
            if (lead == 0xF0) lo = 0x90;
            if (lead == 0xF4) hi = 0x8F;
        }
        if (need == 0) {
            out.append(kReplacement);
            ++i;
            continue;
        }
        size_t len = 1;
        while (len <= need && i + len < text.size()) {
            const auto c = static_cast<unsigned char>(text[i + len]);
            const unsigned char min = len == 1 ? lo : 0x80;
            const unsigned char max = len == 1 ? hi : 0xBF;
            if (c < min || c > max) {
                break;
            }
            ++len;
        }
        if (len == need + 1) {
            out.append(text.substr(i, len));
        } else {
            out.append(kReplacement);
        }
        i += len;
    }
    return out;
}

inline bool isValid(std::string_view text) {
    return sanitize(text) == text;
}

} // namespace memex::utf8
