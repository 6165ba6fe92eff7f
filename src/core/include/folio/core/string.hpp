#pragma once

#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace folio {

// ============================================================================
// Unicode utilities
// ============================================================================

namespace unicode {

using CodePoint = char32_t;

constexpr CodePoint REPLACEMENT_CHARACTER = 0xFFFD;
constexpr CodePoint INVALID_CODE_POINT = 0xFFFFFFFF;

[[nodiscard]] constexpr bool is_valid(CodePoint cp) {
    return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

[[nodiscard]] constexpr bool is_ascii(CodePoint cp) {
    return cp <= 0x7F;
}

[[nodiscard]] constexpr bool is_whitespace(CodePoint cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f' ||
           cp == '\v' || cp == 0x3000;  // ideographic space
}

// East Asian wide characters: CJK ideographs, kana, hangul and fullwidth forms
[[nodiscard]] constexpr bool is_wide(CodePoint cp) {
    return (cp >= 0x1100 && cp <= 0x115F) ||
           (cp >= 0x2E80 && cp <= 0x303E) ||
           (cp >= 0x3041 && cp <= 0x33FF) ||
           (cp >= 0x3400 && cp <= 0x4DBF) ||
           (cp >= 0x4E00 && cp <= 0x9FFF) ||
           (cp >= 0xA000 && cp <= 0xA4CF) ||
           (cp >= 0xAC00 && cp <= 0xD7A3) ||
           (cp >= 0xF900 && cp <= 0xFAFF) ||
           (cp >= 0xFE30 && cp <= 0xFE4F) ||
           (cp >= 0xFF00 && cp <= 0xFF60) ||
           (cp >= 0xFFE0 && cp <= 0xFFE6) ||
           (cp >= 0x20000 && cp <= 0x2FFFD) ||
           (cp >= 0x30000 && cp <= 0x3FFFD);
}

struct Utf8DecodeResult {
    CodePoint code_point;
    usize bytes_consumed;
};

// Decodes one code point; malformed input yields REPLACEMENT_CHARACTER and
// always consumes at least one byte
[[nodiscard]] Utf8DecodeResult utf8_decode(const char* data, usize length);

[[nodiscard]] std::vector<CodePoint> decode(std::string_view text);

[[nodiscard]] bool contains_wide(std::string_view text);

} // namespace unicode

// ============================================================================
// Text helpers
// ============================================================================

[[nodiscard]] std::vector<std::string> split_whitespace(std::string_view text);

[[nodiscard]] std::string join(const std::vector<std::string>& parts, std::string_view separator);

[[nodiscard]] std::string to_ascii_lowercase(std::string_view text);

} // namespace folio
