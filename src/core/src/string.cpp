#include "folio/core/string.hpp"

namespace folio {

// ============================================================================
// UTF-8 implementation
// ============================================================================

namespace unicode {

Utf8DecodeResult utf8_decode(const char* data, usize length) {
    if (length == 0 || data == nullptr) {
        return {INVALID_CODE_POINT, 0};
    }

    auto byte = static_cast<u8>(data[0]);

    if ((byte & 0x80) == 0) {
        return {static_cast<CodePoint>(byte), 1};
    }

    usize seq_len;
    CodePoint cp;

    if ((byte & 0xE0) == 0xC0) {
        seq_len = 2;
        cp = byte & 0x1F;
    } else if ((byte & 0xF0) == 0xE0) {
        seq_len = 3;
        cp = byte & 0x0F;
    } else if ((byte & 0xF8) == 0xF0) {
        seq_len = 4;
        cp = byte & 0x07;
    } else {
        return {REPLACEMENT_CHARACTER, 1};
    }

    if (length < seq_len) {
        return {REPLACEMENT_CHARACTER, length};
    }

    for (usize i = 1; i < seq_len; ++i) {
        byte = static_cast<u8>(data[i]);
        if ((byte & 0xC0) != 0x80) {
            return {REPLACEMENT_CHARACTER, i};
        }
        cp = (cp << 6) | (byte & 0x3F);
    }

    if (!is_valid(cp)) {
        return {REPLACEMENT_CHARACTER, seq_len};
    }

    // Overlong encodings
    if ((seq_len == 2 && cp < 0x80) ||
        (seq_len == 3 && cp < 0x800) ||
        (seq_len == 4 && cp < 0x10000)) {
        return {REPLACEMENT_CHARACTER, seq_len};
    }

    return {cp, seq_len};
}

std::vector<CodePoint> decode(std::string_view text) {
    std::vector<CodePoint> result;
    result.reserve(text.size());

    usize offset = 0;
    while (offset < text.size()) {
        auto decoded = utf8_decode(text.data() + offset, text.size() - offset);
        result.push_back(decoded.code_point);
        offset += decoded.bytes_consumed;
    }
    return result;
}

bool contains_wide(std::string_view text) {
    usize offset = 0;
    while (offset < text.size()) {
        auto decoded = utf8_decode(text.data() + offset, text.size() - offset);
        if (is_wide(decoded.code_point)) {
            return true;
        }
        offset += decoded.bytes_consumed;
    }
    return false;
}

} // namespace unicode

// ============================================================================
// Text helpers
// ============================================================================

std::vector<std::string> split_whitespace(std::string_view text) {
    std::vector<std::string> words;
    std::string current;

    usize offset = 0;
    while (offset < text.size()) {
        auto decoded = unicode::utf8_decode(text.data() + offset, text.size() - offset);
        if (unicode::is_whitespace(decoded.code_point)) {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.append(text.substr(offset, decoded.bytes_consumed));
        }
        offset += decoded.bytes_consumed;
    }

    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string result;
    for (usize i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result.append(separator);
        }
        result.append(parts[i]);
    }
    return result;
}

std::string to_ascii_lowercase(std::string_view text) {
    std::string result(text);
    for (char& c : result) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c + ('a' - 'A'));
        }
    }
    return result;
}

} // namespace folio
