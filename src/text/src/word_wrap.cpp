/**
 * Word Wrapper implementation
 */

#include "folio/text/word_wrap.hpp"

namespace folio::text {

WordWrapper::WordWrapper(const Font& font)
    : m_font(font)
{
}

std::vector<std::string> WordWrapper::wrap(std::string_view text, f32 max_width) const {
    return wrap_words(split_whitespace(text), max_width);
}

std::vector<std::string> WordWrapper::wrap_words(const std::vector<std::string>& words,
                                                 f32 max_width) const {
    std::vector<std::string> lines;
    std::string current;

    for (const auto& word : words) {
        if (word.empty()) {
            continue;
        }

        std::string candidate = current.empty() ? word : current + " " + word;

        if (m_font.measure_text(candidate) > max_width && !current.empty()) {
            lines.push_back(std::move(current));
            current = word;
        } else {
            current = std::move(candidate);
        }
    }

    if (!current.empty()) {
        lines.push_back(std::move(current));
    }

    return lines;
}

} // namespace folio::text
