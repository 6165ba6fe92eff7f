#pragma once

#include "folio/text/font.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace folio::text {

// ============================================================================
// Word Wrapper
// ============================================================================

/// Greedy first-fit wrapping on whitespace-separated words.
///
/// A word is appended to the current line while the measured candidate line
/// fits within the maximum width. A word that does not fit starts a new
/// line; a word wider than the limit on its own becomes a line by itself and
/// is never split. Joining the produced lines with single spaces yields the
/// input's words in order.
class WordWrapper {
public:
    explicit WordWrapper(const Font& font);

    [[nodiscard]] std::vector<std::string> wrap(std::string_view text, f32 max_width) const;

    /// Wraps an already split word sequence
    [[nodiscard]] std::vector<std::string> wrap_words(const std::vector<std::string>& words,
                                                      f32 max_width) const;

private:
    const Font& m_font;
};

} // namespace folio::text
