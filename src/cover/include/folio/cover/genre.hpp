#pragma once

#include "folio/cover/palette.hpp"
#include <optional>
#include <string_view>
#include <vector>

namespace folio::cover {

enum class Genre : u8 {
    Philosophical,
    Romantic,
    Technical,
    Mystery,
    Adventure
};

[[nodiscard]] std::string_view to_string(Genre genre);

/// Matches title words against per-genre keyword prefixes. Genres are
/// checked in declaration order and the first hit wins.
[[nodiscard]] std::optional<Genre> detect_genre(std::string_view title);

/// Palette names that suit a genre; all exist in palette_library()
[[nodiscard]] const std::vector<std::string_view>& genre_palette_names(Genre genre);

} // namespace folio::cover
