#pragma once

#include "folio/cover/design_plan.hpp"
#include "folio/core/random.hpp"
#include <string_view>
#include <vector>

namespace folio::cover {

// ============================================================================
// Design Selector
// ============================================================================

/// Draws a complete DesignPlan from a caller-owned random source.
///
/// Draw order is fixed: aesthetic, palette, background, accent, decoration,
/// layout, shadow, separator. Font sizes follow from the canvas width.
class DesignSelector {
public:
    explicit DesignSelector(bool genre_palettes = false);

    [[nodiscard]] DesignPlan select(Random& random, SizeI canvas, std::string_view title) const;

    /// Palettes the palette draw chooses from for this title
    [[nodiscard]] std::vector<const Palette*> candidate_palettes(std::string_view title) const;

    [[nodiscard]] static const std::vector<std::string>& aesthetics();

    [[nodiscard]] static f32 title_font_size(i32 canvas_width);
    [[nodiscard]] static f32 author_font_size(i32 canvas_width);

private:
    bool m_genre_palettes;
};

} // namespace folio::cover
