#pragma once

#include "folio/text/font.hpp"
#include "folio/raster/canvas.hpp"
#include <string_view>

namespace folio::text {

/// Draws one line of text with its line box's top-left corner at `origin`.
/// The baseline sits `metrics().ascender` below the origin and the pen
/// advances exactly as Font::measure_text measures. Glyph coverage is
/// blended over the canvas; pixels outside the canvas are dropped.
void draw_text(raster::Canvas& canvas, const Font& font, PointI origin,
               std::string_view text, const Color& color);

} // namespace folio::text
