/**
 * Text rendering onto a raster canvas
 */

#include "folio/text/text_renderer.hpp"
#include <cmath>

namespace folio::text {

void draw_text(raster::Canvas& canvas, const Font& font, PointI origin,
               std::string_view text, const Color& color) {
    const i32 baseline = origin.y + static_cast<i32>(std::lround(font.metrics().ascender));

    f32 pen_x = static_cast<f32>(origin.x);
    unicode::CodePoint prev = 0;

    for (unicode::CodePoint cp : unicode::decode(text)) {
        if (prev) {
            pen_x += font.get_kerning(prev, cp);
        }

        if (auto glyph = font.rasterize_glyph(cp)) {
            i32 left = static_cast<i32>(std::lround(pen_x)) + glyph->bearing_x;
            i32 top = baseline - glyph->bearing_y;

            for (i32 y = 0; y < glyph->height; ++y) {
                for (i32 x = 0; x < glyph->width; ++x) {
                    u8 coverage = glyph->pixels[static_cast<usize>(y) * glyph->width + x];
                    canvas.blend_pixel(left + x, top + y, color, coverage);
                }
            }
        }

        pen_x += font.measure_char(cp);
        prev = cp;
    }
}

} // namespace folio::text
