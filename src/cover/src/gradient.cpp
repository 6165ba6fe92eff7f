/**
 * Gradient Renderer
 *
 * Vertical gradients and two-tone fills are constant per row. Diagonal and
 * radial gradients evaluate every row exactly and sample along the row every
 * `m_stride` columns, holding the sampled color across the run. Banding is
 * therefore bounded by the color change over one stride. Radial runs are
 * anchored on the center column so the center keeps the first stop exactly.
 */

#include "folio/cover/gradient.hpp"
#include <algorithm>
#include <cmath>

namespace folio::cover {

namespace {

u8 lerp_channel(u8 from, u8 to, f64 t) {
    f64 value = std::round(from + (static_cast<f64>(to) - from) * t);
    return static_cast<u8>(std::clamp(value, 0.0, 255.0));
}

} // anonymous namespace

Color blend(const Color& from, const Color& to, f64 t) {
    t = std::clamp(t, 0.0, 1.0);
    return {
        lerp_channel(from.r, to.r, t),
        lerp_channel(from.g, to.g, t),
        lerp_channel(from.b, to.b, t)
    };
}

Color two_band_blend(const Palette& palette, f64 r) {
    r = std::clamp(r, 0.0, 1.0);
    if (r < 0.5) {
        return blend(palette.stops[0], palette.stops[1], r * 2.0);
    }
    return blend(palette.stops[1], palette.stops[2], (r - 0.5) * 2.0);
}

// ============================================================================
// GradientRenderer
// ============================================================================

GradientRenderer::GradientRenderer(i32 sample_stride)
    : m_stride(std::max(1, sample_stride))
{
}

void GradientRenderer::render(raster::Canvas& canvas, const Palette& palette,
                              BackgroundStyle style, Random& random) const {
    switch (style) {
        case BackgroundStyle::Solid:
            canvas.clear(palette.stops[0]);
            break;
        case BackgroundStyle::VerticalGradient:
            fill_vertical(canvas, palette);
            break;
        case BackgroundStyle::DiagonalGradient:
            fill_diagonal(canvas, palette);
            break;
        case BackgroundStyle::RadialGradient:
            fill_radial(canvas, palette);
            break;
        case BackgroundStyle::TwoTone:
            fill_two_tone(canvas, palette, random);
            break;
    }
}

void GradientRenderer::fill_vertical(raster::Canvas& canvas, const Palette& palette) const {
    const f64 height = canvas.height();
    for (i32 y = 0; y < canvas.height(); ++y) {
        canvas.fill_row(y, two_band_blend(palette, y / height));
    }
}

void GradientRenderer::fill_diagonal(raster::Canvas& canvas, const Palette& palette) const {
    const f64 extent = static_cast<f64>(canvas.width()) + canvas.height();
    for (i32 y = 0; y < canvas.height(); ++y) {
        for (i32 x = 0; x < canvas.width(); x += m_stride) {
            Color color = two_band_blend(palette, (x + y) / extent);
            canvas.fill_span(y, x, x + m_stride, color);
        }
    }
}

void GradientRenderer::fill_radial(raster::Canvas& canvas, const Palette& palette) const {
    const i32 cx = canvas.width() / 2;
    const i32 cy = canvas.height() / 2;
    const f64 max_dx = std::max(cx, canvas.width() - 1 - cx);
    const f64 max_dy = std::max(cy, canvas.height() - 1 - cy);
    const f64 max_distance = std::hypot(max_dx, max_dy);

    if (max_distance <= 0.0) {
        canvas.clear(palette.stops[0]);
        return;
    }

    // Runs are aligned so the center column always starts one; the partial
    // run at the left edge samples column 0
    const i32 first_run = cx % m_stride == 0 ? 0 : cx % m_stride - m_stride;

    for (i32 y = 0; y < canvas.height(); ++y) {
        const f64 dy = y - cy;
        for (i32 x = first_run; x < canvas.width(); x += m_stride) {
            const i32 sample = std::max(0, x);
            f64 r = std::min(1.0, std::hypot(static_cast<f64>(sample - cx), dy) / max_distance);
            canvas.fill_span(y, sample, x + m_stride, blend(palette.stops[0], palette.stops[2], r));
        }
    }
}

void GradientRenderer::fill_two_tone(raster::Canvas& canvas, const Palette& palette,
                                     Random& random) const {
    const i32 low = static_cast<i32>(std::lround(canvas.height() * 0.3));
    const i32 high = static_cast<i32>(std::lround(canvas.height() * 0.7));
    const i32 split = random.uniform_int(low, high);

    for (i32 y = 0; y < canvas.height(); ++y) {
        canvas.fill_row(y, y < split ? palette.stops[0] : palette.stops[1]);
    }
}

} // namespace folio::cover
