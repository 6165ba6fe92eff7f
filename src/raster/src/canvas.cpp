/**
 * Canvas implementation
 */

#include "folio/raster/canvas.hpp"
#include <algorithm>
#include <cmath>

namespace folio::raster {

Canvas::Canvas(i32 width, i32 height)
    : m_width(width)
    , m_height(height)
    , m_pixels(static_cast<usize>(width) * static_cast<usize>(height) * CHANNELS, 0)
{
}

std::optional<Canvas> Canvas::create(i32 width, i32 height, Color fill) {
    if (width <= 0 || height <= 0) {
        return std::nullopt;
    }

    Canvas canvas(width, height);
    if (fill != Color::black()) {
        canvas.clear(fill);
    }
    return canvas;
}

Color Canvas::pixel(i32 x, i32 y) const {
    if (x < 0 || x >= m_width || y < 0 || y >= m_height) {
        return Color::black();
    }

    usize index = offset(x, y);
    return {m_pixels[index], m_pixels[index + 1], m_pixels[index + 2]};
}

void Canvas::clear(const Color& color) {
    for (i32 y = 0; y < m_height; ++y) {
        fill_row(y, color);
    }
}

void Canvas::set_pixel(i32 x, i32 y, const Color& color) {
    if (x < 0 || x >= m_width || y < 0 || y >= m_height) {
        return;
    }

    usize index = offset(x, y);
    m_pixels[index] = color.r;
    m_pixels[index + 1] = color.g;
    m_pixels[index + 2] = color.b;
}

void Canvas::blend_pixel(i32 x, i32 y, const Color& color, u8 coverage) {
    if (coverage == 0 || x < 0 || x >= m_width || y < 0 || y >= m_height) {
        return;
    }
    if (coverage == 255) {
        set_pixel(x, y, color);
        return;
    }

    usize index = offset(x, y);
    u32 alpha = coverage;
    u32 inverse = 255 - alpha;

    // (src * a + dst * (255 - a)) / 255, rounded
    auto mix = [alpha, inverse](u8 src, u8 dst) -> u8 {
        u32 value = src * alpha + dst * inverse + 127;
        return static_cast<u8>(value / 255);
    };

    m_pixels[index] = mix(color.r, m_pixels[index]);
    m_pixels[index + 1] = mix(color.g, m_pixels[index + 1]);
    m_pixels[index + 2] = mix(color.b, m_pixels[index + 2]);
}

void Canvas::fill_span(i32 y, i32 x1, i32 x2, const Color& color) {
    if (y < 0 || y >= m_height) {
        return;
    }

    x1 = std::max(0, x1);
    x2 = std::min(m_width, x2);
    if (x2 <= x1) {
        return;
    }

    u8* row = m_pixels.data() + offset(x1, y);
    for (i32 x = x1; x < x2; ++x) {
        row[0] = color.r;
        row[1] = color.g;
        row[2] = color.b;
        row += CHANNELS;
    }
}

void Canvas::fill_row(i32 y, const Color& color) {
    fill_span(y, 0, m_width, color);
}

void Canvas::fill_rect(const RectI& rect, const Color& color) {
    RectI clipped = rect.intersection(bounds());
    if (clipped.is_empty()) {
        return;
    }

    for (i32 y = clipped.top(); y < clipped.bottom(); ++y) {
        fill_span(y, clipped.left(), clipped.right(), color);
    }
}

void Canvas::fill_circle(PointI center, i32 radius, const Color& color) {
    if (radius <= 0) {
        return;
    }

    i32 y1 = std::max(0, center.y - radius);
    i32 y2 = std::min(m_height - 1, center.y + radius);
    i64 r2 = static_cast<i64>(radius) * radius;

    for (i32 y = y1; y <= y2; ++y) {
        i64 dy = y - center.y;
        i64 remaining = r2 - dy * dy;

        // Widest half-span with dx * dx <= remaining
        auto half = static_cast<i32>(std::sqrt(static_cast<f64>(remaining)));
        while (static_cast<i64>(half) * half > remaining) {
            --half;
        }
        while (static_cast<i64>(half + 1) * (half + 1) <= remaining) {
            ++half;
        }
        fill_span(y, center.x - half, center.x + half + 1, color);
    }
}

} // namespace folio::raster
