#pragma once

#include "folio/core/types.hpp"
#include <optional>
#include <vector>

namespace folio::raster {

// ============================================================================
// Canvas
// ============================================================================

/// Fixed-size RGB8 pixel buffer. Every drawing primitive clips to the
/// canvas bounds, so callers may pass shapes that hang off any edge.
class Canvas {
public:
    static constexpr i32 CHANNELS = 3;

    /// Returns std::nullopt for non-positive dimensions
    [[nodiscard]] static std::optional<Canvas> create(i32 width, i32 height,
                                                      Color fill = Color::black());

    [[nodiscard]] i32 width() const noexcept { return m_width; }
    [[nodiscard]] i32 height() const noexcept { return m_height; }
    [[nodiscard]] SizeI size() const noexcept { return {m_width, m_height}; }
    [[nodiscard]] RectI bounds() const noexcept { return {0, 0, m_width, m_height}; }

    /// Interleaved RGB rows, top to bottom, no padding
    [[nodiscard]] const std::vector<u8>& pixels() const noexcept { return m_pixels; }
    [[nodiscard]] i32 stride() const noexcept { return m_width * CHANNELS; }

    /// Pixel at (x, y); out-of-bounds reads return black
    [[nodiscard]] Color pixel(i32 x, i32 y) const;

    void clear(const Color& color);
    void set_pixel(i32 x, i32 y, const Color& color);

    /// Blends `color` over the existing pixel with 8-bit coverage
    void blend_pixel(i32 x, i32 y, const Color& color, u8 coverage);

    /// Fills columns [x1, x2) of row y
    void fill_span(i32 y, i32 x1, i32 x2, const Color& color);
    void fill_row(i32 y, const Color& color);
    void fill_rect(const RectI& rect, const Color& color);
    void fill_circle(PointI center, i32 radius, const Color& color);

    [[nodiscard]] bool operator==(const Canvas& other) const {
        return m_width == other.m_width && m_height == other.m_height &&
               m_pixels == other.m_pixels;
    }

    [[nodiscard]] bool operator!=(const Canvas& other) const {
        return !(*this == other);
    }

private:
    Canvas(i32 width, i32 height);

    [[nodiscard]] usize offset(i32 x, i32 y) const {
        return (static_cast<usize>(y) * static_cast<usize>(m_width) +
                static_cast<usize>(x)) * CHANNELS;
    }

    i32 m_width{0};
    i32 m_height{0};
    std::vector<u8> m_pixels;
};

} // namespace folio::raster
