#pragma once

#include "folio/cover/design_plan.hpp"
#include "folio/core/random.hpp"
#include "folio/raster/canvas.hpp"

namespace folio::cover {

/// Per-channel linear interpolation, rounded to nearest and clamped
[[nodiscard]] Color blend(const Color& from, const Color& to, f64 t);

/// Two-band blend across the palette: stop0 -> stop1 over [0, 0.5),
/// stop1 -> stop2 over [0.5, 1]
[[nodiscard]] Color two_band_blend(const Palette& palette, f64 r);

// ============================================================================
// Gradient Renderer
// ============================================================================

class GradientRenderer {
public:
    explicit GradientRenderer(i32 sample_stride = 4);

    [[nodiscard]] i32 sample_stride() const noexcept { return m_stride; }

    /// Fills every pixel of the canvas. Only the two-tone style draws from
    /// `random` (its split row).
    void render(raster::Canvas& canvas, const Palette& palette,
                BackgroundStyle style, Random& random) const;

private:
    void fill_vertical(raster::Canvas& canvas, const Palette& palette) const;
    void fill_diagonal(raster::Canvas& canvas, const Palette& palette) const;
    void fill_radial(raster::Canvas& canvas, const Palette& palette) const;
    void fill_two_tone(raster::Canvas& canvas, const Palette& palette, Random& random) const;

    i32 m_stride;
};

} // namespace folio::cover
