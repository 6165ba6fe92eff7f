#pragma once

#include "folio/cover/design_plan.hpp"
#include "folio/core/random.hpp"
#include "folio/raster/canvas.hpp"
#include <vector>

namespace folio::cover {

// ============================================================================
// Overlay
// ============================================================================

struct Overlay {
    enum class Shape : u8 {
        Rect,
        Circle
    };

    Shape shape{Shape::Rect};
    RectI bounds;        // Clipped to the canvas; the circle's clipped bounding box
    PointI center;       // Circle only
    i32 radius{0};       // Circle only
    Color color;
};

// ============================================================================
// Decoration Compositor
// ============================================================================

/// Plans accent overlays for a design and paints them over the background.
/// Sizes are drawn in reference pixels and scaled by min(width, height) / 1600.
class DecorationCompositor {
public:
    /// Draws all random parameters and returns the overlays, clipped
    [[nodiscard]] std::vector<Overlay> plan(const DesignPlan& design, SizeI canvas,
                                            Random& random) const;

    void apply(raster::Canvas& canvas, const std::vector<Overlay>& overlays) const;

    /// plan() followed by apply()
    std::vector<Overlay> compose(raster::Canvas& canvas, const DesignPlan& design,
                                 Random& random) const;

    /// Lightens each channel by `delta`, saturating at 255
    [[nodiscard]] static Color lighten(const Color& color, i32 delta);
};

} // namespace folio::cover
