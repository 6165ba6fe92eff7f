/**
 * Decoration Compositor
 */

#include "folio/cover/decoration.hpp"
#include "folio/core/logger.hpp"
#include <algorithm>
#include <cmath>

namespace folio::cover {

namespace {

constexpr f64 REFERENCE_EXTENT = 1600.0;

class OverlayBuilder {
public:
    OverlayBuilder(SizeI canvas, std::vector<Overlay>& out)
        : m_bounds(0, 0, canvas.width, canvas.height)
        , m_scale(std::min(canvas.width, canvas.height) / REFERENCE_EXTENT)
        , m_out(out)
    {
    }

    [[nodiscard]] i32 scaled(i32 reference) const {
        return std::max(1, static_cast<i32>(std::lround(reference * m_scale)));
    }

    void rect(i32 x, i32 y, i32 width, i32 height, const Color& color) {
        RectI clipped = RectI(x, y, width, height).intersection(m_bounds);
        if (clipped.is_empty()) {
            return;
        }

        Overlay overlay;
        overlay.shape = Overlay::Shape::Rect;
        overlay.bounds = clipped;
        overlay.color = color;
        m_out.push_back(overlay);
    }

    void circle(PointI center, i32 radius, const Color& color) {
        RectI box(center.x - radius, center.y - radius, radius * 2 + 1, radius * 2 + 1);
        RectI clipped = box.intersection(m_bounds);
        if (clipped.is_empty() || radius <= 0) {
            return;
        }

        Overlay overlay;
        overlay.shape = Overlay::Shape::Circle;
        overlay.bounds = clipped;
        overlay.center = center;
        overlay.radius = radius;
        overlay.color = color;
        m_out.push_back(overlay);
    }

private:
    RectI m_bounds;
    f64 m_scale;
    std::vector<Overlay>& m_out;
};

} // anonymous namespace

Color DecorationCompositor::lighten(const Color& color, i32 delta) {
    auto channel = [delta](u8 value) {
        return static_cast<u8>(std::clamp(static_cast<i32>(value) + delta, 0, 255));
    };
    return {channel(color.r), channel(color.g), channel(color.b)};
}

std::vector<Overlay> DecorationCompositor::plan(const DesignPlan& design, SizeI canvas,
                                                Random& random) const {
    std::vector<Overlay> overlays;
    if (canvas.is_empty()) {
        return overlays;
    }

    OverlayBuilder builder(canvas, overlays);
    const i32 w = canvas.width;
    const i32 h = canvas.height;
    const Color& accent = design.accent;

    switch (design.decoration) {
        case DecorationStyle::None:
            break;

        case DecorationStyle::TopBottomBorder: {
            i32 thickness = builder.scaled(random.uniform_int(20, 60));
            builder.rect(0, 0, w, thickness, accent);
            builder.rect(0, h - thickness, w, thickness, accent);
            break;
        }

        case DecorationStyle::FullFrame: {
            i32 border = builder.scaled(random.uniform_int(15, 40));
            builder.rect(0, 0, w, border, accent);
            builder.rect(0, h - border, w, border, accent);
            builder.rect(0, 0, border, h, accent);
            builder.rect(w - border, 0, border, h, accent);
            break;
        }

        case DecorationStyle::CornerAccents: {
            i32 length = builder.scaled(random.uniform_int(80, 200));
            i32 thickness = builder.scaled(random.uniform_int(6, 14));
            i32 margin = builder.scaled(40);

            i32 left = margin;
            i32 top = margin;
            i32 right = w - margin;
            i32 bottom = h - margin;

            // Top-left
            builder.rect(left, top, length, thickness, accent);
            builder.rect(left, top, thickness, length, accent);
            // Top-right
            builder.rect(right - length, top, length, thickness, accent);
            builder.rect(right - thickness, top, thickness, length, accent);
            // Bottom-left
            builder.rect(left, bottom - thickness, length, thickness, accent);
            builder.rect(left, bottom - length, thickness, length, accent);
            // Bottom-right
            builder.rect(right - length, bottom - thickness, length, thickness, accent);
            builder.rect(right - thickness, bottom - length, thickness, length, accent);
            break;
        }

        case DecorationStyle::GeometricShapes: {
            const i32 extent = std::min(w, h);
            const i32 min_radius = std::max(1, static_cast<i32>(std::lround(extent * 0.05)));
            const i32 max_radius = std::max(min_radius, static_cast<i32>(std::lround(extent * 0.25)));

            i32 count = random.uniform_int(2, 5);
            for (i32 i = 0; i < count; ++i) {
                PointI center(random.uniform_int(0, w - 1), random.uniform_int(0, h - 1));
                i32 radius = random.uniform_int(min_radius, max_radius);
                i32 delta = random.uniform_int(10, 40);
                builder.circle(center, radius, lighten(design.palette.light(), delta));
            }
            break;
        }
    }

    return overlays;
}

void DecorationCompositor::apply(raster::Canvas& canvas, const std::vector<Overlay>& overlays) const {
    for (const auto& overlay : overlays) {
        switch (overlay.shape) {
            case Overlay::Shape::Rect:
                canvas.fill_rect(overlay.bounds, overlay.color);
                break;
            case Overlay::Shape::Circle:
                canvas.fill_circle(overlay.center, overlay.radius, overlay.color);
                break;
        }
    }
}

std::vector<Overlay> DecorationCompositor::compose(raster::Canvas& canvas, const DesignPlan& design,
                                                   Random& random) const {
    auto overlays = plan(design, canvas.size(), random);
    FOLIO_LOG_TRACE(std::string("Decoration ") + std::string(to_string(design.decoration)) +
                    ": " + std::to_string(overlays.size()) + " overlays");
    apply(canvas, overlays);
    return overlays;
}

} // namespace folio::cover
