#pragma once

#include "folio/cover/cover_types.hpp"
#include "folio/cover/design_plan.hpp"
#include "folio/core/random.hpp"
#include "folio/raster/canvas.hpp"
#include "folio/text/font.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace folio::cover {

enum class TextRole : u8 {
    Title,
    Author,
    Subtitle
};

/// One positioned line of text. Shadow runs precede the line they shade.
struct TextRun {
    TextRole role{TextRole::Title};
    std::string text;
    PointI origin;      // Top-left of the line box
    i32 width{0};       // Measured advance width, rounded
    i32 height{0};      // Measured line box height, rounded up
    Color color;
    bool shadow{false};
};

struct SeparatorRule {
    RectI bounds;
    Color color;
};

struct TextLayout {
    std::vector<TextRun> runs;  // Draw order
    std::optional<SeparatorRule> separator;

    /// Non-shadow runs of one role, top to bottom
    [[nodiscard]] std::vector<const TextRun*> lines(TextRole role) const;
};

struct RoleFonts {
    std::shared_ptr<text::Font> title;
    std::shared_ptr<text::Font> author;
    std::shared_ptr<text::Font> subtitle;

    [[nodiscard]] const text::Font& for_role(TextRole role) const;
};

/// Height fractions at which the title and author blocks start
struct LayoutAnchors {
    f64 title_start;
    f64 author_start;
};

[[nodiscard]] LayoutAnchors layout_anchors(LayoutVariant variant);

// ============================================================================
// Typography Engine
// ============================================================================

class TypographyEngine {
public:
    static constexpr f64 REFERENCE_HEIGHT = 2400.0;
    static constexpr i32 TITLE_LINE_GAP = 15;      // Reference pixels
    static constexpr i32 AUTHOR_LINE_GAP = 10;     // Reference pixels
    static constexpr f64 SUBTITLE_START = 0.55;
    static constexpr f64 SUBTITLE_DIM = 0.8;

    explicit TypographyEngine(f32 max_line_width_ratio = 0.8f);

    /// Wraps and positions every line. Draws shadow offsets and the
    /// separator width from `random`, in draw order.
    [[nodiscard]] TextLayout layout(const CoverRequest& request, const DesignPlan& plan,
                                    const RoleFonts& fonts, SizeI canvas, Random& random) const;

    /// Paints title runs, then the separator, then author and subtitle runs
    void draw(raster::Canvas& canvas, const TextLayout& layout, const RoleFonts& fonts) const;

    [[nodiscard]] f32 max_line_width(i32 canvas_width) const;

    [[nodiscard]] static i32 scaled_gap(i32 reference_gap, i32 canvas_height);

    static constexpr Color title_color() { return {245, 245, 245}; }
    static constexpr Color shadow_color() { return {20, 20, 20}; }

private:
    void stack_lines(TextLayout& layout, TextRole role, const std::vector<std::string>& lines,
                     const text::Font& font, i32 top, i32 gap, const Color& color,
                     bool shadow, SizeI canvas, Random& random) const;

    f32 m_max_line_width_ratio;
};

} // namespace folio::cover
