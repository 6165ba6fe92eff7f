/**
 * Typography Engine
 */

#include "folio/cover/typography.hpp"
#include "folio/core/string.hpp"
#include "folio/text/text_renderer.hpp"
#include "folio/text/word_wrap.hpp"
#include <algorithm>
#include <cmath>

namespace folio::cover {

namespace {

constexpr i32 SHADOW_MIN_OFFSET = 2;
constexpr i32 SHADOW_MAX_OFFSET = 6;
constexpr i32 SEPARATOR_THICKNESS = 4;

Color dim(const Color& color, f64 factor) {
    auto channel = [factor](u8 value) {
        return static_cast<u8>(std::clamp(std::lround(value * factor), 0L, 255L));
    };
    return {channel(color.r), channel(color.g), channel(color.b)};
}

// Same whitespace rules as line wrapping, so U+3000 alone is blank
bool has_text(const std::optional<std::string>& value) {
    return value.has_value() && !split_whitespace(*value).empty();
}

} // anonymous namespace

std::vector<const TextRun*> TextLayout::lines(TextRole role) const {
    std::vector<const TextRun*> result;
    for (const auto& run : runs) {
        if (run.role == role && !run.shadow) {
            result.push_back(&run);
        }
    }
    return result;
}

const text::Font& RoleFonts::for_role(TextRole role) const {
    switch (role) {
        case TextRole::Title:    return *title;
        case TextRole::Author:   return *author;
        case TextRole::Subtitle: return *subtitle;
    }
    return *title;
}

LayoutAnchors layout_anchors(LayoutVariant variant) {
    switch (variant) {
        case LayoutVariant::Centered:    return {0.35, 0.70};
        case LayoutVariant::TopHeavy:    return {0.20, 0.80};
        case LayoutVariant::BottomHeavy: return {0.55, 0.85};
        case LayoutVariant::Split:       return {0.15, 0.65};
    }
    return {0.35, 0.70};
}

// ============================================================================
// TypographyEngine
// ============================================================================

TypographyEngine::TypographyEngine(f32 max_line_width_ratio)
    : m_max_line_width_ratio(std::clamp(max_line_width_ratio, 0.05f, 1.0f))
{
}

f32 TypographyEngine::max_line_width(i32 canvas_width) const {
    return static_cast<f32>(canvas_width) * m_max_line_width_ratio;
}

i32 TypographyEngine::scaled_gap(i32 reference_gap, i32 canvas_height) {
    auto gap = std::lround(reference_gap * (canvas_height / REFERENCE_HEIGHT));
    return std::max(1, static_cast<i32>(gap));
}

TextLayout TypographyEngine::layout(const CoverRequest& request, const DesignPlan& plan,
                                    const RoleFonts& fonts, SizeI canvas, Random& random) const {
    TextLayout result;
    const f32 max_width = max_line_width(canvas.width);
    const i32 title_gap = scaled_gap(TITLE_LINE_GAP, canvas.height);
    const i32 author_gap = scaled_gap(AUTHOR_LINE_GAP, canvas.height);
    const LayoutAnchors anchors = layout_anchors(plan.layout);

    // Title
    const i32 title_top = static_cast<i32>(std::lround(canvas.height * anchors.title_start));
    auto title_lines = text::WordWrapper(*fonts.title).wrap(request.title, max_width);
    stack_lines(result, TextRole::Title, title_lines, *fonts.title, title_top, title_gap,
                title_color(), plan.shadow, canvas, random);

    const bool has_author = has_text(request.author);

    // Separator below the last title line
    if (plan.separator && has_author) {
        i32 rule_top = title_top;
        auto placed = result.lines(TextRole::Title);
        if (!placed.empty()) {
            rule_top = placed.back()->origin.y + placed.back()->height + title_gap;
        }

        i32 min_width = static_cast<i32>(std::lround(canvas.width * 0.2));
        i32 max_width_px = static_cast<i32>(std::lround(canvas.width * 0.5));
        i32 rule_width = std::max(1, random.uniform_int(min_width, max_width_px));
        i32 thickness = scaled_gap(SEPARATOR_THICKNESS, canvas.height);

        result.separator = SeparatorRule{
            RectI((canvas.width - rule_width) / 2, rule_top, rule_width, thickness),
            plan.accent
        };
    }

    // Author
    if (has_author) {
        const i32 author_top = static_cast<i32>(std::lround(canvas.height * anchors.author_start));
        auto author_lines = text::WordWrapper(*fonts.author).wrap(*request.author, max_width);
        stack_lines(result, TextRole::Author, author_lines, *fonts.author, author_top, author_gap,
                    plan.accent, plan.shadow, canvas, random);
    }

    // Subtitle, fixed regardless of layout variant
    if (has_text(request.subtitle)) {
        const i32 subtitle_top = static_cast<i32>(std::lround(canvas.height * SUBTITLE_START));
        auto subtitle_lines = text::WordWrapper(*fonts.subtitle).wrap(*request.subtitle, max_width);
        stack_lines(result, TextRole::Subtitle, subtitle_lines, *fonts.subtitle, subtitle_top,
                    author_gap, dim(plan.accent, SUBTITLE_DIM), plan.shadow, canvas, random);
    }

    return result;
}

void TypographyEngine::stack_lines(TextLayout& layout, TextRole role,
                                   const std::vector<std::string>& lines,
                                   const text::Font& font, i32 top, i32 gap,
                                   const Color& color, bool shadow, SizeI canvas,
                                   Random& random) const {
    i32 y = top;
    for (const auto& line : lines) {
        text::TextExtent extent = font.measure(line);

        TextRun run;
        run.role = role;
        run.text = line;
        run.width = static_cast<i32>(std::lround(extent.width));
        run.height = static_cast<i32>(std::ceil(extent.height));
        run.origin = PointI((canvas.width - run.width) / 2, y);
        run.color = color;

        if (shadow) {
            TextRun shade = run;
            shade.shadow = true;
            shade.color = shadow_color();
            shade.origin.x += scaled_gap(random.uniform_int(SHADOW_MIN_OFFSET, SHADOW_MAX_OFFSET),
                                         canvas.height);
            shade.origin.y += scaled_gap(random.uniform_int(SHADOW_MIN_OFFSET, SHADOW_MAX_OFFSET),
                                         canvas.height);
            layout.runs.push_back(std::move(shade));
        }

        layout.runs.push_back(run);
        y += run.height + gap;
    }
}

void TypographyEngine::draw(raster::Canvas& canvas, const TextLayout& layout,
                            const RoleFonts& fonts) const {
    auto draw_role = [&](TextRole role) {
        for (const auto& run : layout.runs) {
            if (run.role == role) {
                text::draw_text(canvas, fonts.for_role(role), run.origin, run.text, run.color);
            }
        }
    };

    draw_role(TextRole::Title);
    if (layout.separator) {
        canvas.fill_rect(layout.separator->bounds, layout.separator->color);
    }
    draw_role(TextRole::Author);
    draw_role(TextRole::Subtitle);
}

} // namespace folio::cover
