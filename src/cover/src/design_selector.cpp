#include "folio/cover/design_selector.hpp"
#include "folio/cover/genre.hpp"
#include <algorithm>

namespace folio::cover {

namespace {

constexpr f32 TITLE_SIZE_RATIO = 0.075f;    // 120px at 1600px wide
constexpr f32 AUTHOR_SIZE_RATIO = 0.0375f;  // 60px at 1600px wide
constexpr f32 MIN_FONT_SIZE = 8.0f;

const std::vector<BackgroundStyle> BACKGROUNDS = {
    BackgroundStyle::Solid,
    BackgroundStyle::VerticalGradient,
    BackgroundStyle::DiagonalGradient,
    BackgroundStyle::RadialGradient,
    BackgroundStyle::TwoTone,
};

const std::vector<DecorationStyle> DECORATIONS = {
    DecorationStyle::None,
    DecorationStyle::TopBottomBorder,
    DecorationStyle::FullFrame,
    DecorationStyle::CornerAccents,
    DecorationStyle::GeometricShapes,
};

const std::vector<LayoutVariant> LAYOUTS = {
    LayoutVariant::Centered,
    LayoutVariant::TopHeavy,
    LayoutVariant::BottomHeavy,
    LayoutVariant::Split,
};

} // anonymous namespace

DesignSelector::DesignSelector(bool genre_palettes)
    : m_genre_palettes(genre_palettes)
{
}

const std::vector<std::string>& DesignSelector::aesthetics() {
    static const std::vector<std::string> tags = {
        "minimalist", "classic", "modern", "bold", "elegant", "vintage", "artistic",
    };
    return tags;
}

f32 DesignSelector::title_font_size(i32 canvas_width) {
    return std::max(MIN_FONT_SIZE, static_cast<f32>(canvas_width) * TITLE_SIZE_RATIO);
}

f32 DesignSelector::author_font_size(i32 canvas_width) {
    return std::max(MIN_FONT_SIZE, static_cast<f32>(canvas_width) * AUTHOR_SIZE_RATIO);
}

std::vector<const Palette*> DesignSelector::candidate_palettes(std::string_view title) const {
    std::vector<const Palette*> candidates;

    if (m_genre_palettes) {
        if (auto genre = detect_genre(title)) {
            for (auto name : genre_palette_names(*genre)) {
                if (const Palette* palette = find_palette(name)) {
                    candidates.push_back(palette);
                }
            }
        }
    }

    if (candidates.empty()) {
        for (const auto& palette : palette_library()) {
            candidates.push_back(&palette);
        }
    }
    return candidates;
}

DesignPlan DesignSelector::select(Random& random, SizeI canvas, std::string_view title) const {
    DesignPlan plan;

    plan.aesthetic = random.pick(aesthetics());
    plan.palette = *random.pick(candidate_palettes(title));
    plan.background = random.pick(BACKGROUNDS);

    // Bright accent: warm-leaning red and green, moderate blue
    u8 r = static_cast<u8>(random.uniform_int(180, 255));
    u8 g = static_cast<u8>(random.uniform_int(180, 255));
    u8 b = static_cast<u8>(random.uniform_int(100, 200));
    plan.accent = Color{r, g, b};

    plan.decoration = random.pick(DECORATIONS);
    plan.layout = random.pick(LAYOUTS);
    plan.shadow = random.coin();
    plan.separator = random.coin();

    plan.title_font_size = title_font_size(canvas.width);
    plan.author_font_size = author_font_size(canvas.width);
    return plan;
}

} // namespace folio::cover
