#pragma once

#include "folio/cover/palette.hpp"
#include <string>
#include <string_view>

namespace folio::cover {

enum class BackgroundStyle : u8 {
    Solid,
    VerticalGradient,
    DiagonalGradient,
    RadialGradient,
    TwoTone
};

enum class DecorationStyle : u8 {
    None,
    TopBottomBorder,
    FullFrame,
    CornerAccents,
    GeometricShapes
};

enum class LayoutVariant : u8 {
    Centered,
    TopHeavy,
    BottomHeavy,
    Split
};

[[nodiscard]] std::string_view to_string(BackgroundStyle style);
[[nodiscard]] std::string_view to_string(DecorationStyle style);
[[nodiscard]] std::string_view to_string(LayoutVariant variant);

// ============================================================================
// DesignPlan
// ============================================================================

/// Every randomized choice for one cover, fixed before any pixel is drawn
struct DesignPlan {
    std::string aesthetic;  // Descriptive only
    Palette palette;
    Color accent;
    BackgroundStyle background{BackgroundStyle::Solid};
    DecorationStyle decoration{DecorationStyle::None};
    LayoutVariant layout{LayoutVariant::Centered};
    f32 title_font_size{120.0f};
    f32 author_font_size{60.0f};
    bool shadow{false};
    bool separator{false};

    /// One-line summary for logs
    [[nodiscard]] std::string describe() const;
};

} // namespace folio::cover
