#include "folio/cover/design_plan.hpp"

namespace folio::cover {

std::string_view to_string(BackgroundStyle style) {
    switch (style) {
        case BackgroundStyle::Solid:            return "solid";
        case BackgroundStyle::VerticalGradient: return "vertical-gradient";
        case BackgroundStyle::DiagonalGradient: return "diagonal-gradient";
        case BackgroundStyle::RadialGradient:   return "radial-gradient";
        case BackgroundStyle::TwoTone:          return "two-tone";
    }
    return "unknown";
}

std::string_view to_string(DecorationStyle style) {
    switch (style) {
        case DecorationStyle::None:            return "none";
        case DecorationStyle::TopBottomBorder: return "top-bottom-border";
        case DecorationStyle::FullFrame:       return "full-frame";
        case DecorationStyle::CornerAccents:   return "corner-accents";
        case DecorationStyle::GeometricShapes: return "geometric-shapes";
    }
    return "unknown";
}

std::string_view to_string(LayoutVariant variant) {
    switch (variant) {
        case LayoutVariant::Centered:    return "centered";
        case LayoutVariant::TopHeavy:    return "top-heavy";
        case LayoutVariant::BottomHeavy: return "bottom-heavy";
        case LayoutVariant::Split:       return "split";
    }
    return "unknown";
}

std::string DesignPlan::describe() const {
    std::string result;
    result += "aesthetic=" + aesthetic;
    result += " palette=" + palette.name;
    result += " background=";
    result += to_string(background);
    result += " decoration=";
    result += to_string(decoration);
    result += " layout=";
    result += to_string(layout);
    result += " accent=(" + std::to_string(accent.r) + "," + std::to_string(accent.g) +
              "," + std::to_string(accent.b) + ")";
    result += " title_size=" + std::to_string(static_cast<i32>(title_font_size));
    result += " author_size=" + std::to_string(static_cast<i32>(author_font_size));
    result += shadow ? " shadow" : "";
    result += separator ? " separator" : "";
    return result;
}

} // namespace folio::cover
