#pragma once

#include "folio/core/types.hpp"
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace folio::cover {

enum class PaletteGroup : u8 {
    Dark,
    Vibrant,
    Earthy,
    Cool
};

[[nodiscard]] std::string_view to_string(PaletteGroup group);

/// Three gradient stops ordered dark, mid, light
struct Palette {
    static constexpr usize STOP_COUNT = 3;

    std::string name;
    PaletteGroup group{PaletteGroup::Dark};
    std::array<Color, STOP_COUNT> stops;

    [[nodiscard]] const Color& dark() const { return stops[0]; }
    [[nodiscard]] const Color& mid() const { return stops[1]; }
    [[nodiscard]] const Color& light() const { return stops[2]; }

    [[nodiscard]] bool operator==(const Palette& other) const {
        return name == other.name && group == other.group && stops == other.stops;
    }
};

/// The fixed palette library, in a stable order
[[nodiscard]] const std::vector<Palette>& palette_library();

/// Looks up a palette by name; nullptr when absent
[[nodiscard]] const Palette* find_palette(std::string_view name);

} // namespace folio::cover
