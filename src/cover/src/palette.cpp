#include "folio/cover/palette.hpp"

namespace folio::cover {

std::string_view to_string(PaletteGroup group) {
    switch (group) {
        case PaletteGroup::Dark:    return "dark";
        case PaletteGroup::Vibrant: return "vibrant";
        case PaletteGroup::Earthy:  return "earthy";
        case PaletteGroup::Cool:    return "cool";
    }
    return "unknown";
}

const std::vector<Palette>& palette_library() {
    static const std::vector<Palette> library = {
        // Dark
        {"midnight",   PaletteGroup::Dark,    {Color{15, 23, 42},  Color{30, 58, 95},   Color{71, 118, 172}}},
        {"navy",       PaletteGroup::Dark,    {Color{10, 25, 47},  Color{23, 55, 94},   Color{70, 110, 160}}},
        {"charcoal",   PaletteGroup::Dark,    {Color{24, 24, 27},  Color{63, 63, 70},   Color{113, 113, 122}}},
        {"deep_plum",  PaletteGroup::Dark,    {Color{36, 14, 42},  Color{88, 36, 92},   Color{150, 90, 150}}},
        // Vibrant
        {"sunset",     PaletteGroup::Vibrant, {Color{94, 22, 54},  Color{214, 72, 67},  Color{252, 176, 69}}},
        {"electric",   PaletteGroup::Vibrant, {Color{40, 10, 90},  Color{120, 40, 200}, Color{0, 200, 255}}},
        {"coral",      PaletteGroup::Vibrant, {Color{120, 30, 60}, Color{240, 100, 90}, Color{255, 200, 150}}},
        {"rose",       PaletteGroup::Vibrant, {Color{90, 20, 50},  Color{190, 60, 100}, Color{245, 170, 190}}},
        // Earthy
        {"forest",     PaletteGroup::Earthy,  {Color{20, 40, 25},  Color{50, 90, 55},   Color{140, 170, 110}}},
        {"terracotta", PaletteGroup::Earthy,  {Color{70, 30, 20},  Color{170, 80, 50},  Color{230, 170, 120}}},
        {"desert",     PaletteGroup::Earthy,  {Color{80, 55, 35},  Color{170, 125, 80}, Color{235, 210, 170}}},
        {"timber",     PaletteGroup::Earthy,  {Color{50, 30, 15},  Color{120, 80, 45},  Color{200, 160, 110}}},
        // Cool
        {"ocean",      PaletteGroup::Cool,    {Color{5, 30, 60},   Color{20, 100, 140}, Color{120, 200, 220}}},
        {"steel",      PaletteGroup::Cool,    {Color{30, 40, 55},  Color{70, 100, 130}, Color{170, 190, 210}}},
        {"arctic",     PaletteGroup::Cool,    {Color{20, 50, 80},  Color{90, 140, 180}, Color{210, 230, 245}}},
        {"lavender",   PaletteGroup::Cool,    {Color{45, 35, 80},  Color{110, 90, 160}, Color{200, 190, 235}}},
    };
    return library;
}

const Palette* find_palette(std::string_view name) {
    for (const auto& palette : palette_library()) {
        if (palette.name == name) {
            return &palette;
        }
    }
    return nullptr;
}

} // namespace folio::cover
