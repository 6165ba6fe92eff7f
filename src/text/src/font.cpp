/**
 * Font implementation (FreeType faces, measurement, fallback chain)
 */

#include "folio/text/font.hpp"
#include "folio/core/logger.hpp"
#include <cmath>
#include <fstream>
#include <utility>

#include <ft2build.h>
#include FT_FREETYPE_H

namespace folio::text {

// ============================================================================
// Font
// ============================================================================

f32 Font::measure_text(std::string_view text) const {
    f32 width = 0;
    unicode::CodePoint prev = 0;

    for (unicode::CodePoint cp : unicode::decode(text)) {
        width += measure_char(cp);
        if (prev) {
            width += get_kerning(prev, cp);
        }
        prev = cp;
    }
    return width;
}

TextExtent Font::measure(std::string_view text) const {
    return {measure_text(text), metrics().box_height()};
}

// ============================================================================
// FreeType Font implementation
// ============================================================================

namespace {

// Shared by the context and every face it opened; the library goes away
// with the last of them
struct FreeTypeLibrary {
    FT_Library handle{nullptr};

    FreeTypeLibrary() = default;
    FreeTypeLibrary(const FreeTypeLibrary&) = delete;
    FreeTypeLibrary& operator=(const FreeTypeLibrary&) = delete;

    ~FreeTypeLibrary() {
        if (handle) {
            FT_Done_FreeType(handle);
        }
    }
};

class FreeTypeFont : public Font {
public:
    FreeTypeFont(std::shared_ptr<FreeTypeLibrary> library, FT_Face face, f32 size)
        : m_library(std::move(library))
        , m_face(face)
        , m_size(size)
    {
        if (m_face->family_name) {
            m_family = m_face->family_name;
        }

        m_metrics.ascender = m_face->size->metrics.ascender / 64.0f;
        m_metrics.descender = m_face->size->metrics.descender / 64.0f;
        m_metrics.line_gap = (m_face->size->metrics.height / 64.0f) -
                             (m_metrics.ascender - m_metrics.descender);
    }

    ~FreeTypeFont() override {
        FT_Done_Face(m_face);
    }

    FreeTypeFont(const FreeTypeFont&) = delete;
    FreeTypeFont& operator=(const FreeTypeFont&) = delete;

    const std::string& family() const override { return m_family; }
    f32 size() const override { return m_size; }
    bool is_builtin() const override { return false; }

    FontMetrics metrics() const override { return m_metrics; }

    std::optional<GlyphBitmap> rasterize_glyph(unicode::CodePoint cp) const override {
        if (FT_Load_Char(m_face, cp, FT_LOAD_RENDER)) {
            return std::nullopt;
        }

        const FT_GlyphSlot slot = m_face->glyph;
        const FT_Bitmap& bitmap = slot->bitmap;

        GlyphBitmap result;
        result.width = static_cast<i32>(bitmap.width);
        result.height = static_cast<i32>(bitmap.rows);
        result.bearing_x = slot->bitmap_left;
        result.bearing_y = slot->bitmap_top;
        result.pixels.resize(static_cast<usize>(result.width) * static_cast<usize>(result.height));

        i32 pitch = std::abs(bitmap.pitch);
        for (i32 y = 0; y < result.height; ++y) {
            const u8* row = bitmap.buffer + static_cast<isize>(y) * pitch;
            for (i32 x = 0; x < result.width; ++x) {
                u8 coverage;
                if (bitmap.pixel_mode == FT_PIXEL_MODE_MONO) {
                    coverage = (row[x >> 3] & (0x80 >> (x & 7))) ? 255 : 0;
                } else {
                    coverage = row[x];
                }
                result.pixels[static_cast<usize>(y) * result.width + x] = coverage;
            }
        }

        return result;
    }

    f32 get_kerning(unicode::CodePoint left, unicode::CodePoint right) const override {
        if (!FT_HAS_KERNING(m_face)) return 0;

        FT_UInt left_index = FT_Get_Char_Index(m_face, left);
        FT_UInt right_index = FT_Get_Char_Index(m_face, right);

        FT_Vector kerning;
        if (FT_Get_Kerning(m_face, left_index, right_index, FT_KERNING_DEFAULT, &kerning)) {
            return 0;
        }
        return kerning.x / 64.0f;
    }

    f32 measure_char(unicode::CodePoint cp) const override {
        auto it = m_advances.find(cp);
        if (it != m_advances.end()) {
            return it->second;
        }

        f32 advance = m_size * 0.6f;
        if (!FT_Load_Char(m_face, cp, FT_LOAD_DEFAULT)) {
            advance = m_face->glyph->advance.x / 64.0f;
        }
        m_advances.emplace(cp, advance);
        return advance;
    }

private:
    std::shared_ptr<FreeTypeLibrary> m_library;  // Outlives m_face
    FT_Face m_face;
    std::string m_family{"unknown"};
    f32 m_size;
    FontMetrics m_metrics;
    mutable std::unordered_map<unicode::CodePoint, f32> m_advances;
};

std::string cache_key(const std::string& path, f32 size) {
    return path + "@" + std::to_string(static_cast<i32>(std::lround(size * 64.0f)));
}

} // anonymous namespace

// ============================================================================
// FontContext implementation
// ============================================================================

struct FontContext::FontData {
    std::shared_ptr<FreeTypeLibrary> library;
};

FontContext::FontContext() : m_data(std::make_unique<FontData>()) {
    auto library = std::make_shared<FreeTypeLibrary>();
    if (FT_Init_FreeType(&library->handle)) {
        library->handle = nullptr;
        FOLIO_LOG_ERROR("FreeType failed to initialize; text rasterization unavailable");
        return;
    }
    m_data->library = std::move(library);
}

FontContext::~FontContext() = default;

bool FontContext::is_available() const noexcept {
    return m_data->library != nullptr;
}

std::shared_ptr<Font> FontContext::load_font(const std::string& path, f32 size) {
    if (!m_data->library || path.empty() || size <= 0) {
        return nullptr;
    }

    std::string key = cache_key(path, size);
    auto it = m_cache.find(key);
    if (it != m_cache.end()) {
        return it->second;
    }

    if (m_failed_paths.count(path)) {
        return nullptr;
    }

    // FT_New_Face reports missing files as a generic error; check first so
    // the log says which case it was
    if (!std::ifstream(path, std::ios::binary)) {
        FOLIO_LOG_DEBUG("Font not found: " + path);
        m_failed_paths.insert(path);
        return nullptr;
    }

    FT_Face face = nullptr;
    if (FT_New_Face(m_data->library->handle, path.c_str(), 0, &face)) {
        FOLIO_LOG_WARN("Font could not be parsed: " + path);
        m_failed_paths.insert(path);
        return nullptr;
    }

    if (FT_Set_Pixel_Sizes(face, 0, static_cast<FT_UInt>(std::lround(size)))) {
        FOLIO_LOG_WARN("Font cannot be scaled to " + std::to_string(size) + "px: " + path);
        FT_Done_Face(face);
        return nullptr;
    }

    auto font = std::make_shared<FreeTypeFont>(m_data->library, face, size);
    m_cache.emplace(std::move(key), font);
    return font;
}

FontResolution FontContext::resolve(const FontChain& chain, f32 size) {
    for (const auto& path : chain) {
        if (auto font = load_font(path, size)) {
            return {std::move(font), path, false};
        }
    }

    FOLIO_LOG_WARN("No font in the fallback chain loaded; using built-in font at " +
                   std::to_string(static_cast<i32>(size)) + "px");
    return {create_builtin_font(size), "builtin", true};
}

void FontContext::clear_cache() {
    m_cache.clear();
    m_failed_paths.clear();
}

FontChain FontContext::default_latin_chain() {
    FontChain chain;
#ifdef __linux__
    chain.push_back("/usr/share/fonts/truetype/dejavu/DejaVuSerif-Bold.ttf");
    chain.push_back("/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf");
    chain.push_back("/usr/share/fonts/truetype/liberation/LiberationSerif-Bold.ttf");
    chain.push_back("/usr/share/fonts/TTF/DejaVuSans-Bold.ttf");
    chain.push_back("/usr/share/fonts/dejavu-sans-fonts/DejaVuSans-Bold.ttf");
#elif defined(_WIN32)
    chain.push_back("C:\\Windows\\Fonts\\georgiab.ttf");
    chain.push_back("C:\\Windows\\Fonts\\arialbd.ttf");
#elif defined(__APPLE__)
    chain.push_back("/System/Library/Fonts/Supplemental/Georgia Bold.ttf");
    chain.push_back("/Library/Fonts/Arial Bold.ttf");
    chain.push_back("/System/Library/Fonts/Helvetica.ttc");
#endif
    return chain;
}

FontChain FontContext::default_cjk_chain() {
    FontChain chain;
#ifdef __linux__
    chain.push_back("/usr/share/fonts/opentype/noto/NotoSansCJK-Bold.ttc");
    chain.push_back("/usr/share/fonts/noto-cjk/NotoSansCJK-Bold.ttc");
    chain.push_back("/usr/share/fonts/truetype/wqy/wqy-zenhei.ttc");
    chain.push_back("/usr/share/fonts/wenquanyi/wqy-zenhei/wqy-zenhei.ttc");
#elif defined(_WIN32)
    chain.push_back("C:\\Windows\\Fonts\\msyhbd.ttc");
    chain.push_back("C:\\Windows\\Fonts\\msgothic.ttc");
#elif defined(__APPLE__)
    chain.push_back("/System/Library/Fonts/PingFang.ttc");
    chain.push_back("/System/Library/Fonts/Hiragino Sans GB.ttc");
#endif
    return chain;
}

} // namespace folio::text
