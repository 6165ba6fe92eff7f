#pragma once

#include "folio/core/types.hpp"
#include "folio/core/string.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace folio::text {

// ============================================================================
// Font Metrics
// ============================================================================

struct FontMetrics {
    f32 ascender{0};       // Distance from baseline to top
    f32 descender{0};      // Distance from baseline to bottom (negative)
    f32 line_gap{0};       // Extra spacing between lines

    /// Height of one line box, without the font's own line gap
    [[nodiscard]] f32 box_height() const { return ascender - descender; }
};

// ============================================================================
// Glyph Bitmap
// ============================================================================

struct GlyphBitmap {
    std::vector<u8> pixels;  // Coverage only, row-major
    i32 width{0};
    i32 height{0};
    i32 bearing_x{0};        // Offset from pen position to left edge
    i32 bearing_y{0};        // Offset from baseline up to top edge
};

struct TextExtent {
    f32 width{0};
    f32 height{0};
};

// ============================================================================
// Font
// ============================================================================

class Font {
public:
    virtual ~Font() = default;

    [[nodiscard]] virtual const std::string& family() const = 0;
    [[nodiscard]] virtual f32 size() const = 0;

    /// True for the compiled-in bitmap font used when no font file loads
    [[nodiscard]] virtual bool is_builtin() const = 0;

    [[nodiscard]] virtual FontMetrics metrics() const = 0;

    [[nodiscard]] virtual std::optional<GlyphBitmap> rasterize_glyph(unicode::CodePoint cp) const = 0;
    [[nodiscard]] virtual f32 get_kerning(unicode::CodePoint left, unicode::CodePoint right) const = 0;
    [[nodiscard]] virtual f32 measure_char(unicode::CodePoint cp) const = 0;

    /// Sum of advances plus pair kerning; the text renderer advances its pen
    /// by exactly these amounts
    [[nodiscard]] f32 measure_text(std::string_view text) const;

    /// Width from measure_text, height of one line box
    [[nodiscard]] TextExtent measure(std::string_view text) const;
};

/// Creates the compiled-in 5x7 bitmap font scaled to `size` pixels
[[nodiscard]] std::shared_ptr<Font> create_builtin_font(f32 size);

// ============================================================================
// Font Context - Manages font loading, caching and fallback
// ============================================================================

/// Ordered list of font file paths, tried first to last
using FontChain = std::vector<std::string>;

struct FontResolution {
    std::shared_ptr<Font> font;
    std::string source;        // Path that loaded, or "builtin"
    bool used_builtin{false};
};

class FontContext {
public:
    FontContext();
    ~FontContext();

    FontContext(const FontContext&) = delete;
    FontContext& operator=(const FontContext&) = delete;

    /// Whether the FreeType library initialized; checked once at construction
    [[nodiscard]] bool is_available() const noexcept;

    /// Loads a font file at a pixel size; nullptr when the file cannot be used.
    /// Returned fonts keep the FreeType library alive and may outlive the context.
    [[nodiscard]] std::shared_ptr<Font> load_font(const std::string& path, f32 size);

    /// Tries each chain entry in order, falling through to the built-in font
    [[nodiscard]] FontResolution resolve(const FontChain& chain, f32 size);

    void clear_cache();

    [[nodiscard]] usize cached_font_count() const noexcept { return m_cache.size(); }

    // Common install locations for bold latin and CJK faces
    [[nodiscard]] static FontChain default_latin_chain();
    [[nodiscard]] static FontChain default_cjk_chain();

private:
    struct FontData;
    std::unique_ptr<FontData> m_data;

    std::unordered_map<std::string, std::shared_ptr<Font>> m_cache;  // "path@size" -> font
    std::unordered_set<std::string> m_failed_paths;
};

} // namespace folio::text
