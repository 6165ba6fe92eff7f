#include <gtest/gtest.h>
#include "folio/text/font.hpp"
#include "folio/text/text_renderer.hpp"
#include "folio/text/word_wrap.hpp"
#include "folio/core/string.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

using namespace folio;
using namespace folio::text;

namespace {

namespace fs = std::filesystem;

bool is_font_file(const fs::path& path) {
    std::string ext = to_ascii_lowercase(path.extension().string());
    return ext == ".ttf" || ext == ".otf";
}

// Default chain entries first, then any installed TrueType/OpenType file
std::vector<std::string> candidate_fonts() {
    std::vector<std::string> candidates;
    std::error_code ec;
    for (const auto& path : FontContext::default_latin_chain()) {
        if (fs::is_regular_file(path, ec)) {
            candidates.push_back(path);
        }
    }

    for (const char* root : {"/usr/share/fonts", "/usr/local/share/fonts"}) {
        if (!fs::is_directory(root, ec)) continue;
        fs::recursive_directory_iterator it(
            root, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && is_font_file(it->path())) {
                candidates.push_back(it->path().string());
            }
        }
        ec.clear();
    }
    return candidates;
}

// First candidate that loads and has an inked 'A'
std::string find_latin_font(FontContext& context, f32 size) {
    for (const auto& path : candidate_fonts()) {
        auto font = context.load_font(path, size);
        if (!font) continue;
        auto glyph = font->rasterize_glyph(U'A');
        if (glyph && std::any_of(glyph->pixels.begin(), glyph->pixels.end(),
                                 [](u8 coverage) { return coverage > 0; })) {
            return path;
        }
    }
    return {};
}

class FreeTypeFontTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!context.is_available()) {
            GTEST_SKIP() << "FreeType unavailable";
        }
        path = find_latin_font(context, 48.0f);
        if (path.empty()) {
            GTEST_SKIP() << "No TrueType or OpenType font installed";
        }
        font = context.load_font(path, 48.0f);
        ASSERT_NE(font, nullptr);
    }

    FontContext context;
    std::string path;
    std::shared_ptr<Font> font;
};

} // anonymous namespace

TEST_F(FreeTypeFontTest, LoadsScaledFace) {
    EXPECT_FALSE(font->is_builtin());
    EXPECT_FLOAT_EQ(font->size(), 48.0f);
    EXPECT_GT(font->metrics().ascender, 0.0f);
    EXPECT_LT(font->metrics().descender, 0.0f);
    EXPECT_GT(font->measure_char(U'W'), 0.0f);
}

TEST_F(FreeTypeFontTest, ResolveServesCachedFace) {
    auto resolved = context.resolve({"/nonexistent/folio.ttf", path}, 48.0f);

    EXPECT_FALSE(resolved.used_builtin);
    EXPECT_EQ(resolved.source, path);
    EXPECT_EQ(resolved.font, font);
}

TEST_F(FreeTypeFontTest, WrappedLinesStayWithinWidth) {
    const std::string title = "The Courage to be Disliked and the Art of Quiet Persistence";
    const f32 max_width = 420.0f;

    auto lines = WordWrapper(*font).wrap(title, max_width);
    ASSERT_GT(lines.size(), 1u);

    for (const auto& line : lines) {
        if (split_whitespace(line).size() > 1) {
            EXPECT_LE(font->measure_text(line), max_width) << line;
        }
    }
    EXPECT_EQ(join(lines, " "), title);
}

TEST_F(FreeTypeFontTest, DrawTextInksCanvasInsideLineBox) {
    auto canvas = raster::Canvas::create(400, 80);
    ASSERT_TRUE(canvas.has_value());

    const PointI origin(10, 8);
    draw_text(*canvas, *font, origin, "Folio", Color::white());

    const i32 right = origin.x + static_cast<i32>(font->measure_text("Folio")) + 10;
    i32 inked = 0;
    for (i32 y = 0; y < canvas->height(); ++y) {
        for (i32 x = 0; x < canvas->width(); ++x) {
            if (canvas->pixel(x, y) != Color::black()) {
                ++inked;
                EXPECT_LT(x, right);
            }
        }
    }
    EXPECT_GT(inked, 0);
}

TEST(FreeTypeLifetimeTest, FontOutlivesContext) {
    std::shared_ptr<Font> font;
    {
        FontContext context;
        if (!context.is_available()) {
            GTEST_SKIP() << "FreeType unavailable";
        }
        std::string path = find_latin_font(context, 32.0f);
        if (path.empty()) {
            GTEST_SKIP() << "No TrueType or OpenType font installed";
        }
        font = context.load_font(path, 32.0f);
        ASSERT_NE(font, nullptr);
    }

    auto glyph = font->rasterize_glyph(U'B');
    ASSERT_TRUE(glyph.has_value());
    EXPECT_GT(glyph->width, 0);
    EXPECT_GT(font->measure_text("Folio"), 0.0f);
}
