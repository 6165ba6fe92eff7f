#include <gtest/gtest.h>
#include "folio/cover/cover_engine.hpp"
#include <algorithm>

using namespace folio;
using namespace folio::cover;

namespace {

// Empty chains force the built-in font so results do not depend on the host
CoverConfig builtin_only_config() {
    CoverConfig config;
    config.latin_fonts.clear();
    config.cjk_fonts.clear();
    return config;
}

CoverRequest small_request() {
    CoverRequest request;
    request.title = "The Courage to be Disliked";
    request.author = "Ichiro Kishimi";
    request.width = 160;
    request.height = 240;
    return request;
}

class CoverEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!engine.capabilities().rasterizer) {
            GTEST_SKIP() << "Font rasterizer unavailable";
        }
    }

    CoverEngine engine{builtin_only_config()};
};

} // anonymous namespace

TEST(CoverValidationTest, RejectsNonPositiveDimensions) {
    CoverConfig config;
    CoverRequest request = small_request();

    request.width = 0;
    auto zero_width = CoverEngine::validate(request, config);
    ASSERT_TRUE(zero_width.is_err());
    EXPECT_EQ(zero_width.error().kind, CoverErrorKind::InvalidDimensions);

    request.width = 100;
    request.height = -4;
    EXPECT_TRUE(CoverEngine::validate(request, config).is_err());

    request.height = 100;
    EXPECT_TRUE(CoverEngine::validate(request, config).is_ok());
}

TEST(CoverValidationTest, RejectsOversizedDimensions) {
    CoverConfig config;
    config.max_dimension = 1000;
    CoverRequest request = small_request();
    request.height = 1001;

    auto result = CoverEngine::validate(request, config);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, CoverErrorKind::InvalidDimensions);
}

TEST_F(CoverEngineTest, ZeroSizeFailsBeforeDrawing) {
    CoverRequest request = small_request();
    request.height = 0;
    Random random(1);

    auto result = engine.render(request, random);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, CoverErrorKind::InvalidDimensions);

    auto encoded = engine.render_encoded(request, random);
    ASSERT_TRUE(encoded.is_err());
    EXPECT_EQ(encoded.error().kind, CoverErrorKind::InvalidDimensions);
}

TEST_F(CoverEngineTest, RendersWithBuiltinFont) {
    Random random(42);
    auto result = engine.render(small_request(), random);
    ASSERT_TRUE(result.is_ok());

    const RenderResult& cover = result.value();
    EXPECT_EQ(cover.canvas.width(), 160);
    EXPECT_EQ(cover.canvas.height(), 240);
    EXPECT_TRUE(cover.fonts.used_builtin_font);
    EXPECT_EQ(cover.fonts.title_source, "builtin");
    EXPECT_FALSE(cover.layout.lines(TextRole::Title).empty());
    EXPECT_FALSE(cover.layout.lines(TextRole::Author).empty());
    EXPECT_FLOAT_EQ(cover.plan.title_font_size, 12.0f);
}

TEST_F(CoverEngineTest, SameSeedIsPixelIdentical) {
    for (u32 seed : {1u, 7u, 99u, 4096u}) {
        Random a(seed);
        Random b(seed);
        auto first = engine.render(small_request(), a);
        auto second = engine.render(small_request(), b);

        ASSERT_TRUE(first.is_ok());
        ASSERT_TRUE(second.is_ok());
        EXPECT_EQ(first.value().canvas, second.value().canvas) << "seed " << seed;
        EXPECT_EQ(first.value().plan.describe(), second.value().plan.describe());
    }
}

TEST_F(CoverEngineTest, RequestSeedIsUsed) {
    CoverRequest request = small_request();
    request.seed = 1234;

    auto first = engine.render(request);
    auto second = engine.render(request);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value().canvas, second.value().canvas);
}

TEST_F(CoverEngineTest, DifferentSeedsVary) {
    std::vector<std::string> plans;
    for (u32 seed = 0; seed < 10; ++seed) {
        Random random(seed);
        auto result = engine.render(small_request(), random);
        ASSERT_TRUE(result.is_ok());
        plans.push_back(result.value().plan.describe());
    }

    std::sort(plans.begin(), plans.end());
    EXPECT_GT(std::unique(plans.begin(), plans.end()) - plans.begin(), 1);
}

TEST_F(CoverEngineTest, TitleOnlyAndWideText) {
    CoverRequest request;
    request.title = "\xE5\xAB\x8C\xE3\x82\x8F\xE3\x82\x8C\xE3\x82\x8B\xE5\x8B\x87\xE6\xB0\x97";
    request.width = 120;
    request.height = 180;
    Random random(3);

    auto result = engine.render(request, random);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().layout.lines(TextRole::Author).empty());
    EXPECT_FALSE(result.value().layout.lines(TextRole::Title).empty());
}

TEST_F(CoverEngineTest, EncodesWhenAvailable) {
    Random random(10);
    auto encoded = engine.render_encoded(small_request(), random);

    if (!engine.capabilities().encoder) {
        ASSERT_TRUE(encoded.is_err());
        EXPECT_EQ(encoded.error().kind, CoverErrorKind::Unavailable);
        return;
    }

    ASSERT_TRUE(encoded.is_ok());
    EXPECT_FALSE(encoded.value().bytes.empty());
    EXPECT_EQ(encoded.value().file_name(), "cover.jpg");
    EXPECT_EQ(detect_format(encoded.value().bytes), ImageFormat::Jpeg);
}

TEST_F(CoverEngineTest, PremadeCoverErrors) {
    auto result = engine.load_premade_cover("/nonexistent/folio/cover.png");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, CoverErrorKind::IoFailure);
}

TEST(CoverEngineCapabilityTest, AvailabilityNeedsBothCapabilities) {
    CoverEngine engine(builtin_only_config());
    const auto& caps = engine.capabilities();

    EXPECT_EQ(caps.encoder, encoder_available());
    EXPECT_EQ(engine.is_available(), caps.rasterizer && caps.encoder);
}
