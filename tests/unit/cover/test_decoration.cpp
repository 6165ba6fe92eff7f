#include <gtest/gtest.h>
#include "folio/cover/decoration.hpp"
#include "folio/cover/palette.hpp"

using namespace folio;
using namespace folio::cover;

namespace {

DesignPlan make_design(DecorationStyle style) {
    DesignPlan design;
    design.palette = *find_palette("ocean");
    design.accent = Color(220, 200, 150);
    design.decoration = style;
    return design;
}

const DecorationStyle ALL_STYLES[] = {
    DecorationStyle::None,
    DecorationStyle::TopBottomBorder,
    DecorationStyle::FullFrame,
    DecorationStyle::CornerAccents,
    DecorationStyle::GeometricShapes,
};

} // anonymous namespace

TEST(DecorationTest, NoneDrawsNothing) {
    Random random(1);
    auto overlays = DecorationCompositor().plan(make_design(DecorationStyle::None),
                                                SizeI(100, 150), random);
    EXPECT_TRUE(overlays.empty());
}

TEST(DecorationTest, TopBottomBorderSpansWidth) {
    Random random(4);
    auto overlays = DecorationCompositor().plan(make_design(DecorationStyle::TopBottomBorder),
                                                SizeI(1600, 2400), random);
    ASSERT_EQ(overlays.size(), 2u);

    const auto& top = overlays[0].bounds;
    const auto& bottom = overlays[1].bounds;
    EXPECT_EQ(top.x, 0);
    EXPECT_EQ(top.y, 0);
    EXPECT_EQ(top.width, 1600);
    EXPECT_GE(top.height, 20);
    EXPECT_LE(top.height, 60);
    EXPECT_EQ(bottom.bottom(), 2400);
    EXPECT_EQ(bottom.height, top.height);
    EXPECT_EQ(overlays[0].color, Color(220, 200, 150));
}

TEST(DecorationTest, FrameScalesWithCanvas) {
    Random random(4);
    auto overlays = DecorationCompositor().plan(make_design(DecorationStyle::FullFrame),
                                                SizeI(400, 600), random);
    ASSERT_EQ(overlays.size(), 4u);

    // Reference 15-40px scaled by 400 / 1600
    i32 border = overlays[0].bounds.height;
    EXPECT_GE(border, 4);
    EXPECT_LE(border, 10);
    EXPECT_EQ(overlays[2].bounds.width, border);
    EXPECT_EQ(overlays[3].bounds.right(), 400);
}

TEST(DecorationTest, CornerAccentsStayInsideMargin) {
    Random random(12);
    auto overlays = DecorationCompositor().plan(make_design(DecorationStyle::CornerAccents),
                                                SizeI(1600, 2400), random);
    ASSERT_EQ(overlays.size(), 8u);

    RectI inner(40, 40, 1520, 2320);
    for (const auto& overlay : overlays) {
        EXPECT_TRUE(inner.contains(overlay.bounds));
    }
}

TEST(DecorationTest, GeometricShapesUseLightenedLightStop) {
    Random random(21);
    auto design = make_design(DecorationStyle::GeometricShapes);
    auto overlays = DecorationCompositor().plan(design, SizeI(1000, 1000), random);

    ASSERT_GE(overlays.size(), 2u);
    ASSERT_LE(overlays.size(), 5u);
    for (const auto& overlay : overlays) {
        EXPECT_EQ(overlay.shape, Overlay::Shape::Circle);
        EXPECT_GE(overlay.radius, 50);
        EXPECT_LE(overlay.radius, 250);
        i32 delta = overlay.color.r - design.palette.light().r;
        EXPECT_GE(delta, 10);
        EXPECT_LE(delta, 40);
    }
}

TEST(DecorationTest, NeverLeavesCanvas) {
    const SizeI sizes[] = {{1, 1}, {3, 500}, {64, 64}, {400, 600}, {1600, 2400}, {2500, 900}};

    for (auto size : sizes) {
        RectI bounds(0, 0, size.width, size.height);
        for (auto style : ALL_STYLES) {
            for (u32 seed = 0; seed < 40; ++seed) {
                Random random(seed);
                auto overlays = DecorationCompositor().plan(make_design(style), size, random);
                for (const auto& overlay : overlays) {
                    EXPECT_FALSE(overlay.bounds.is_empty());
                    EXPECT_TRUE(bounds.contains(overlay.bounds))
                        << to_string(style) << " at " << size.width << "x" << size.height;
                }
            }
        }
    }
}

TEST(DecorationTest, ComposePaintsOverlays) {
    auto canvas = raster::Canvas::create(200, 300);
    ASSERT_TRUE(canvas.has_value());
    Random random(2);

    auto overlays = DecorationCompositor().compose(*canvas, make_design(DecorationStyle::FullFrame),
                                                   random);
    ASSERT_FALSE(overlays.empty());
    EXPECT_EQ(canvas->pixel(0, 0), Color(220, 200, 150));
    EXPECT_EQ(canvas->pixel(199, 299), Color(220, 200, 150));
    EXPECT_EQ(canvas->pixel(100, 150), Color::black());
}

TEST(DecorationTest, LightenSaturates) {
    EXPECT_EQ(DecorationCompositor::lighten(Color(10, 250, 128), 20), Color(30, 255, 148));
}
