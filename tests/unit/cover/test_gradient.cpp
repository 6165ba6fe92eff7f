#include <gtest/gtest.h>
#include "folio/cover/gradient.hpp"
#include <cstdlib>

using namespace folio;
using namespace folio::cover;

namespace {

const Palette TEST_PALETTE{"test", PaletteGroup::Cool,
                           {Color{0, 0, 0}, Color{100, 50, 200}, Color{200, 250, 0}}};

raster::Canvas make_canvas(i32 width, i32 height) {
    auto canvas = raster::Canvas::create(width, height);
    EXPECT_TRUE(canvas.has_value());
    return std::move(*canvas);
}

i32 channel_distance(const Color& a, const Color& b) {
    return std::max({std::abs(a.r - b.r), std::abs(a.g - b.g), std::abs(a.b - b.b)});
}

} // anonymous namespace

TEST(BlendTest, EndpointsAndMidpoint) {
    Color from(0, 100, 200);
    Color to(100, 200, 0);

    EXPECT_EQ(blend(from, to, 0.0), from);
    EXPECT_EQ(blend(from, to, 1.0), to);
    EXPECT_EQ(blend(from, to, 0.5), Color(50, 150, 100));
    EXPECT_EQ(blend(from, to, 7.0), to);
}

TEST(BlendTest, TwoBandsMeetAtMiddleStop) {
    EXPECT_EQ(two_band_blend(TEST_PALETTE, 0.0), TEST_PALETTE.stops[0]);
    EXPECT_EQ(two_band_blend(TEST_PALETTE, 0.5), TEST_PALETTE.stops[1]);
    EXPECT_EQ(two_band_blend(TEST_PALETTE, 1.0), TEST_PALETTE.stops[2]);

    Color below = two_band_blend(TEST_PALETTE, 0.4999);
    EXPECT_LE(channel_distance(below, TEST_PALETTE.stops[1]), 1);
}

TEST(GradientTest, SolidUsesFirstStop) {
    auto canvas = make_canvas(7, 5);
    Random random(1);
    GradientRenderer().render(canvas, TEST_PALETTE, BackgroundStyle::Solid, random);

    EXPECT_EQ(canvas.pixel(0, 0), TEST_PALETTE.stops[0]);
    EXPECT_EQ(canvas.pixel(6, 4), TEST_PALETTE.stops[0]);
}

TEST(GradientTest, VerticalRunsTopToBottom) {
    auto canvas = make_canvas(3, 1000);
    Random random(1);
    GradientRenderer().render(canvas, TEST_PALETTE, BackgroundStyle::VerticalGradient, random);

    EXPECT_EQ(canvas.pixel(0, 0), TEST_PALETTE.stops[0]);
    EXPECT_LE(channel_distance(canvas.pixel(0, 999), TEST_PALETTE.stops[2]), 1);
    EXPECT_EQ(canvas.pixel(1, 500), TEST_PALETTE.stops[1]);
    EXPECT_LE(channel_distance(canvas.pixel(1, 499), TEST_PALETTE.stops[1]), 1);

    // Each row is a single color
    EXPECT_EQ(canvas.pixel(0, 321), canvas.pixel(2, 321));
}

TEST(GradientTest, VerticalIsContinuous) {
    auto canvas = make_canvas(1, 1000);
    Random random(1);
    GradientRenderer().render(canvas, TEST_PALETTE, BackgroundStyle::VerticalGradient, random);

    for (i32 y = 1; y < 1000; ++y) {
        EXPECT_LE(channel_distance(canvas.pixel(0, y - 1), canvas.pixel(0, y)), 1) << "row " << y;
    }
}

TEST(GradientTest, RadialCenterToCorner) {
    auto canvas = make_canvas(101, 101);
    Random random(1);
    GradientRenderer(1).render(canvas, TEST_PALETTE, BackgroundStyle::RadialGradient, random);

    EXPECT_EQ(canvas.pixel(50, 50), TEST_PALETTE.stops[0]);
    EXPECT_EQ(canvas.pixel(0, 0), TEST_PALETTE.stops[2]);
    EXPECT_EQ(canvas.pixel(100, 100), TEST_PALETTE.stops[2]);
}

TEST(GradientTest, RadialCenterAtDefaultStride) {
    for (i32 size : {30, 38, 102, 1602}) {
        auto canvas = make_canvas(size, size);
        Random random(1);
        GradientRenderer().render(canvas, TEST_PALETTE, BackgroundStyle::RadialGradient, random);

        EXPECT_EQ(canvas.pixel(size / 2, size / 2), TEST_PALETTE.stops[0]) << size;
        EXPECT_EQ(canvas.pixel(0, 0), TEST_PALETTE.stops[2]) << size;
    }
}

TEST(GradientTest, RadialCenterWithWideStride) {
    auto canvas = make_canvas(61, 40);
    Random random(1);
    GradientRenderer(7).render(canvas, TEST_PALETTE, BackgroundStyle::RadialGradient, random);

    EXPECT_EQ(canvas.pixel(30, 20), TEST_PALETTE.stops[0]);
    // Same run as the center column
    EXPECT_EQ(canvas.pixel(36, 20), TEST_PALETTE.stops[0]);
    EXPECT_NE(canvas.pixel(29, 20), TEST_PALETTE.stops[0]);
}

TEST(GradientTest, RadialSinglePixel) {
    auto canvas = make_canvas(1, 1);
    Random random(1);
    GradientRenderer().render(canvas, TEST_PALETTE, BackgroundStyle::RadialGradient, random);

    EXPECT_EQ(canvas.pixel(0, 0), TEST_PALETTE.stops[0]);
}

TEST(GradientTest, SampleStrideHoldsColorAcrossRun) {
    auto canvas = make_canvas(16, 4);
    Random random(1);
    GradientRenderer renderer(4);
    EXPECT_EQ(renderer.sample_stride(), 4);
    renderer.render(canvas, TEST_PALETTE, BackgroundStyle::DiagonalGradient, random);

    EXPECT_EQ(canvas.pixel(0, 2), canvas.pixel(3, 2));
    EXPECT_EQ(canvas.pixel(4, 2), canvas.pixel(7, 2));
    EXPECT_EQ(canvas.pixel(0, 0), TEST_PALETTE.stops[0]);
}

TEST(GradientTest, StrideIsAtLeastOne) {
    EXPECT_EQ(GradientRenderer(0).sample_stride(), 1);
    EXPECT_EQ(GradientRenderer(-3).sample_stride(), 1);
}

TEST(GradientTest, DiagonalFullResolutionIsContinuous) {
    auto canvas = make_canvas(300, 400);
    Random random(1);
    GradientRenderer(1).render(canvas, TEST_PALETTE, BackgroundStyle::DiagonalGradient, random);

    for (i32 x = 1; x < 300; ++x) {
        EXPECT_LE(channel_distance(canvas.pixel(x - 1, 200), canvas.pixel(x, 200)), 2);
    }
}

TEST(GradientTest, TwoToneSplitsWithinMiddleBand) {
    for (u32 seed = 0; seed < 50; ++seed) {
        auto canvas = make_canvas(2, 100);
        Random random(seed);
        GradientRenderer().render(canvas, TEST_PALETTE, BackgroundStyle::TwoTone, random);

        EXPECT_EQ(canvas.pixel(0, 0), TEST_PALETTE.stops[0]);
        EXPECT_EQ(canvas.pixel(0, 29), TEST_PALETTE.stops[0]);
        EXPECT_EQ(canvas.pixel(1, 70), TEST_PALETTE.stops[1]);
        EXPECT_EQ(canvas.pixel(1, 99), TEST_PALETTE.stops[1]);
    }
}

TEST(GradientTest, OnlyTwoToneDrawsRandomness) {
    auto canvas = make_canvas(8, 8);
    Random used(9);
    Random untouched(9);

    GradientRenderer().render(canvas, TEST_PALETTE, BackgroundStyle::RadialGradient, used);
    EXPECT_EQ(used.uniform_int(0, 1 << 30), untouched.uniform_int(0, 1 << 30));
}
