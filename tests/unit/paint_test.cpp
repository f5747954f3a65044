#include <easel/core/error.h>
#include <easel/paint/blend_mode.h>
#include <easel/paint/color.h>
#include <easel/paint/paint.h>
#include <easel/raster/pixmap.h>
#include <gtest/gtest.h>
#include <cmath>
#include <functional>
#include <limits>
#include <string>
#include <variant>
#include <vector>

using easel::core::Error;
using easel::core::ErrorKind;
using easel::geometry::AffineTransform;
using easel::geometry::Point;
using namespace easel::paint;

namespace {

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected an error";
    return ErrorKind::InvalidGeometry;
}

GradientStops two_stops() {
    return {{0.0f, Color::black()}, {1.0f, Color::white()}};
}

} // namespace

// ------------------------------------------------------------------
// 1. Color
// ------------------------------------------------------------------

TEST(ColorTest, FromRgba8Premultiplies) {
    Color c = Color::from_rgba8(200, 100, 0, 255);
    EXPECT_FLOAT_EQ(c.red(), 200.0f / 255.0f);
    EXPECT_FLOAT_EQ(c.green(), 100.0f / 255.0f);
    EXPECT_TRUE(c.is_opaque());

    Color half = Color::from_rgba8(255, 0, 0, 128);
    EXPECT_NEAR(half.red(), half.alpha(), 1e-6);
}

TEST(ColorTest, ToRgba8KeepsPremultipliedBytes) {
    auto bytes = Color::from_rgba8(255, 255, 255, 128).to_rgba8();
    EXPECT_EQ(bytes[0], 128);
    EXPECT_EQ(bytes[1], 128);
    EXPECT_EQ(bytes[2], 128);
    EXPECT_EQ(bytes[3], 128);
}

TEST(ColorTest, FromPremultipliedClampsToAlpha) {
    Color c = Color::from_premultiplied(0.9f, 0.1f, 0.0f, 0.5f);
    EXPECT_FLOAT_EQ(c.red(), 0.5f);
    EXPECT_FLOAT_EQ(c.green(), 0.1f);
}

TEST(ColorTest, TransparentColorKeepsStraightChannels) {
    Color c = Color::from_rgba8(0, 0, 255, 0);
    EXPECT_TRUE(c.is_transparent());
    EXPECT_FLOAT_EQ(c.blue(), 0.0f);
    EXPECT_FLOAT_EQ(c.straight_blue(), 1.0f);
    EXPECT_FLOAT_EQ(c.straight_red(), 0.0f);
}

TEST(ColorTest, BlendModeNames) {
    EXPECT_STREQ(blend_mode_name(BlendMode::SourceOver), "source-over");
    EXPECT_STREQ(blend_mode_name(BlendMode::Luminosity), "luminosity");
}

// ------------------------------------------------------------------
// 2. Gradient construction
// ------------------------------------------------------------------

TEST(GradientTest, EmptyStopsRejected) {
    EXPECT_EQ(kind_of([] {
        (void)make_linear_gradient({0, 0}, {10, 0}, {}, SpreadMode::Pad,
                                   AffineTransform::identity());
    }), ErrorKind::InvalidGradient);
}

TEST(GradientTest, SingleStopBecomesSolid) {
    Color red = Color::from_rgba8(255, 0, 0, 255);
    Paint p = make_linear_gradient({0, 0}, {10, 0}, {{0.3f, red}}, SpreadMode::Pad,
                                   AffineTransform::identity());
    ASSERT_TRUE(std::holds_alternative<SolidColor>(p));
    EXPECT_EQ(std::get<SolidColor>(p).color, red);
}

TEST(GradientTest, CoincidentPointsUseLastStop) {
    Paint p = make_linear_gradient({5, 5}, {5, 5}, two_stops(), SpreadMode::Pad,
                                   AffineTransform::identity());
    ASSERT_TRUE(std::holds_alternative<SolidColor>(p));
    EXPECT_EQ(std::get<SolidColor>(p).color, Color::white());
}

TEST(GradientTest, ZeroSizeRadialUsesLastStop) {
    Paint p = make_radial_gradient({5, 5}, 3, {5, 5}, 3, two_stops(), SpreadMode::Pad,
                                   AffineTransform::identity());
    EXPECT_TRUE(std::holds_alternative<SolidColor>(p));
    EXPECT_FALSE(is_zero_size_gradient(p));
}

TEST(GradientTest, StopsAreStablySorted) {
    Color a = Color::from_rgba8(255, 0, 0, 255);
    Color b = Color::from_rgba8(0, 255, 0, 255);
    Color c = Color::from_rgba8(0, 0, 255, 255);
    GradientStops sorted = sort_gradient_stops({{0.5f, a}, {0.5f, b}, {0.0f, c}});
    ASSERT_EQ(sorted.size(), 3u);
    EXPECT_EQ(sorted[0].color, c);
    EXPECT_EQ(sorted[1].color, a);
    EXPECT_EQ(sorted[2].color, b);
}

TEST(GradientTest, SortClampsOffsets) {
    GradientStops sorted = sort_gradient_stops({{1.5f, Color::white()}, {-2.0f, Color::black()}});
    EXPECT_FLOAT_EQ(sorted[0].offset, 0.0f);
    EXPECT_FLOAT_EQ(sorted[1].offset, 1.0f);
}

TEST(GradientTest, LinearKeepsSortedStops) {
    Paint p = make_linear_gradient({0, 0}, {10, 0},
                                   {{1.0f, Color::white()}, {0.0f, Color::black()}},
                                   SpreadMode::Repeat, AffineTransform::identity());
    ASSERT_TRUE(std::holds_alternative<LinearGradient>(p));
    const auto& g = std::get<LinearGradient>(p);
    EXPECT_EQ(g.stops.front().color, Color::black());
    EXPECT_EQ(g.spread, SpreadMode::Repeat);
}

TEST(GradientTest, NonFiniteInputRejected) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    EXPECT_EQ(kind_of([&] {
        (void)make_linear_gradient({nan, 0}, {10, 0}, two_stops(), SpreadMode::Pad,
                                   AffineTransform::identity());
    }), ErrorKind::InvalidGradient);
    EXPECT_EQ(kind_of([&] {
        (void)make_linear_gradient({0, 0}, {10, 0}, {{nan, Color::black()}}, SpreadMode::Pad,
                                   AffineTransform::identity());
    }), ErrorKind::InvalidGradient);
}

TEST(GradientTest, NegativeRadiusRejected) {
    EXPECT_EQ(kind_of([] {
        (void)make_radial_gradient({0, 0}, -1, {0, 0}, 10, two_stops(), SpreadMode::Pad,
                                   AffineTransform::identity());
    }), ErrorKind::InvalidGradient);
}

TEST(GradientTest, SingularTransformRejected) {
    EXPECT_EQ(kind_of([] {
        (void)make_linear_gradient({0, 0}, {10, 0}, two_stops(), SpreadMode::Pad,
                                   AffineTransform::scale(0, 0));
    }), ErrorKind::NonInvertibleTransform);
}

// ------------------------------------------------------------------
// 3. Image patterns
// ------------------------------------------------------------------

TEST(ImagePatternTest, ShortBufferRejected) {
    std::vector<uint8_t> bytes(4, 255);
    EXPECT_EQ(kind_of([&] {
        (void)easel::raster::PixmapView::from_bytes(bytes, 2, 2);
    }), ErrorKind::OutOfBounds);
}

TEST(ImagePatternTest, CopiesPixelsAwayFromCaller) {
    std::vector<uint8_t> bytes = {10, 20, 30, 255};
    auto view = easel::raster::PixmapView::from_bytes(bytes, 1, 1);
    ImagePattern pattern = make_image_pattern(view, SpreadMode::Pad, FilterQuality::Nearest,
                                              1.0f, AffineTransform::identity());
    bytes[0] = 99;
    ASSERT_TRUE(pattern.pixmap);
    EXPECT_EQ(pattern.pixmap->pixel(0, 0)[0], 10);
}
