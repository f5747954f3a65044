#include <easel/canvas/draw_target.h>
#include <easel/core/error.h>
#include <gtest/gtest.h>
#include <cstdint>
#include <memory>
#include <vector>

using easel::canvas::DrawOptions;
using easel::canvas::Filter;
using easel::canvas::PixmapDrawTarget;
using easel::core::DiagnosticEmitter;
using easel::core::Error;
using easel::core::ErrorKind;
using easel::core::Severity;
using easel::geometry::AffineTransform;
using easel::geometry::IntPoint;
using easel::geometry::IntRect;
using easel::geometry::IntSize;
using easel::geometry::Rect;
using easel::paint::BlendMode;
using easel::paint::Color;
using easel::paint::LineCap;
using easel::paint::LineJoin;
using easel::paint::Paint;
using easel::paint::SolidColor;
using easel::paint::StrokeOptions;
using easel::path::Path;

namespace {

const Paint kRed = SolidColor{Color::from_rgba8(255, 0, 0, 255)};
const Paint kWhite = SolidColor{Color::white()};

const uint8_t* pixel_at(const PixmapDrawTarget& target, int x, int y) {
    return target.pixmap().pixel(static_cast<uint32_t>(x), static_cast<uint32_t>(y));
}

bool is_red(const uint8_t* px) {
    return px[0] == 255 && px[1] == 0 && px[2] == 0 && px[3] == 255;
}

bool is_zero(const uint8_t* px) {
    return px[0] == 0 && px[1] == 0 && px[2] == 0 && px[3] == 0;
}

std::vector<uint8_t> solid_surface(int width, int height, uint8_t r, uint8_t g, uint8_t b) {
    std::vector<uint8_t> bytes;
    for (int i = 0; i < width * height; i++) {
        bytes.insert(bytes.end(), {r, g, b, 255});
    }
    return bytes;
}

} // namespace

// ------------------------------------------------------------------
// 1. Construction and state
// ------------------------------------------------------------------

TEST(DrawTargetTest, InvalidSizeThrows) {
    auto diagnostics = std::make_shared<DiagnosticEmitter>();
    try {
        PixmapDrawTarget target(IntSize{0, 10}, diagnostics);
        FAIL() << "expected an error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidSize);
    }
    EXPECT_THROW((void)PixmapDrawTarget(IntSize{-3, 3}, diagnostics), Error);
}

TEST(DrawTargetTest, StartsTransparentWithIdentityTransform) {
    PixmapDrawTarget target(IntSize{4, 3}, nullptr);
    EXPECT_EQ(target.get_size(), (IntSize{4, 3}));
    EXPECT_TRUE(target.get_transform().is_identity());
    EXPECT_FLOAT_EQ(target.get_opacity(), 1.0f);
    EXPECT_EQ(target.snapshot().size(), 4u * 3u * 4u);
    for (uint8_t byte : target.snapshot()) EXPECT_EQ(byte, 0);
}

TEST(DrawTargetTest, TransformRoundTripsExactly) {
    PixmapDrawTarget target(IntSize{4, 4}, nullptr);
    AffineTransform t = AffineTransform::from_canvas(0.3f, 0.1f, -0.7f, 1.9f, 12.25f, -3.5f);
    target.set_transform(t);
    EXPECT_EQ(target.get_transform(), t);
}

TEST(DrawTargetTest, OpacityIsStoredUnclamped) {
    PixmapDrawTarget target(IntSize{4, 4}, nullptr);
    target.set_opacity(1.5f);
    EXPECT_FLOAT_EQ(target.get_opacity(), 1.5f);
}

TEST(DrawTargetTest, CreateGradientStopsSorts) {
    PixmapDrawTarget target(IntSize{4, 4}, nullptr);
    auto stops = target.create_gradient_stops({{0.9f, Color::white()}, {0.1f, Color::black()}});
    ASSERT_EQ(stops.size(), 2u);
    EXPECT_FLOAT_EQ(stops[0].offset, 0.1f);
    EXPECT_EQ(stops[1].color, Color::white());
}

TEST(DrawTargetTest, PathBuilderIsFresh) {
    PixmapDrawTarget target(IntSize{4, 4}, nullptr);
    auto builder = target.create_path_builder();
    EXPECT_FALSE(builder->get_current_point().has_value());
}

// ------------------------------------------------------------------
// 2. Filling and clearing
// ------------------------------------------------------------------

TEST(DrawTargetTest, FillRectCoversExactPixels) {
    PixmapDrawTarget target(IntSize{10, 10}, nullptr);
    target.fill_rect(Rect::from_xywh(2, 3, 4, 5), kRed, DrawOptions{});
    EXPECT_TRUE(is_red(pixel_at(target, 2, 3)));
    EXPECT_TRUE(is_red(pixel_at(target, 5, 7)));
    EXPECT_TRUE(is_zero(pixel_at(target, 6, 7)));
    EXPECT_TRUE(is_zero(pixel_at(target, 2, 8)));
}

TEST(DrawTargetTest, FillUsesTargetTransform) {
    PixmapDrawTarget target(IntSize{10, 10}, nullptr);
    target.set_transform(AffineTransform::translate(5, 5));
    target.fill(Path::from_rect(Rect::from_xywh(0, 0, 2, 2)), kRed, DrawOptions{});
    EXPECT_TRUE(is_red(pixel_at(target, 5, 5)));
    EXPECT_TRUE(is_zero(pixel_at(target, 0, 0)));
}

TEST(DrawTargetTest, ClearRectZeroesExactlyTheRect) {
    PixmapDrawTarget target(IntSize{10, 10}, nullptr);
    target.fill_rect(Rect::from_xywh(0, 0, 10, 10), kRed, DrawOptions{});
    target.clear_rect(Rect::from_xywh(2, 2, 3, 3));
    EXPECT_TRUE(is_zero(pixel_at(target, 2, 2)));
    EXPECT_TRUE(is_zero(pixel_at(target, 4, 4)));
    EXPECT_TRUE(is_red(pixel_at(target, 5, 4)));
    EXPECT_TRUE(is_red(pixel_at(target, 1, 2)));
}

TEST(DrawTargetTest, FillRectWithClearModeMatchesClearRect) {
    PixmapDrawTarget cleared(IntSize{10, 10}, nullptr);
    PixmapDrawTarget filled(IntSize{10, 10}, nullptr);
    for (auto* target : {&cleared, &filled}) {
        target->fill_rect(Rect::from_xywh(0, 0, 10, 10), kRed, DrawOptions{});
    }
    cleared.clear_rect(Rect::from_xywh(1, 1, 4, 4));
    DrawOptions clear;
    clear.blend_mode = BlendMode::Clear;
    filled.fill_rect(Rect::from_xywh(1, 1, 4, 4), kRed, clear);
    EXPECT_EQ(cleared.snapshot(), filled.snapshot());
}

TEST(DrawTargetTest, OpacityScalesPaint) {
    PixmapDrawTarget target(IntSize{4, 4}, nullptr);
    target.set_opacity(0.5f);
    target.fill_rect(Rect::from_xywh(0, 0, 4, 4), kWhite, DrawOptions{});
    const uint8_t* px = pixel_at(target, 1, 1);
    EXPECT_NEAR(px[3], 128, 1);
    EXPECT_NEAR(px[0], 128, 1);
}

// ------------------------------------------------------------------
// 3. Clipping
// ------------------------------------------------------------------

TEST(DrawTargetTest, BalancedClipsLeaveNoTrace) {
    PixmapDrawTarget clipped(IntSize{16, 16}, nullptr);
    PixmapDrawTarget plain(IntSize{16, 16}, nullptr);
    for (int i = 0; i < 5; i++) {
        clipped.push_clip(Path::from_rect(Rect::from_xywh(i, i, 8, 8)));
    }
    EXPECT_EQ(clipped.clip_depth(), 5u);
    for (int i = 0; i < 5; i++) clipped.pop_clip();
    EXPECT_EQ(clipped.clip_depth(), 0u);
    EXPECT_EQ(clipped.mask(), nullptr);

    clipped.fill_rect(Rect::from_xywh(0.5f, 0.5f, 12.3f, 9.7f), kRed, DrawOptions{});
    plain.fill_rect(Rect::from_xywh(0.5f, 0.5f, 12.3f, 9.7f), kRed, DrawOptions{});
    EXPECT_EQ(clipped.snapshot(), plain.snapshot());
}

TEST(DrawTargetTest, ClipsIntersect) {
    PixmapDrawTarget target(IntSize{10, 10}, nullptr);
    target.push_clip(Path::from_rect(Rect::from_xywh(0, 0, 6, 10)));
    target.push_clip(Path::from_rect(Rect::from_xywh(4, 0, 6, 10)));
    target.fill_rect(Rect::from_xywh(0, 0, 10, 10), kRed, DrawOptions{});
    EXPECT_TRUE(is_red(pixel_at(target, 4, 5)));
    EXPECT_TRUE(is_red(pixel_at(target, 5, 5)));
    EXPECT_TRUE(is_zero(pixel_at(target, 2, 5)));
    EXPECT_TRUE(is_zero(pixel_at(target, 8, 5)));
}

TEST(DrawTargetTest, ClipIsFixedInDeviceSpace) {
    PixmapDrawTarget target(IntSize{10, 10}, nullptr);
    target.set_transform(AffineTransform::translate(5, 0));
    target.push_clip(Path::from_rect(Rect::from_xywh(0, 0, 2, 10)));
    target.set_transform(AffineTransform::identity());
    target.fill_rect(Rect::from_xywh(0, 0, 10, 10), kRed, DrawOptions{});
    EXPECT_TRUE(is_red(pixel_at(target, 5, 5)));
    EXPECT_TRUE(is_zero(pixel_at(target, 0, 5)));
}

TEST(DrawTargetTest, PopWithEmptyStackWarns) {
    auto diagnostics = std::make_shared<DiagnosticEmitter>();
    PixmapDrawTarget target(IntSize{4, 4}, diagnostics);
    target.pop_clip();
    auto warnings = diagnostics->events_by_severity(Severity::Warning);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].module, "draw_target");
    EXPECT_EQ(warnings[0].stage, "pop_clip");
}

TEST(DrawTargetTest, SimilarTargetInheritsClipAndTransform) {
    auto diagnostics = std::make_shared<DiagnosticEmitter>();
    PixmapDrawTarget target(IntSize{10, 10}, diagnostics);
    target.push_clip(Path::from_rect(Rect::from_xywh(0, 0, 5, 5)));
    target.set_transform(AffineTransform::translate(1, 1));

    auto similar = target.create_similar_draw_target(IntSize{8, 8});
    EXPECT_EQ(similar->get_size(), (IntSize{8, 8}));
    EXPECT_EQ(similar->clip_depth(), 1u);
    EXPECT_EQ(similar->get_transform(), target.get_transform());

    similar->set_transform(AffineTransform::identity());
    similar->fill_rect(Rect::from_xywh(0, 0, 8, 8), kRed, DrawOptions{});
    const auto& pixels = similar->snapshot();
    auto byte_at = [&](int x, int y) { return pixels[(static_cast<size_t>(y) * 8 + x) * 4]; };
    EXPECT_EQ(byte_at(2, 2), 255);
    EXPECT_EQ(byte_at(6, 6), 0);

    similar->pop_clip();
    similar->pop_clip();
    EXPECT_EQ(diagnostics->events_by_severity(Severity::Warning).size(), 1u);
}

// ------------------------------------------------------------------
// 4. Strokes
// ------------------------------------------------------------------

TEST(DrawTargetTest, StrokeLineUsesRoundCapForRoundJoin) {
    StrokeOptions stroke;
    stroke.set_line_width(6);
    stroke.set_line_join(LineJoin::Round);
    PixmapDrawTarget target(IntSize{20, 20}, nullptr);
    target.stroke_line({5, 10}, {15, 10}, kRed, stroke, DrawOptions{});
    EXPECT_GT(pixel_at(target, 3, 10)[3], 0);
    EXPECT_TRUE(is_red(pixel_at(target, 10, 10)));
}

TEST(DrawTargetTest, StrokeLineReplacesSquareCapWithButt) {
    StrokeOptions stroke;
    stroke.set_line_width(6);
    stroke.set_line_cap(LineCap::Square);
    stroke.set_line_join(LineJoin::Miter);
    PixmapDrawTarget target(IntSize{20, 20}, nullptr);
    target.stroke_line({5, 10}, {15, 10}, kRed, stroke, DrawOptions{});
    EXPECT_TRUE(is_zero(pixel_at(target, 3, 10)));
    EXPECT_TRUE(is_zero(pixel_at(target, 16, 10)));
    EXPECT_TRUE(is_red(pixel_at(target, 10, 10)));
    EXPECT_TRUE(is_red(pixel_at(target, 14, 10)));
}

TEST(DrawTargetTest, StrokeRectLeavesInteriorEmpty) {
    StrokeOptions stroke;
    stroke.set_line_width(2);
    PixmapDrawTarget target(IntSize{20, 20}, nullptr);
    target.stroke_rect(Rect::from_xywh(4, 4, 10, 10), kRed, stroke, DrawOptions{});
    EXPECT_TRUE(is_red(pixel_at(target, 4, 8)));
    EXPECT_TRUE(is_red(pixel_at(target, 3, 8)));
    EXPECT_TRUE(is_zero(pixel_at(target, 9, 9)));
}

// ------------------------------------------------------------------
// 5. Surfaces
// ------------------------------------------------------------------

TEST(DrawTargetTest, CopySurfaceIsClippedToTarget) {
    PixmapDrawTarget target(IntSize{10, 10}, nullptr);
    target.copy_surface(solid_surface(2, 2, 255, 0, 0), IntRect{0, 0, 2, 2}, IntPoint{9, 9});
    EXPECT_TRUE(is_red(pixel_at(target, 9, 9)));
    EXPECT_TRUE(is_zero(pixel_at(target, 8, 9)));
    EXPECT_TRUE(is_zero(pixel_at(target, 9, 8)));
}

TEST(DrawTargetTest, CopySurfaceReplacesPixels) {
    PixmapDrawTarget target(IntSize{4, 4}, nullptr);
    target.fill_rect(Rect::from_xywh(0, 0, 4, 4), kWhite, DrawOptions{});
    std::vector<uint8_t> clear(4 * 4, 0);
    target.copy_surface(clear, IntRect{0, 0, 2, 2}, IntPoint{1, 1});
    EXPECT_TRUE(is_zero(pixel_at(target, 1, 1)));
    EXPECT_EQ(pixel_at(target, 0, 0)[3], 255);
}

TEST(DrawTargetTest, CopySurfaceRejectsShortBuffer) {
    PixmapDrawTarget target(IntSize{4, 4}, nullptr);
    std::vector<uint8_t> short_buffer(4 * 3, 255);
    try {
        target.copy_surface(short_buffer, IntRect{0, 0, 2, 2}, IntPoint{0, 0});
        FAIL() << "expected an error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::OutOfBounds);
    }
    for (uint8_t byte : target.snapshot()) EXPECT_EQ(byte, 0);
}

TEST(DrawTargetTest, DrawSurfaceScalesIntoDestRect) {
    PixmapDrawTarget target(IntSize{10, 10}, nullptr);
    target.draw_surface(solid_surface(1, 1, 0, 0, 255), Rect::from_xywh(2, 2, 4, 4),
                        Rect::from_xywh(0, 0, 1, 1), Filter::Bilinear, DrawOptions{});
    const uint8_t* inside = pixel_at(target, 3, 3);
    EXPECT_EQ(inside[2], 255);
    EXPECT_EQ(inside[3], 255);
    EXPECT_TRUE(is_zero(pixel_at(target, 1, 1)));
    EXPECT_TRUE(is_zero(pixel_at(target, 6, 6)));
}

TEST(DrawTargetTest, DrawSurfaceTruncatesFractionalSourceSize) {
    PixmapDrawTarget target(IntSize{10, 10}, nullptr);
    EXPECT_NO_THROW(target.draw_surface(solid_surface(1, 1, 0, 0, 255),
                                        Rect::from_xywh(0, 0, 4, 4),
                                        Rect::from_xywh(0, 0, 1.9f, 1.9f), Filter::Nearest,
                                        DrawOptions{}));
    EXPECT_EQ(pixel_at(target, 2, 2)[2], 255);
    EXPECT_THROW(target.draw_surface(solid_surface(1, 1, 0, 0, 255), Rect::from_xywh(0, 0, 4, 4),
                                     Rect::from_xywh(0, 0, 0.7f, 0.7f), Filter::Nearest,
                                     DrawOptions{}),
                 Error);
}

TEST(DrawTargetTest, DrawSurfaceNearestKeepsTexelEdges) {
    // 2x1 surface: red then blue
    std::vector<uint8_t> surface = {255, 0, 0, 255, 0, 0, 255, 255};
    PixmapDrawTarget target(IntSize{8, 2}, nullptr);
    target.draw_surface(surface, Rect::from_xywh(0, 0, 8, 2), Rect::from_xywh(0, 0, 2, 1),
                        Filter::Nearest, DrawOptions{});
    EXPECT_TRUE(is_red(pixel_at(target, 3, 1)));
    EXPECT_EQ(pixel_at(target, 4, 1)[2], 255);
    EXPECT_EQ(pixel_at(target, 4, 1)[0], 0);
}

TEST(DrawTargetTest, ShadowRequestWarnsAndDrawsNothing) {
    auto diagnostics = std::make_shared<DiagnosticEmitter>();
    PixmapDrawTarget target(IntSize{4, 4}, diagnostics);
    target.draw_surface_with_shadow(solid_surface(1, 1, 0, 0, 0), {0, 0}, Color::black(),
                                    {2, 2}, 3.0f, BlendMode::SourceOver);
    auto warnings = diagnostics->events_by_severity(Severity::Warning);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].message, "no support for drawing shadows");
    for (uint8_t byte : target.snapshot()) EXPECT_EQ(byte, 0);
}

// ------------------------------------------------------------------
// 6. Snapshots
// ------------------------------------------------------------------

TEST(DrawTargetTest, OwnedSnapshotIsIndependent) {
    PixmapDrawTarget target(IntSize{4, 4}, nullptr);
    std::vector<uint8_t> before = target.snapshot_owned();
    target.fill_rect(Rect::from_xywh(0, 0, 4, 4), kRed, DrawOptions{});
    for (uint8_t byte : before) EXPECT_EQ(byte, 0);
    EXPECT_EQ(target.snapshot_owned(), target.snapshot());
}

TEST(DrawTargetTest, SnapshotDataPassesPixelsThrough) {
    PixmapDrawTarget target(IntSize{3, 2}, nullptr);
    target.fill_rect(Rect::from_xywh(0, 0, 1, 1), kRed, DrawOptions{});
    auto first_pixel = target.snapshot_data([](const std::vector<uint8_t>& pixels) {
        return std::vector<uint8_t>(pixels.begin(), pixels.begin() + 4);
    });
    ASSERT_EQ(first_pixel.size(), 4u);
    EXPECT_EQ(first_pixel[0], 255);
    EXPECT_EQ(first_pixel[3], 255);
}
