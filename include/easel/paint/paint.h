#pragma once
#include <easel/geometry/transform.h>
#include <easel/paint/color.h>
#include <easel/raster/pixmap.h>
#include <memory>
#include <variant>
#include <vector>

namespace easel::paint {

using geometry::AffineTransform;
using geometry::Point;

struct GradientStop {
    float offset = 0;  // [0, 1]
    Color color;
    bool operator==(const GradientStop&) const = default;
};

using GradientStops = std::vector<GradientStop>;

// Behavior outside the gradient or pattern extent.
enum class SpreadMode { Pad, Reflect, Repeat };

enum class FilterQuality { Nearest, Bilinear };

struct SolidColor {
    Color color;
};

struct LinearGradient {
    Point start;
    Point end;
    GradientStops stops;
    SpreadMode spread = SpreadMode::Pad;
    AffineTransform transform;
};

// Two-point conical gradient between circle (start, start_radius) and
// circle (end, end_radius).
struct RadialGradient {
    Point start;
    float start_radius = 0;
    Point end;
    float end_radius = 0;
    GradientStops stops;
    SpreadMode spread = SpreadMode::Pad;
    AffineTransform transform;
};

struct ImagePattern {
    std::shared_ptr<const raster::Pixmap> pixmap;
    SpreadMode spread = SpreadMode::Pad;
    FilterQuality filter = FilterQuality::Bilinear;
    float opacity = 1.0f;
    AffineTransform transform;
};

// A resolved fill description. Every transform maps paint space straight to
// device space.
using Paint = std::variant<SolidColor, LinearGradient, RadialGradient, ImagePattern>;

// Stably sorts stops by offset; equal offsets keep caller order.
GradientStops sort_gradient_stops(GradientStops stops);

// Gradient constructors. Throw core::Error(InvalidGradient) for an empty stop
// list or non-finite input. Single-stop and zero-size gradients collapse to
// SolidColor of the last stop.
Paint make_linear_gradient(Point start, Point end, GradientStops stops,
                           SpreadMode spread, const AffineTransform& transform);
Paint make_radial_gradient(Point start, float start_radius, Point end, float end_radius,
                           GradientStops stops, SpreadMode spread,
                           const AffineTransform& transform);

// Copies the viewed pixels so the pattern can outlive the caller's buffer.
ImagePattern make_image_pattern(const raster::PixmapView& view, SpreadMode spread,
                                FilterQuality filter, float opacity,
                                const AffineTransform& transform);

// Zero-size gradients have already collapsed to a solid color by the time a
// Paint exists, so they cannot be told apart from one. Always false.
bool is_zero_size_gradient(const Paint& paint);

} // namespace easel::paint
