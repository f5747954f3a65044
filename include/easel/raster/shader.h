#pragma once
#include <easel/geometry/geometry.h>
#include <easel/geometry/transform.h>
#include <easel/paint/paint.h>
#include <easel/raster/blend.h>
#include <optional>

namespace easel::raster {

// Per-pixel evaluator for a paint::Paint. Holds the inverse of the paint
// transform so device positions can be mapped back into paint space.
class Shader {
public:
    // Returns nullopt when the paint transform cannot be inverted.
    static std::optional<Shader> create(const paint::Paint& paint, float opacity);

    // Premultiplied color at device position (x, y).
    PremulPixel sample(float x, float y) const;

    // True when every sample yields the same color.
    bool is_solid() const { return std::holds_alternative<paint::SolidColor>(paint_); }

private:
    Shader(paint::Paint paint, const geometry::AffineTransform& inverse, float opacity)
        : paint_(std::move(paint)), inverse_(inverse), opacity_(opacity) {}

    PremulPixel sample_stops(const paint::GradientStops& stops, paint::SpreadMode spread,
                             float t) const;
    PremulPixel sample_linear(const paint::LinearGradient& g, geometry::Point p) const;
    std::optional<PremulPixel> sample_radial(const paint::RadialGradient& g,
                                             geometry::Point p) const;
    PremulPixel sample_pattern(const paint::ImagePattern& pattern, geometry::Point p) const;

    paint::Paint paint_;
    geometry::AffineTransform inverse_;
    float opacity_;
    PremulPixel solid_;
};

// Maps a gradient parameter into [0, 1] according to the spread mode.
float apply_spread(paint::SpreadMode spread, float t);

} // namespace easel::raster
