#pragma once
#include <easel/geometry/geometry.h>
#include <easel/paint/blend_mode.h>
#include <easel/paint/color.h>
#include <cstdint>
#include <variant>
#include <vector>

namespace easel::canvas {

struct CanvasGradientStop {
    double offset = 0;
    paint::RGBA color;
};

struct LinearGradientStyle {
    double x0 = 0, y0 = 0, x1 = 0, y1 = 0;
    std::vector<CanvasGradientStop> stops;
};

struct RadialGradientStyle {
    double x0 = 0, y0 = 0, r0 = 0;
    double x1 = 0, y1 = 0, r1 = 0;
    std::vector<CanvasGradientStop> stops;
};

// Premultiplied RGBA pixels painted as an image pattern.
struct SurfaceStyle {
    std::vector<uint8_t> surface_data;
    geometry::IntSize surface_size;
};

// Style input for fillStyle / strokeStyle. Colors arrive already parsed.
using FillOrStrokeStyle =
    std::variant<paint::RGBA, LinearGradientStyle, RadialGradientStyle, SurfaceStyle>;

enum class TextAlign { Start, End, Left, Right, Center };
enum class TextBaseline { Top, Hanging, Middle, Alphabetic, Ideographic, Bottom };

// Image smoothing for draw_surface.
enum class Filter { Bilinear, Nearest };

struct DrawOptions {
    paint::BlendMode blend_mode = paint::BlendMode::SourceOver;
    float alpha = 1.0f;
    bool anti_alias = true;

    void set_alpha(float value) { alpha = value; }
};

} // namespace easel::canvas
