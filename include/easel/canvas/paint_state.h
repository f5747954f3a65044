#pragma once
#include <easel/canvas/style.h>
#include <easel/geometry/transform.h>
#include <easel/paint/paint.h>
#include <easel/paint/stroke_options.h>

namespace easel::canvas {

// Per-context drawing settings. Copied by save(), replaced by restore() and
// by Backend::recreate_paint_state().
struct PaintState {
    geometry::AffineTransform transform;
    paint::Paint fill_style = paint::SolidColor{paint::Color::black()};
    paint::Paint stroke_style = paint::SolidColor{paint::Color::black()};
    paint::StrokeOptions stroke_options;
    DrawOptions draw_options;
    float shadow_offset_x = 0;
    float shadow_offset_y = 0;
    float shadow_blur = 0;
    paint::Color shadow_color = paint::Color::transparent();
    TextAlign text_align = TextAlign::Start;
    TextBaseline text_baseline = TextBaseline::Alphabetic;
};

} // namespace easel::canvas
