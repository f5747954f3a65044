#include <easel/canvas/backend.h>
#include <easel/core/error.h>
#include <sstream>
#include <string>
#include <type_traits>

namespace easel::canvas {

namespace {

paint::GradientStops to_gradient_stops(const std::vector<CanvasGradientStop>& stops) {
    paint::GradientStops result;
    result.reserve(stops.size());
    for (const auto& stop : stops) {
        result.push_back({static_cast<float>(stop.offset), paint::Color::from_rgba(stop.color)});
    }
    return result;
}

Point to_point(double x, double y) {
    return {static_cast<float>(x), static_cast<float>(y)};
}

} // namespace

paint::Paint create_paint(const FillOrStrokeStyle& style, const AffineTransform& transform) {
    return std::visit([&](const auto& s) -> paint::Paint {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, paint::RGBA>) {
            return paint::SolidColor{paint::Color::from_rgba(s)};
        } else if constexpr (std::is_same_v<T, LinearGradientStyle>) {
            return paint::make_linear_gradient(to_point(s.x0, s.y0), to_point(s.x1, s.y1),
                                               to_gradient_stops(s.stops),
                                               paint::SpreadMode::Pad, transform);
        } else if constexpr (std::is_same_v<T, RadialGradientStyle>) {
            return paint::make_radial_gradient(to_point(s.x0, s.y0), static_cast<float>(s.r0),
                                               to_point(s.x1, s.y1), static_cast<float>(s.r1),
                                               to_gradient_stops(s.stops),
                                               paint::SpreadMode::Pad, transform);
        } else {
            if (s.surface_size.width <= 0 || s.surface_size.height <= 0) {
                std::ostringstream oss;
                oss << "invalid surface size " << s.surface_size.width << "x"
                    << s.surface_size.height;
                throw core::Error(core::ErrorKind::InvalidSize, oss.str());
            }
            auto view = raster::PixmapView::from_bytes(
                s.surface_data, static_cast<uint32_t>(s.surface_size.width),
                static_cast<uint32_t>(s.surface_size.height));
            return paint::make_image_pattern(view, paint::SpreadMode::Pad,
                                             paint::FilterQuality::Bilinear, 1.0f, transform);
        }
    }, style);
}

Backend::Backend(std::shared_ptr<core::DiagnosticEmitter> diagnostics)
    : diagnostics_(diagnostics ? std::move(diagnostics)
                               : std::make_shared<core::DiagnosticEmitter>()) {}

paint::BlendMode Backend::get_composition_op(const DrawOptions& options) const {
    return options.blend_mode;
}

bool Backend::need_to_draw_shadow(const paint::Color& color) const {
    return color.alpha() != 0.0f;
}

void Backend::set_shadow_color(const paint::RGBA& color, PaintState& state) const {
    state.shadow_color = paint::Color::from_rgba(color);
}

void Backend::set_style(const FillOrStrokeStyle& style, PaintState& state,
                        paint::Paint PaintState::*member,
                        const GenericDrawTarget& target) const {
    state.*member = create_paint(style, target.get_transform());
}

void Backend::set_fill_style(const FillOrStrokeStyle& style, PaintState& state,
                             const GenericDrawTarget& target) const {
    set_style(style, state, &PaintState::fill_style, target);
}

void Backend::set_stroke_style(const FillOrStrokeStyle& style, PaintState& state,
                               const GenericDrawTarget& target) const {
    set_style(style, state, &PaintState::stroke_style, target);
}

void Backend::set_global_composition(const CompositionOrBlending& op, PaintState& state) const {
    state.draw_options.blend_mode = to_blend_mode(op);
}

std::unique_ptr<GenericDrawTarget> Backend::create_draw_target(const IntSize& size) const {
    diagnostics_->emit(core::Severity::Info, "backend", "create_draw_target",
                       "creating " + std::to_string(size.width) + "x" +
                           std::to_string(size.height) + " draw target");
    return std::make_unique<PixmapDrawTarget>(size, diagnostics_);
}

PaintState Backend::recreate_paint_state(const PaintState& /*state*/) const {
    return PaintState{};
}

} // namespace easel::canvas
