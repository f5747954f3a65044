#include <easel/canvas/canvas_context.h>
#include <easel/core/error.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <sstream>
#include <string>

namespace easel::canvas {

namespace {

constexpr const char* kModule = "canvas";

bool all_finite(std::initializer_list<float> values) {
    return std::all_of(values.begin(), values.end(), [](float v) { return std::isfinite(v); });
}

void require_finite(std::initializer_list<float> values, const char* what) {
    if (!all_finite(values)) {
        throw core::Error(core::ErrorKind::InvalidGeometry,
                          std::string(what) + " arguments are not finite");
    }
}

// Canvas rects may have negative sizes; they extend left / up from (x, y).
Rect normalized_rect(float x, float y, float width, float height) {
    return Rect::from_xywh(std::min(x, x + width), std::min(y, y + height),
                           std::abs(width), std::abs(height));
}

// End of the span [origin, origin + extent) clipped to `limit`, summed in
// 64 bits so extreme rects cannot overflow.
int clipped_end(int origin, int extent, int limit) {
    return static_cast<int>(std::min<int64_t>(int64_t{origin} + extent, limit));
}

} // namespace

CanvasContext::CanvasContext(const IntSize& size,
                             std::shared_ptr<core::DiagnosticEmitter> diagnostics)
    : backend_(std::move(diagnostics)),
      target_(backend_.create_draw_target(size)),
      state_(backend_.recreate_paint_state(PaintState{})) {}

template <typename Fn>
bool CanvasContext::guarded(const char* stage, Fn&& fn) {
    try {
        fn();
        return true;
    } catch (const core::Error& e) {
        const auto& diagnostics = backend_.diagnostics();
        diagnostics->emit(core::Severity::Error, kModule, stage, e.what());
        failures_.capture(*diagnostics, kModule, stage, e.what());
        return false;
    }
}

// ========== State ==========

void CanvasContext::save() {
    saved_states_.push_back({state_, target_->clip_depth()});
}

bool CanvasContext::restore() {
    if (saved_states_.empty()) return false;
    SavedState saved = std::move(saved_states_.back());
    saved_states_.pop_back();

    while (target_->clip_depth() > saved.clip_depth) {
        target_->pop_clip();
    }
    state_ = std::move(saved.state);
    target_->set_transform(state_.transform);
    target_->set_opacity(state_.draw_options.alpha);
    return true;
}

bool CanvasContext::set_fill_style(const FillOrStrokeStyle& style) {
    return guarded("set_fill_style", [&] {
        PaintState next = state_;
        backend_.set_fill_style(style, next, *target_);
        state_ = std::move(next);
    });
}

bool CanvasContext::set_stroke_style(const FillOrStrokeStyle& style) {
    return guarded("set_stroke_style", [&] {
        PaintState next = state_;
        backend_.set_stroke_style(style, next, *target_);
        state_ = std::move(next);
    });
}

void CanvasContext::set_line_width(float width) {
    state_.stroke_options.set_line_width(width);
}

void CanvasContext::set_miter_limit(float limit) {
    state_.stroke_options.set_miter_limit(limit);
}

void CanvasContext::set_line_join(paint::LineJoin join) {
    state_.stroke_options.set_line_join(join);
}

void CanvasContext::set_line_cap(paint::LineCap cap) {
    state_.stroke_options.set_line_cap(cap);
}

void CanvasContext::set_global_alpha(float alpha) {
    state_.draw_options.set_alpha(alpha);
    target_->set_opacity(alpha);
}

void CanvasContext::set_global_composition(const CompositionOrBlending& op) {
    backend_.set_global_composition(op, state_);
}

void CanvasContext::set_shadow_color(const paint::RGBA& color) {
    backend_.set_shadow_color(color, state_);
}

void CanvasContext::set_shadow_offset_x(float value) { state_.shadow_offset_x = value; }
void CanvasContext::set_shadow_offset_y(float value) { state_.shadow_offset_y = value; }
void CanvasContext::set_shadow_blur(float value) { state_.shadow_blur = value; }
void CanvasContext::set_text_align(TextAlign align) { state_.text_align = align; }
void CanvasContext::set_text_baseline(TextBaseline baseline) { state_.text_baseline = baseline; }
void CanvasContext::set_image_smoothing_enabled(bool enabled) { image_smoothing_ = enabled; }

// ========== Transforms ==========

void CanvasContext::apply_transform(const AffineTransform& transform) {
    if (!transform.is_finite()) {
        throw core::Error(core::ErrorKind::InvalidGeometry, "transform is not finite");
    }
    state_.transform = transform;
    target_->set_transform(transform);
}

bool CanvasContext::set_transform(float a, float b, float c, float d, float e, float f) {
    return guarded("set_transform", [&] {
        apply_transform(AffineTransform::from_canvas(a, b, c, d, e, f));
    });
}

bool CanvasContext::transform(float a, float b, float c, float d, float e, float f) {
    return guarded("transform", [&] {
        apply_transform(state_.transform * AffineTransform::from_canvas(a, b, c, d, e, f));
    });
}

bool CanvasContext::translate(float x, float y) {
    return guarded("translate", [&] {
        apply_transform(state_.transform * AffineTransform::translate(x, y));
    });
}

bool CanvasContext::scale(float x, float y) {
    return guarded("scale", [&] {
        apply_transform(state_.transform * AffineTransform::scale(x, y));
    });
}

bool CanvasContext::rotate(float angle) {
    return guarded("rotate", [&] {
        apply_transform(state_.transform * AffineTransform::rotate(angle));
    });
}

bool CanvasContext::reset_transform() {
    return guarded("reset_transform", [&] { apply_transform(AffineTransform::identity()); });
}

// ========== Path ==========

Point CanvasContext::to_device(float x, float y) const {
    return state_.transform.apply(Point{x, y});
}

std::optional<path::Path> CanvasContext::current_path() const {
    path::PathBuilder copy = path_;
    return copy.finish();
}

std::optional<path::Path> CanvasContext::current_user_path() const {
    auto path = current_path();
    if (!path) return std::nullopt;
    auto inverse = state_.transform.invert();
    if (!inverse) return std::nullopt;
    return path->transform(*inverse);
}

void CanvasContext::begin_path() {
    path_ = path::PathBuilder{};
}

bool CanvasContext::move_to(float x, float y) {
    return guarded("move_to", [&] {
        require_finite({x, y}, "move_to");
        path_.move_to(to_device(x, y));
    });
}

bool CanvasContext::line_to(float x, float y) {
    return guarded("line_to", [&] {
        require_finite({x, y}, "line_to");
        path_.line_to(to_device(x, y));
    });
}

bool CanvasContext::quadratic_curve_to(float cpx, float cpy, float x, float y) {
    return guarded("quadratic_curve_to", [&] {
        require_finite({cpx, cpy, x, y}, "quadratic_curve_to");
        path_.quadratic_curve_to(to_device(cpx, cpy), to_device(x, y));
    });
}

bool CanvasContext::bezier_curve_to(float cp1x, float cp1y, float cp2x, float cp2y,
                                    float x, float y) {
    return guarded("bezier_curve_to", [&] {
        require_finite({cp1x, cp1y, cp2x, cp2y, x, y}, "bezier_curve_to");
        path_.bezier_curve_to(to_device(cp1x, cp1y), to_device(cp2x, cp2y), to_device(x, y));
    });
}

bool CanvasContext::arc(float x, float y, float radius, float start_angle, float end_angle,
                        bool anticlockwise) {
    return ellipse(x, y, radius, radius, 0.0f, start_angle, end_angle, anticlockwise);
}

bool CanvasContext::ellipse(float x, float y, float radius_x, float radius_y, float rotation,
                            float start_angle, float end_angle, bool anticlockwise) {
    return guarded("ellipse", [&] {
        require_finite({x, y, radius_x, radius_y, rotation, start_angle, end_angle}, "ellipse");
        if (radius_x < 0 || radius_y < 0) {
            std::ostringstream oss;
            oss << "negative ellipse radius rx=" << radius_x << " ry=" << radius_y;
            throw core::Error(core::ErrorKind::InvalidGeometry, oss.str());
        }

        // Build in user space, then append the device-space segments. The
        // leading move becomes a line from the current point.
        path::PathBuilder arc_builder;
        arc_builder.ellipse({x, y}, radius_x, radius_y, rotation, start_angle, end_angle,
                            anticlockwise);
        std::optional<Point> arc_start = arc_builder.get_current_point();
        auto arc_path = arc_builder.finish();
        if (!arc_path) {
            // Zero sweep: the line to the arc's start point still counts
            if (arc_start) path_.line_to(state_.transform.apply(*arc_start));
            return;
        }
        path::Path device = arc_path->transform(state_.transform);

        path::PathBuilder next = path_;
        path::for_each_segment(device, [&](const path::PathSegment& seg) {
            switch (seg.verb) {
                case path::PathVerb::Move:
                    next.line_to(seg.pts[0]);
                    break;
                case path::PathVerb::Line:
                    next.line_to(seg.pts[1]);
                    break;
                case path::PathVerb::Quad:
                    next.quadratic_curve_to(seg.pts[1], seg.pts[2]);
                    break;
                case path::PathVerb::Cubic:
                    next.bezier_curve_to(seg.pts[1], seg.pts[2], seg.pts[3]);
                    break;
                case path::PathVerb::Close:
                    next.close();
                    break;
            }
        });
        path_ = std::move(next);
    });
}

bool CanvasContext::rect(float x, float y, float width, float height) {
    return guarded("rect", [&] {
        require_finite({x, y, width, height}, "rect");
        path_.move_to(to_device(x, y));
        path_.line_to(to_device(x + width, y));
        path_.line_to(to_device(x + width, y + height));
        path_.line_to(to_device(x, y + height));
        path_.close();
    });
}

bool CanvasContext::close_path() {
    return guarded("close_path", [&] { path_.close(); });
}

// ========== Drawing ==========

void CanvasContext::draw_shadow_if_needed() {
    bool displaced = state_.shadow_blur != 0 || state_.shadow_offset_x != 0 ||
                     state_.shadow_offset_y != 0;
    if (!displaced || !backend_.need_to_draw_shadow(state_.shadow_color)) return;
    target_->draw_surface_with_shadow(target_->snapshot(), {0, 0}, state_.shadow_color,
                                      {state_.shadow_offset_x, state_.shadow_offset_y},
                                      state_.shadow_blur * 0.5f,
                                      backend_.get_composition_op(state_.draw_options));
}

bool CanvasContext::fill() {
    return guarded("fill", [&] {
        auto path = current_user_path();
        if (!path) return;
        draw_shadow_if_needed();
        target_->fill(*path, state_.fill_style, state_.draw_options);
    });
}

bool CanvasContext::stroke() {
    return guarded("stroke", [&] {
        auto path = current_user_path();
        if (!path) return;
        draw_shadow_if_needed();
        target_->stroke(*path, state_.stroke_style, state_.stroke_options, state_.draw_options);
    });
}

bool CanvasContext::clip() {
    return guarded("clip", [&] {
        if (!current_path()) {
            // An empty path clips everything away
            target_->push_clip(path::Path::from_rect(Rect::from_xywh(0, 0, 0, 0)));
            return;
        }
        auto path = current_user_path();
        if (!path) {
            throw core::Error(core::ErrorKind::NonInvertibleTransform,
                              "cannot clip under a singular transform");
        }
        target_->push_clip(*path);
    });
}

bool CanvasContext::is_point_in_path(double x, double y) {
    bool inside = false;
    bool ok = guarded("is_point_in_path", [&] {
        auto path = current_path();
        if (!path) return;
        inside = path->contains_point(x, y, AffineTransform::identity());
    });
    return ok && inside;
}

bool CanvasContext::fill_rect(float x, float y, float width, float height) {
    return guarded("fill_rect", [&] {
        Rect rect = normalized_rect(x, y, width, height);
        draw_shadow_if_needed();
        target_->fill_rect(rect, state_.fill_style, state_.draw_options);
    });
}

bool CanvasContext::stroke_rect(float x, float y, float width, float height) {
    return guarded("stroke_rect", [&] {
        Rect rect = normalized_rect(x, y, width, height);
        draw_shadow_if_needed();
        target_->stroke_rect(rect, state_.stroke_style, state_.stroke_options,
                             state_.draw_options);
    });
}

bool CanvasContext::clear_rect(float x, float y, float width, float height) {
    return guarded("clear_rect", [&] {
        target_->clear_rect(normalized_rect(x, y, width, height));
    });
}

bool CanvasContext::draw_image(const std::vector<uint8_t>& pixels, const IntSize& image_size,
                               float dx, float dy, float dw, float dh) {
    return draw_image(pixels, image_size, {0, 0, image_size.width, image_size.height},
                      dx, dy, dw, dh);
}

bool CanvasContext::draw_image(const std::vector<uint8_t>& pixels, const IntSize& image_size,
                               const IntRect& source, float dx, float dy, float dw, float dh) {
    return guarded("draw_image", [&] {
        if (image_size.width <= 0 || image_size.height <= 0) {
            std::ostringstream oss;
            oss << "invalid image size " << image_size.width << "x" << image_size.height;
            throw core::Error(core::ErrorKind::InvalidSize, oss.str());
        }
        auto image = raster::PixmapView::from_bytes(pixels,
                                                    static_cast<uint32_t>(image_size.width),
                                                    static_cast<uint32_t>(image_size.height));

        int x0 = std::max(source.x, 0);
        int y0 = std::max(source.y, 0);
        int x1 = clipped_end(source.x, source.width, image_size.width);
        int y1 = clipped_end(source.y, source.height, image_size.height);
        if (x0 >= x1 || y0 >= y1) {
            std::ostringstream oss;
            oss << "image source rect x=" << source.x << " y=" << source.y
                << " w=" << source.width << " h=" << source.height << " is outside the image";
            throw core::Error(core::ErrorKind::OutOfBounds, oss.str());
        }

        Rect dest = normalized_rect(dx, dy, dw, dh);
        Filter filter = image_smoothing_ ? Filter::Bilinear : Filter::Nearest;
        int cropped_width = x1 - x0;
        int cropped_height = y1 - y0;
        Rect cropped_rect = Rect::from_xywh(0, 0, static_cast<float>(cropped_width),
                                            static_cast<float>(cropped_height));

        draw_shadow_if_needed();
        if (cropped_width == image_size.width && cropped_height == image_size.height) {
            target_->draw_surface(pixels, dest, cropped_rect, filter, state_.draw_options);
            return;
        }

        std::vector<uint8_t> cropped;
        cropped.reserve(static_cast<size_t>(cropped_width) * cropped_height * 4);
        for (int y = y0; y < y1; y++) {
            const uint8_t* row = image.pixel(static_cast<uint32_t>(x0), static_cast<uint32_t>(y));
            cropped.insert(cropped.end(), row, row + static_cast<size_t>(cropped_width) * 4);
        }
        target_->draw_surface(cropped, dest, cropped_rect, filter, state_.draw_options);
    });
}

bool CanvasContext::put_image_data(const std::vector<uint8_t>& pixels, const IntSize& image_size,
                                   int dx, int dy) {
    return guarded("put_image_data", [&] {
        target_->copy_surface(pixels, {0, 0, image_size.width, image_size.height}, {dx, dy});
    });
}

std::optional<std::vector<uint8_t>> CanvasContext::get_image_data(const IntRect& rect) {
    std::optional<std::vector<uint8_t>> result;
    bool ok = guarded("get_image_data", [&] {
        if (rect.width <= 0 || rect.height <= 0) {
            std::ostringstream oss;
            oss << "invalid image data size " << rect.width << "x" << rect.height;
            throw core::Error(core::ErrorKind::InvalidSize, oss.str());
        }
        std::vector<uint8_t> out(static_cast<size_t>(rect.width) * rect.height * 4, 0);
        IntSize size = target_->get_size();
        const auto& pixels = target_->snapshot();

        int x0 = std::max(rect.x, 0);
        int x1 = clipped_end(rect.x, rect.width, size.width);
        int y1 = clipped_end(rect.y, rect.height, size.height);
        if (x0 < x1) {
            for (int y = std::max(rect.y, 0); y < y1; y++) {
                size_t from = (static_cast<size_t>(y) * size.width + x0) * 4;
                size_t to = (static_cast<size_t>(y - rect.y) * rect.width + (x0 - rect.x)) * 4;
                std::copy(pixels.begin() + static_cast<std::ptrdiff_t>(from),
                          pixels.begin() + static_cast<std::ptrdiff_t>(from + (x1 - x0) * 4),
                          out.begin() + static_cast<std::ptrdiff_t>(to));
            }
        }
        result = std::move(out);
    });
    if (!ok) return std::nullopt;
    return result;
}

bool CanvasContext::reset() {
    return guarded("reset", [&] {
        auto target = backend_.create_draw_target(target_->get_size());
        state_ = backend_.recreate_paint_state(state_);
        saved_states_.clear();
        path_ = path::PathBuilder{};
        image_smoothing_ = true;
        target_ = std::move(target);
    });
}

} // namespace easel::canvas
