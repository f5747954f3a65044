#include <easel/canvas/draw_target.h>
#include <easel/core/config.h>
#include <easel/core/error.h>
#include <easel/raster/software_renderer.h>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace easel::canvas {

namespace {

constexpr const char* kModule = "draw_target";

paint::FilterQuality to_filter_quality(Filter filter) {
    switch (filter) {
        case Filter::Bilinear: return paint::FilterQuality::Bilinear;
        case Filter::Nearest:  return paint::FilterQuality::Nearest;
    }
    return paint::FilterQuality::Bilinear;
}

raster::Pixmap create_target_pixmap(const IntSize& size) {
    if (size.width <= 0 || size.height <= 0) {
        std::ostringstream oss;
        oss << "invalid draw target size " << size.width << "x" << size.height;
        throw core::Error(core::ErrorKind::InvalidSize, oss.str());
    }
    return raster::Pixmap::create(static_cast<uint32_t>(size.width),
                                  static_cast<uint32_t>(size.height));
}

// Surface dimensions come from the source rect; fractional sizes truncate.
// Oversized extents stay out of range so the pixmap view rejects them.
uint32_t surface_extent(float value) {
    if (!std::isfinite(value) || value < 1.0f) {
        throw core::Error(core::ErrorKind::InvalidSize, "surface source rect is empty");
    }
    float limit = static_cast<float>(core::config::kMaxPixmapDimension) + 1.0f;
    return static_cast<uint32_t>(std::min(value, limit));
}

} // namespace

PixmapDrawTarget::PixmapDrawTarget(const IntSize& size,
                                   std::shared_ptr<core::DiagnosticEmitter> diagnostics)
    : pixmap_(create_target_pixmap(size)),
      transform_(AffineTransform::identity()),
      diagnostics_(diagnostics ? std::move(diagnostics)
                               : std::make_shared<core::DiagnosticEmitter>()) {}

raster::PaintParams PixmapDrawTarget::paint_params(const DrawOptions& options) const {
    raster::PaintParams params;
    params.blend_mode = options.blend_mode;
    params.anti_alias = options.anti_alias;
    params.opacity = opacity_;
    params.mask = mask();
    return params;
}

void PixmapDrawTarget::clear_rect(const Rect& rect) {
    raster::PaintParams params;
    params.blend_mode = paint::BlendMode::Clear;
    params.mask = mask();
    raster::SoftwareRenderer renderer(pixmap_);
    renderer.fill_rect(rect, paint::SolidColor{paint::Color::transparent()}, transform_, params);
}

void PixmapDrawTarget::copy_surface(const std::vector<uint8_t>& surface, const IntRect& source,
                                    const IntPoint& destination) {
    if (source.width <= 0 || source.height <= 0) {
        std::ostringstream oss;
        oss << "invalid surface size " << source.width << "x" << source.height;
        throw core::Error(core::ErrorKind::InvalidSize, oss.str());
    }
    auto view = raster::PixmapView::from_bytes(surface, static_cast<uint32_t>(source.width),
                                               static_cast<uint32_t>(source.height));
    raster::SoftwareRenderer renderer(pixmap_);
    renderer.copy_pixels(view, {0, 0, source.width, source.height}, destination);
}

paint::GradientStops PixmapDrawTarget::create_gradient_stops(paint::GradientStops stops) const {
    return paint::sort_gradient_stops(std::move(stops));
}

std::unique_ptr<path::GenericPathBuilder> PixmapDrawTarget::create_path_builder() const {
    return std::make_unique<path::PathBuilder>();
}

std::unique_ptr<GenericDrawTarget> PixmapDrawTarget::create_similar_draw_target(
    const IntSize& size) const {
    auto target = std::make_unique<PixmapDrawTarget>(size, diagnostics_);
    target->transform_ = transform_;
    target->opacity_ = opacity_;
    target->clip_paths_ = clip_paths_;
    target->rebuild_mask();
    return target;
}

void PixmapDrawTarget::draw_surface(const std::vector<uint8_t>& surface, const Rect& dest,
                                    const Rect& source, Filter filter,
                                    const DrawOptions& options) {
    uint32_t width = surface_extent(source.width());
    uint32_t height = surface_extent(source.height());
    auto view = raster::PixmapView::from_bytes(surface, width, height);
    if (dest.is_empty() || !transform_.invert()) return;

    // Image space -> dest rect -> device
    AffineTransform image_to_dest{
        dest.width() / static_cast<float>(width), 0, dest.x(),
        0, dest.height() / static_cast<float>(height), dest.y()};
    paint::ImagePattern pattern = paint::make_image_pattern(
        view, paint::SpreadMode::Pad, to_filter_quality(filter), opacity_,
        transform_ * image_to_dest);

    raster::PaintParams params = paint_params(options);
    params.anti_alias = false;
    params.opacity = 1.0f;
    raster::SoftwareRenderer renderer(pixmap_);
    renderer.fill_rect(dest, pattern, transform_, params);
}

void PixmapDrawTarget::draw_surface_with_shadow(const std::vector<uint8_t>& /*surface*/,
                                                const Point& /*dest*/,
                                                const paint::Color& /*color*/,
                                                const Point& /*offset*/, float /*sigma*/,
                                                paint::BlendMode /*op*/) const {
    diagnostics_->emit(core::Severity::Warning, kModule, "draw_surface_with_shadow",
                       "no support for drawing shadows");
}

void PixmapDrawTarget::fill(const path::Path& path, const paint::Paint& paint,
                            const DrawOptions& options) {
    raster::SoftwareRenderer renderer(pixmap_);
    renderer.fill_path(path, paint, raster::FillRule::Winding, transform_,
                       paint_params(options));
}

void PixmapDrawTarget::fill_rect(const Rect& rect, const paint::Paint& paint,
                                 const DrawOptions& options) {
    raster::SoftwareRenderer renderer(pixmap_);
    renderer.fill_rect(rect, paint, transform_, paint_params(options));
}

IntSize PixmapDrawTarget::get_size() const {
    return {static_cast<int>(pixmap_.width()), static_cast<int>(pixmap_.height())};
}

void PixmapDrawTarget::push_clip(const path::Path& path) {
    clip_paths_.push_back(path.transform(transform_));
    rebuild_mask();
}

void PixmapDrawTarget::pop_clip() {
    if (clip_paths_.empty()) {
        diagnostics_->emit(core::Severity::Warning, kModule, "pop_clip",
                           "pop_clip called with an empty clip stack");
        return;
    }
    clip_paths_.pop_back();
    rebuild_mask();
}

void PixmapDrawTarget::rebuild_mask() {
    if (clip_paths_.empty()) {
        mask_.reset();
        return;
    }
    raster::Mask mask = raster::Mask::create(pixmap_.width(), pixmap_.height());
    mask.fill(255);
    for (const auto& clip : clip_paths_) {
        mask.intersect_path(clip, raster::FillRule::Winding, true, AffineTransform::identity());
    }
    mask_ = std::move(mask);
}

std::vector<uint8_t> PixmapDrawTarget::snapshot_data(
    const std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)>& fn) const {
    return fn(pixmap_.data());
}

void PixmapDrawTarget::stroke(const path::Path& path, const paint::Paint& paint,
                              const paint::StrokeOptions& stroke, const DrawOptions& options) {
    raster::SoftwareRenderer renderer(pixmap_);
    renderer.stroke_path(path, paint, stroke, transform_, paint_params(options));
}

void PixmapDrawTarget::stroke_line(Point start, Point end, const paint::Paint& paint,
                                   const paint::StrokeOptions& stroke,
                                   const DrawOptions& options) {
    path::PathBuilder builder;
    builder.move_to(start);
    builder.line_to(end);
    auto line = builder.finish();
    if (!line) return;

    paint::StrokeOptions line_stroke = stroke;
    line_stroke.line_cap = stroke.line_join == paint::LineJoin::Round
        ? paint::LineCap::Round
        : paint::LineCap::Butt;
    this->stroke(*line, paint, line_stroke, options);
}

void PixmapDrawTarget::stroke_rect(const Rect& rect, const paint::Paint& paint,
                                   const paint::StrokeOptions& stroke,
                                   const DrawOptions& options) {
    this->stroke(path::Path::from_rect(rect), paint, stroke, options);
}

} // namespace easel::canvas
