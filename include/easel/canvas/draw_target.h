#pragma once
#include <easel/canvas/style.h>
#include <easel/core/diagnostics.h>
#include <easel/geometry/geometry.h>
#include <easel/geometry/transform.h>
#include <easel/paint/paint.h>
#include <easel/paint/stroke_options.h>
#include <easel/path/path.h>
#include <easel/path/path_builder.h>
#include <easel/raster/mask.h>
#include <easel/raster/pixmap.h>
#include <easel/raster/software_renderer.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace easel::canvas {

using geometry::AffineTransform;
using geometry::IntPoint;
using geometry::IntRect;
using geometry::IntSize;
using geometry::Point;
using geometry::Rect;

// Raster surface a canvas context draws into. Pixel data is tightly packed
// premultiplied RGBA, row major, origin top-left.
class GenericDrawTarget {
public:
    virtual ~GenericDrawTarget() = default;

    virtual void clear_rect(const Rect& rect) = 0;
    virtual void copy_surface(const std::vector<uint8_t>& surface, const IntRect& source,
                              const IntPoint& destination) = 0;
    virtual paint::GradientStops create_gradient_stops(paint::GradientStops stops) const = 0;
    virtual std::unique_ptr<path::GenericPathBuilder> create_path_builder() const = 0;
    virtual std::unique_ptr<GenericDrawTarget> create_similar_draw_target(
        const IntSize& size) const = 0;
    virtual void draw_surface(const std::vector<uint8_t>& surface, const Rect& dest,
                              const Rect& source, Filter filter,
                              const DrawOptions& options) = 0;
    virtual void draw_surface_with_shadow(const std::vector<uint8_t>& surface,
                                          const Point& dest, const paint::Color& color,
                                          const Point& offset, float sigma,
                                          paint::BlendMode op) const = 0;
    virtual void fill(const path::Path& path, const paint::Paint& paint,
                      const DrawOptions& options) = 0;
    virtual void fill_rect(const Rect& rect, const paint::Paint& paint,
                           const DrawOptions& options) = 0;
    virtual IntSize get_size() const = 0;
    virtual AffineTransform get_transform() const = 0;
    virtual void set_transform(const AffineTransform& transform) = 0;
    virtual float get_opacity() const = 0;
    virtual void set_opacity(float opacity) = 0;
    virtual void push_clip(const path::Path& path) = 0;
    virtual void pop_clip() = 0;
    virtual size_t clip_depth() const = 0;
    virtual const std::vector<uint8_t>& snapshot() const = 0;
    virtual std::vector<uint8_t> snapshot_owned() const = 0;
    virtual std::vector<uint8_t> snapshot_data(
        const std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)>& fn) const = 0;
    virtual void stroke(const path::Path& path, const paint::Paint& paint,
                        const paint::StrokeOptions& stroke, const DrawOptions& options) = 0;
    virtual void stroke_line(Point start, Point end, const paint::Paint& paint,
                             const paint::StrokeOptions& stroke,
                             const DrawOptions& options) = 0;
    virtual void stroke_rect(const Rect& rect, const paint::Paint& paint,
                             const paint::StrokeOptions& stroke,
                             const DrawOptions& options) = 0;
};

// Software draw target over an owned raster::Pixmap. Clip paths are kept in
// device space; the cached mask is the intersection of all of them and is
// rebuilt whenever the stack changes.
class PixmapDrawTarget : public GenericDrawTarget {
public:
    // Throws core::Error(InvalidSize) for non-positive or oversized sizes.
    PixmapDrawTarget(const IntSize& size, std::shared_ptr<core::DiagnosticEmitter> diagnostics);

    void clear_rect(const Rect& rect) override;
    void copy_surface(const std::vector<uint8_t>& surface, const IntRect& source,
                      const IntPoint& destination) override;
    paint::GradientStops create_gradient_stops(paint::GradientStops stops) const override;
    std::unique_ptr<path::GenericPathBuilder> create_path_builder() const override;
    std::unique_ptr<GenericDrawTarget> create_similar_draw_target(
        const IntSize& size) const override;
    void draw_surface(const std::vector<uint8_t>& surface, const Rect& dest,
                      const Rect& source, Filter filter, const DrawOptions& options) override;
    void draw_surface_with_shadow(const std::vector<uint8_t>& surface, const Point& dest,
                                  const paint::Color& color, const Point& offset, float sigma,
                                  paint::BlendMode op) const override;
    void fill(const path::Path& path, const paint::Paint& paint,
              const DrawOptions& options) override;
    void fill_rect(const Rect& rect, const paint::Paint& paint,
                   const DrawOptions& options) override;
    IntSize get_size() const override;
    AffineTransform get_transform() const override { return transform_; }
    void set_transform(const AffineTransform& transform) override { transform_ = transform; }
    float get_opacity() const override { return opacity_; }
    void set_opacity(float opacity) override { opacity_ = opacity; }
    void push_clip(const path::Path& path) override;
    void pop_clip() override;
    size_t clip_depth() const override { return clip_paths_.size(); }
    const std::vector<uint8_t>& snapshot() const override { return pixmap_.data(); }
    std::vector<uint8_t> snapshot_owned() const override { return pixmap_.data(); }
    std::vector<uint8_t> snapshot_data(
        const std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)>& fn)
        const override;
    void stroke(const path::Path& path, const paint::Paint& paint,
                const paint::StrokeOptions& stroke, const DrawOptions& options) override;
    void stroke_line(Point start, Point end, const paint::Paint& paint,
                     const paint::StrokeOptions& stroke, const DrawOptions& options) override;
    void stroke_rect(const Rect& rect, const paint::Paint& paint,
                     const paint::StrokeOptions& stroke, const DrawOptions& options) override;

    const raster::Pixmap& pixmap() const { return pixmap_; }
    const raster::Mask* mask() const { return mask_ ? &*mask_ : nullptr; }

private:
    void rebuild_mask();
    raster::PaintParams paint_params(const DrawOptions& options) const;

    raster::Pixmap pixmap_;
    AffineTransform transform_;
    float opacity_ = 1.0f;
    std::vector<path::Path> clip_paths_;
    std::optional<raster::Mask> mask_;
    std::shared_ptr<core::DiagnosticEmitter> diagnostics_;
};

} // namespace easel::canvas
