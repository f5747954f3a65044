#pragma once
#include <easel/geometry/geometry.h>
#include <easel/paint/blend_mode.h>
#include <easel/paint/paint.h>
#include <easel/paint/stroke_options.h>
#include <easel/path/path.h>
#include <easel/raster/mask.h>
#include <easel/raster/pixmap.h>
#include <easel/raster/rasterizer.h>
#include <string>

namespace easel::raster {

// How a shape's coverage is combined with the destination.
struct PaintParams {
    paint::BlendMode blend_mode = paint::BlendMode::SourceOver;
    bool anti_alias = true;
    float opacity = 1.0f;            // multiplied into the shader output
    const Mask* mask = nullptr;      // optional clip, same size as the pixmap
};

// Draws paths into a caller-owned Pixmap. Pixels that receive no coverage
// are never written.
class SoftwareRenderer {
public:
    explicit SoftwareRenderer(Pixmap& pixmap) : pixmap_(pixmap) {}

    int width() const { return static_cast<int>(pixmap_.width()); }
    int height() const { return static_cast<int>(pixmap_.height()); }

    void fill_path(const path::Path& path, const paint::Paint& paint, FillRule rule,
                   const AffineTransform& transform, const PaintParams& params);

    void fill_rect(const geometry::Rect& rect, const paint::Paint& paint,
                   const AffineTransform& transform, const PaintParams& params);

    // Outlines the path in path space, then fills the outline under
    // `transform` with the non-zero rule.
    void stroke_path(const path::Path& path, const paint::Paint& paint,
                     const paint::StrokeOptions& stroke, const AffineTransform& transform,
                     const PaintParams& params);

    // Copies `source` from `src` so its top-left lands on `dest`. No blending,
    // transform or mask; the copy is clipped to both pixmaps.
    void copy_pixels(const PixmapView& src, const geometry::IntRect& source,
                     const geometry::IntPoint& dest);

private:
    Pixmap& pixmap_;
};

// Writes the RGB channels as a binary PPM (composited over black).
bool save_ppm(const Pixmap& pixmap, const std::string& filename);

} // namespace easel::raster
