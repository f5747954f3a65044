#include <easel/raster/software_renderer.h>
#include <easel/raster/blend.h>
#include <easel/raster/shader.h>
#include <easel/raster/stroker.h>
#include <algorithm>
#include <cstdio>
#include <cstring>

namespace easel::raster {

void SoftwareRenderer::fill_path(const path::Path& path, const paint::Paint& paint,
                                 FillRule rule, const AffineTransform& transform,
                                 const PaintParams& params) {
    auto shader = Shader::create(paint, params.opacity);
    if (!shader) return;

    const Mask* mask = params.mask;
    if (mask && (mask->width() != pixmap_.width() || mask->height() != pixmap_.height())) {
        mask = nullptr;
    }

    rasterize_path(path, transform, rule, params.anti_alias, width(), height(),
                   [&](int y, int x_begin, int x_end, const float* coverage) {
        const float fy = static_cast<float>(y) + 0.5f;
        for (int x = x_begin; x < x_end; x++) {
            float weight = coverage[x - x_begin];
            if (mask) {
                weight *= mask->value(static_cast<uint32_t>(x), static_cast<uint32_t>(y)) / 255.0f;
            }
            if (weight <= 0.0f) continue;

            uint8_t* px = pixmap_.pixel(static_cast<uint32_t>(x), static_cast<uint32_t>(y));
            PremulPixel src = shader->sample(static_cast<float>(x) + 0.5f, fy);
            store_pixel(px, blend_weighted(params.blend_mode, src, load_pixel(px), weight));
        }
    });
}

void SoftwareRenderer::fill_rect(const geometry::Rect& rect, const paint::Paint& paint,
                                 const AffineTransform& transform, const PaintParams& params) {
    fill_path(path::Path::from_rect(rect), paint, FillRule::Winding, transform, params);
}

void SoftwareRenderer::stroke_path(const path::Path& path, const paint::Paint& paint,
                                   const paint::StrokeOptions& stroke,
                                   const AffineTransform& transform, const PaintParams& params) {
    auto outline = stroke_to_path(path, stroke, max_scale(transform));
    if (!outline) return;
    fill_path(*outline, paint, FillRule::Winding, transform, params);
}

void SoftwareRenderer::copy_pixels(const PixmapView& src, const geometry::IntRect& source,
                                   const geometry::IntPoint& dest) {
    // Clip the source rect to the source pixmap, shifting the destination
    int sx0 = std::max(source.x, 0);
    int sy0 = std::max(source.y, 0);
    int sx1 = std::min(source.x + source.width, static_cast<int>(src.width()));
    int sy1 = std::min(source.y + source.height, static_cast<int>(src.height()));
    int dx0 = dest.x + (sx0 - source.x);
    int dy0 = dest.y + (sy0 - source.y);

    // Then clip against the destination
    if (dx0 < 0) { sx0 -= dx0; dx0 = 0; }
    if (dy0 < 0) { sy0 -= dy0; dy0 = 0; }
    sx1 = std::min(sx1, sx0 + (width() - dx0));
    sy1 = std::min(sy1, sy0 + (height() - dy0));
    if (sx0 >= sx1 || sy0 >= sy1) return;

    const size_t row_bytes = static_cast<size_t>(sx1 - sx0) * 4;
    for (int y = sy0; y < sy1; y++) {
        const uint8_t* from = src.pixel(static_cast<uint32_t>(sx0), static_cast<uint32_t>(y));
        uint8_t* to = pixmap_.pixel(static_cast<uint32_t>(dx0),
                                    static_cast<uint32_t>(dy0 + (y - sy0)));
        std::memcpy(to, from, row_bytes);
    }
}

bool save_ppm(const Pixmap& pixmap, const std::string& filename) {
    FILE* f = fopen(filename.c_str(), "wb");
    if (!f) return false;

    fprintf(f, "P6\n%u %u\n255\n", pixmap.width(), pixmap.height());

    const auto& pixels = pixmap.data();
    const size_t count = static_cast<size_t>(pixmap.width()) * pixmap.height();
    bool ok = true;
    for (size_t i = 0; i < count && ok; i++) {
        uint8_t rgb[3] = {pixels[i * 4], pixels[i * 4 + 1], pixels[i * 4 + 2]};
        ok = fwrite(rgb, 1, 3, f) == 3;
    }

    return fclose(f) == 0 && ok;
}

} // namespace easel::raster
