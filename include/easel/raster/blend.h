#pragma once
#include <easel/paint/blend_mode.h>
#include <cstdint>

namespace easel::raster {

// Premultiplied color with channels in [0, 1].
struct PremulPixel {
    float r = 0, g = 0, b = 0, a = 0;
};

PremulPixel load_pixel(const uint8_t* px);
void store_pixel(uint8_t* px, const PremulPixel& p);

// Combines a source pixel with the destination pixel under `mode`, using the
// Porter-Duff operators and the W3C compositing formulas for the separable
// and non-separable blend modes.
PremulPixel blend(paint::BlendMode mode, const PremulPixel& src, const PremulPixel& dst);

// dst + (result - dst) * weight, where result = blend(mode, src, dst).
// A weight of 0 leaves the destination untouched.
PremulPixel blend_weighted(paint::BlendMode mode, const PremulPixel& src,
                           const PremulPixel& dst, float weight);

} // namespace easel::raster
