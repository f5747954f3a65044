#pragma once
#include <easel/path/path.h>
#include <easel/raster/rasterizer.h>
#include <cstdint>
#include <vector>

namespace easel::raster {

// 8-bit coverage buffer the size of a draw target. 255 lets a pixel through,
// 0 hides it.
class Mask {
public:
    // Throws core::Error(InvalidSize) for zero or oversized dimensions.
    static Mask create(uint32_t width, uint32_t height);

    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }
    const std::vector<uint8_t>& data() const { return data_; }

    uint8_t value(uint32_t x, uint32_t y) const {
        return data_[static_cast<size_t>(y) * width_ + x];
    }

    // Multiplies the mask by the path's coverage; pixels outside the path
    // become 0.
    void intersect_path(const path::Path& path, FillRule rule, bool anti_alias,
                        const AffineTransform& transform);

    void fill(uint8_t value);

private:
    Mask(uint32_t width, uint32_t height)
        : width_(width), height_(height),
          data_(static_cast<size_t>(width) * height, 0) {}

    uint32_t width_;
    uint32_t height_;
    std::vector<uint8_t> data_;
};

} // namespace easel::raster
