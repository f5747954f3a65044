#include <easel/raster/mask.h>
#include <easel/raster/pixmap.h>
#include <algorithm>

namespace easel::raster {

namespace {

uint8_t coverage_to_byte(float coverage) {
    return static_cast<uint8_t>(std::clamp(coverage, 0.0f, 1.0f) * 255.0f + 0.5f);
}

} // namespace

Mask Mask::create(uint32_t width, uint32_t height) {
    validate_pixmap_size(width, height);
    return Mask(width, height);
}

void Mask::fill(uint8_t value) {
    std::fill(data_.begin(), data_.end(), value);
}

void Mask::intersect_path(const path::Path& path, FillRule rule, bool anti_alias,
                          const AffineTransform& transform) {
    std::vector<uint8_t> path_coverage(data_.size(), 0);
    rasterize_path(path, transform, rule, anti_alias,
                   static_cast<int>(width_), static_cast<int>(height_),
                   [this, &path_coverage](int y, int x_begin, int x_end, const float* coverage) {
        uint8_t* row = path_coverage.data() + static_cast<size_t>(y) * width_;
        for (int x = x_begin; x < x_end; x++) {
            row[x] = coverage_to_byte(coverage[x - x_begin]);
        }
    });
    for (size_t i = 0; i < data_.size(); i++) {
        data_[i] = static_cast<uint8_t>((data_[i] * path_coverage[i] + 127) / 255);
    }
}

} // namespace easel::raster
