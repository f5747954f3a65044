#include <easel/raster/pixmap.h>
#include <easel/core/config.h>
#include <easel/core/error.h>
#include <algorithm>
#include <sstream>

namespace easel::raster {

void validate_pixmap_size(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0 ||
        width > core::config::kMaxPixmapDimension ||
        height > core::config::kMaxPixmapDimension) {
        std::ostringstream oss;
        oss << "invalid pixmap size " << width << "x" << height;
        throw core::Error(core::ErrorKind::InvalidSize, oss.str());
    }
}

PixmapView PixmapView::from_bytes(const uint8_t* data, size_t length,
                                  uint32_t width, uint32_t height) {
    validate_pixmap_size(width, height);
    size_t needed = static_cast<size_t>(width) * height * 4;
    if (data == nullptr || length < needed) {
        std::ostringstream oss;
        oss << "pixel buffer of " << length << " bytes is shorter than "
            << width << "x" << height << "x4 = " << needed;
        throw core::Error(core::ErrorKind::OutOfBounds, oss.str());
    }
    return PixmapView(data, width, height);
}

Pixmap Pixmap::create(uint32_t width, uint32_t height) {
    validate_pixmap_size(width, height);
    return Pixmap(width, height);
}

Pixmap Pixmap::from_view(const PixmapView& view) {
    Pixmap pixmap(view.width(), view.height());
    std::copy(view.data(), view.data() + view.byte_length(), pixmap.pixels_.begin());
    return pixmap;
}

void Pixmap::fill(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    for (size_t i = 0; i < pixels_.size(); i += 4) {
        pixels_[i + 0] = r;
        pixels_[i + 1] = g;
        pixels_[i + 2] = b;
        pixels_[i + 3] = a;
    }
}

} // namespace easel::raster
