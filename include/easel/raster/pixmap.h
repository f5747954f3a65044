#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace easel::raster {

// Read-only view over caller-owned premultiplied RGBA bytes. Construction
// checks that the buffer holds at least width * height * 4 bytes, so every
// pixel() access inside the declared size stays in range.
class PixmapView {
public:
    static PixmapView from_bytes(const uint8_t* data, size_t length,
                                 uint32_t width, uint32_t height);
    static PixmapView from_bytes(const std::vector<uint8_t>& data,
                                 uint32_t width, uint32_t height) {
        return from_bytes(data.data(), data.size(), width, height);
    }

    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }
    const uint8_t* data() const { return data_; }
    size_t byte_length() const { return static_cast<size_t>(width_) * height_ * 4; }

    // x < width(), y < height()
    const uint8_t* pixel(uint32_t x, uint32_t y) const {
        return data_ + (static_cast<size_t>(y) * width_ + x) * 4;
    }

private:
    PixmapView(const uint8_t* data, uint32_t width, uint32_t height)
        : data_(data), width_(width), height_(height) {}

    const uint8_t* data_;
    uint32_t width_;
    uint32_t height_;
};

// Owned premultiplied RGBA buffer, row-major, origin top-left.
class Pixmap {
public:
    // Throws core::Error(InvalidSize) for zero or oversized dimensions.
    static Pixmap create(uint32_t width, uint32_t height);
    static Pixmap from_view(const PixmapView& view);

    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }

    const std::vector<uint8_t>& data() const { return pixels_; }
    std::vector<uint8_t>& data_mut() { return pixels_; }

    PixmapView view() const {
        return PixmapView::from_bytes(pixels_, width_, height_);
    }

    uint8_t* pixel(uint32_t x, uint32_t y) {
        return pixels_.data() + (static_cast<size_t>(y) * width_ + x) * 4;
    }
    const uint8_t* pixel(uint32_t x, uint32_t y) const {
        return pixels_.data() + (static_cast<size_t>(y) * width_ + x) * 4;
    }

    // Sets every pixel to the given premultiplied bytes.
    void fill(uint8_t r, uint8_t g, uint8_t b, uint8_t a);

private:
    Pixmap(uint32_t width, uint32_t height)
        : width_(width), height_(height),
          pixels_(static_cast<size_t>(width) * height * 4, 0) {}

    uint32_t width_;
    uint32_t height_;
    std::vector<uint8_t> pixels_;
};

void validate_pixmap_size(uint32_t width, uint32_t height);

} // namespace easel::raster
