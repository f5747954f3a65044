#pragma once
#include <array>
#include <cstdint>

namespace easel::paint {

// Straight (non-premultiplied) 8-bit color as delivered by the style layer.
struct RGBA {
    uint8_t red = 0, green = 0, blue = 0, alpha = 255;
    bool operator==(const RGBA&) const = default;
};

// Premultiplied color. Channels are premultiplied exactly once, when the
// color is built from straight input; nothing re-premultiplies it later.
class Color {
public:
    Color() = default;

    static Color from_rgba8(uint8_t r, uint8_t g, uint8_t b, uint8_t a);
    static Color from_rgba(const RGBA& rgba) {
        return from_rgba8(rgba.red, rgba.green, rgba.blue, rgba.alpha);
    }
    // Channels already premultiplied; clamped so that r, g, b <= a.
    static Color from_premultiplied(float r, float g, float b, float a);

    static Color transparent() { return {}; }
    static Color black() { return from_premultiplied(0, 0, 0, 1); }
    static Color white() { return from_premultiplied(1, 1, 1, 1); }

    float red() const { return r_; }
    float green() const { return g_; }
    float blue() const { return b_; }
    float alpha() const { return a_; }

    // Straight channels as given at construction. A fully transparent color
    // still carries its hue here; gradients interpolate these.
    float straight_red() const { return sr_; }
    float straight_green() const { return sg_; }
    float straight_blue() const { return sb_; }

    bool is_opaque() const { return a_ >= 1.0f; }
    bool is_transparent() const { return a_ <= 0.0f; }

    // Premultiplied bytes in RGBA order.
    std::array<uint8_t, 4> to_rgba8() const;

    bool operator==(const Color&) const = default;

private:
    float r_ = 0, g_ = 0, b_ = 0, a_ = 0;
    float sr_ = 0, sg_ = 0, sb_ = 0;
};

} // namespace easel::paint
