#include <easel/paint/color.h>
#include <algorithm>
#include <cmath>

namespace easel::paint {

namespace {

uint8_t to_byte(float v) {
    return static_cast<uint8_t>(std::clamp(v, 0.0f, 1.0f) * 255.0f + 0.5f);
}

} // namespace

Color Color::from_rgba8(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    float alpha = a / 255.0f;
    Color c;
    c.r_ = r / 255.0f * alpha;
    c.g_ = g / 255.0f * alpha;
    c.b_ = b / 255.0f * alpha;
    c.a_ = alpha;
    c.sr_ = r / 255.0f;
    c.sg_ = g / 255.0f;
    c.sb_ = b / 255.0f;
    return c;
}

Color Color::from_premultiplied(float r, float g, float b, float a) {
    Color c;
    c.a_ = std::isfinite(a) ? std::clamp(a, 0.0f, 1.0f) : 0.0f;
    c.r_ = std::isfinite(r) ? std::clamp(r, 0.0f, c.a_) : 0.0f;
    c.g_ = std::isfinite(g) ? std::clamp(g, 0.0f, c.a_) : 0.0f;
    c.b_ = std::isfinite(b) ? std::clamp(b, 0.0f, c.a_) : 0.0f;
    if (c.a_ > 0) {
        c.sr_ = c.r_ / c.a_;
        c.sg_ = c.g_ / c.a_;
        c.sb_ = c.b_ / c.a_;
    }
    return c;
}

std::array<uint8_t, 4> Color::to_rgba8() const {
    return {to_byte(r_), to_byte(g_), to_byte(b_), to_byte(a_)};
}

} // namespace easel::paint
