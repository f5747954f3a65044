#include <easel/raster/blend.h>
#include <algorithm>
#include <cmath>
#include <iterator>

namespace easel::raster {

namespace {

using paint::BlendMode;

float clamp01(float v) {
    return std::clamp(v, 0.0f, 1.0f);
}

uint8_t to_byte(float v) {
    return static_cast<uint8_t>(clamp01(v) * 255.0f + 0.5f);
}

// Separable blend functions on straight color values.
float multiply(float s, float d) { return s * d; }
float screen(float s, float d) { return s + d - s * d; }

float hard_light(float s, float d) {
    return s <= 0.5f ? multiply(d, 2.0f * s) : screen(d, 2.0f * s - 1.0f);
}

float color_dodge(float s, float d) {
    if (d <= 0.0f) return 0.0f;
    if (s >= 1.0f) return 1.0f;
    return std::min(1.0f, d / (1.0f - s));
}

float color_burn(float s, float d) {
    if (d >= 1.0f) return 1.0f;
    if (s <= 0.0f) return 0.0f;
    return 1.0f - std::min(1.0f, (1.0f - d) / s);
}

float soft_light(float s, float d) {
    if (s <= 0.5f) {
        return d - (1.0f - 2.0f * s) * d * (1.0f - d);
    }
    float g = d <= 0.25f ? ((16.0f * d - 12.0f) * d + 4.0f) * d : std::sqrt(d);
    return d + (2.0f * s - 1.0f) * (g - d);
}

float separable(BlendMode mode, float s, float d) {
    switch (mode) {
        case BlendMode::Overlay:    return hard_light(d, s);
        case BlendMode::Darken:     return std::min(s, d);
        case BlendMode::Lighten:    return std::max(s, d);
        case BlendMode::ColorDodge: return color_dodge(s, d);
        case BlendMode::ColorBurn:  return color_burn(s, d);
        case BlendMode::HardLight:  return hard_light(s, d);
        case BlendMode::SoftLight:  return soft_light(s, d);
        case BlendMode::Difference: return std::abs(s - d);
        case BlendMode::Exclusion:  return s + d - 2.0f * s * d;
        case BlendMode::Multiply:   return multiply(s, d);
        default:                    return s;
    }
}

struct Rgb {
    float r, g, b;
};

float lum(const Rgb& c) {
    return 0.3f * c.r + 0.59f * c.g + 0.11f * c.b;
}

Rgb clip_color(Rgb c) {
    float l = lum(c);
    float n = std::min({c.r, c.g, c.b});
    float x = std::max({c.r, c.g, c.b});
    auto scale_low = [&](float v) { return l + (v - l) * l / (l - n); };
    auto scale_high = [&](float v) { return l + (v - l) * (1.0f - l) / (x - l); };
    if (n < 0.0f && l - n > 0.0f) {
        c = {scale_low(c.r), scale_low(c.g), scale_low(c.b)};
    }
    if (x > 1.0f && x - l > 0.0f) {
        c = {scale_high(c.r), scale_high(c.g), scale_high(c.b)};
    }
    return c;
}

Rgb set_lum(const Rgb& c, float l) {
    float delta = l - lum(c);
    return clip_color({c.r + delta, c.g + delta, c.b + delta});
}

float sat(const Rgb& c) {
    return std::max({c.r, c.g, c.b}) - std::min({c.r, c.g, c.b});
}

Rgb set_sat(Rgb c, float s) {
    float* ch[3] = {&c.r, &c.g, &c.b};
    std::sort(std::begin(ch), std::end(ch), [](float* lhs, float* rhs) { return *lhs < *rhs; });
    float& mn = *ch[0];
    float& mid = *ch[1];
    float& mx = *ch[2];
    if (mx > mn) {
        mid = (mid - mn) * s / (mx - mn);
        mx = s;
    } else {
        mid = 0.0f;
        mx = 0.0f;
    }
    mn = 0.0f;
    return c;
}

Rgb non_separable(BlendMode mode, const Rgb& s, const Rgb& d) {
    switch (mode) {
        case BlendMode::Hue:        return set_lum(set_sat(s, sat(d)), lum(d));
        case BlendMode::Saturation: return set_lum(set_sat(d, sat(s)), lum(d));
        case BlendMode::Color:      return set_lum(s, lum(d));
        case BlendMode::Luminosity: return set_lum(d, lum(s));
        default:                    return s;
    }
}

Rgb unpremultiply(const PremulPixel& p) {
    if (p.a <= 0.0f) return {0, 0, 0};
    return {clamp01(p.r / p.a), clamp01(p.g / p.a), clamp01(p.b / p.a)};
}

// result = (1 - da) * s + (1 - sa) * d + sa * da * B(s, d)
PremulPixel mix(const PremulPixel& s, const PremulPixel& d, const Rgb& blended) {
    PremulPixel out;
    float both = s.a * d.a;
    out.r = (1.0f - d.a) * s.r + (1.0f - s.a) * d.r + both * blended.r;
    out.g = (1.0f - d.a) * s.g + (1.0f - s.a) * d.g + both * blended.g;
    out.b = (1.0f - d.a) * s.b + (1.0f - s.a) * d.b + both * blended.b;
    out.a = s.a + d.a - both;
    return out;
}

PremulPixel scaled(const PremulPixel& p, float k) {
    return {p.r * k, p.g * k, p.b * k, p.a * k};
}

PremulPixel sum(const PremulPixel& lhs, const PremulPixel& rhs) {
    return {lhs.r + rhs.r, lhs.g + rhs.g, lhs.b + rhs.b, lhs.a + rhs.a};
}

} // namespace

PremulPixel load_pixel(const uint8_t* px) {
    return {px[0] / 255.0f, px[1] / 255.0f, px[2] / 255.0f, px[3] / 255.0f};
}

void store_pixel(uint8_t* px, const PremulPixel& p) {
    float a = clamp01(p.a);
    px[0] = to_byte(std::min(p.r, a));
    px[1] = to_byte(std::min(p.g, a));
    px[2] = to_byte(std::min(p.b, a));
    px[3] = to_byte(a);
}

PremulPixel blend(BlendMode mode, const PremulPixel& s, const PremulPixel& d) {
    switch (mode) {
        case BlendMode::Clear:
            return {};
        case BlendMode::Source:
            return s;
        case BlendMode::Destination:
            return d;
        case BlendMode::SourceOver:
            return sum(s, scaled(d, 1.0f - s.a));
        case BlendMode::DestinationOver:
            return sum(d, scaled(s, 1.0f - d.a));
        case BlendMode::SourceIn:
            return scaled(s, d.a);
        case BlendMode::DestinationIn:
            return scaled(d, s.a);
        case BlendMode::SourceOut:
            return scaled(s, 1.0f - d.a);
        case BlendMode::DestinationOut:
            return scaled(d, 1.0f - s.a);
        case BlendMode::SourceAtop:
            return sum(scaled(s, d.a), scaled(d, 1.0f - s.a));
        case BlendMode::DestinationAtop:
            return sum(scaled(d, s.a), scaled(s, 1.0f - d.a));
        case BlendMode::Xor:
            return sum(scaled(s, 1.0f - d.a), scaled(d, 1.0f - s.a));
        case BlendMode::Plus:
            return {std::min(s.r + d.r, 1.0f), std::min(s.g + d.g, 1.0f),
                    std::min(s.b + d.b, 1.0f), std::min(s.a + d.a, 1.0f)};
        case BlendMode::Modulate:
            return {s.r * d.r, s.g * d.g, s.b * d.b, s.a * d.a};
        case BlendMode::Screen:
            return {screen(s.r, d.r), screen(s.g, d.g), screen(s.b, d.b), screen(s.a, d.a)};
        case BlendMode::Overlay:
        case BlendMode::Darken:
        case BlendMode::Lighten:
        case BlendMode::ColorDodge:
        case BlendMode::ColorBurn:
        case BlendMode::HardLight:
        case BlendMode::SoftLight:
        case BlendMode::Difference:
        case BlendMode::Exclusion:
        case BlendMode::Multiply: {
            Rgb sc = unpremultiply(s);
            Rgb dc = unpremultiply(d);
            return mix(s, d, {separable(mode, sc.r, dc.r), separable(mode, sc.g, dc.g),
                              separable(mode, sc.b, dc.b)});
        }
        case BlendMode::Hue:
        case BlendMode::Saturation:
        case BlendMode::Color:
        case BlendMode::Luminosity:
            return mix(s, d, non_separable(mode, unpremultiply(s), unpremultiply(d)));
    }
    return s;
}

PremulPixel blend_weighted(BlendMode mode, const PremulPixel& src, const PremulPixel& dst,
                           float weight) {
    if (weight <= 0.0f) return dst;
    PremulPixel result = blend(mode, src, dst);
    if (weight >= 1.0f) return result;
    return {dst.r + (result.r - dst.r) * weight,
            dst.g + (result.g - dst.g) * weight,
            dst.b + (result.b - dst.b) * weight,
            dst.a + (result.a - dst.a) * weight};
}

} // namespace easel::raster
