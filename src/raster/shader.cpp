#include <easel/raster/shader.h>
#include <algorithm>
#include <cmath>

namespace easel::raster {

using geometry::AffineTransform;
using geometry::Point;

namespace {

using paint::SpreadMode;

PremulPixel to_pixel(const paint::Color& c) {
    return {c.red(), c.green(), c.blue(), c.alpha()};
}

// Interpolates the straight channels of two stops, then premultiplies.
PremulPixel mix_stops(const paint::Color& lhs, const paint::Color& rhs, float t) {
    float a = lhs.alpha() + (rhs.alpha() - lhs.alpha()) * t;
    float r = lhs.straight_red() + (rhs.straight_red() - lhs.straight_red()) * t;
    float g = lhs.straight_green() + (rhs.straight_green() - lhs.straight_green()) * t;
    float b = lhs.straight_blue() + (rhs.straight_blue() - lhs.straight_blue()) * t;
    return {r * a, g * a, b * a, a};
}

PremulPixel lerp(const PremulPixel& lhs, const PremulPixel& rhs, float t) {
    return {lhs.r + (rhs.r - lhs.r) * t, lhs.g + (rhs.g - lhs.g) * t,
            lhs.b + (rhs.b - lhs.b) * t, lhs.a + (rhs.a - lhs.a) * t};
}

PremulPixel scaled(const PremulPixel& p, float k) {
    return {p.r * k, p.g * k, p.b * k, p.a * k};
}

// Wraps an integer texel coordinate into [0, size).
int tile(SpreadMode spread, int i, int size) {
    switch (spread) {
        case SpreadMode::Pad:
            return std::clamp(i, 0, size - 1);
        case SpreadMode::Repeat: {
            int m = i % size;
            return m < 0 ? m + size : m;
        }
        case SpreadMode::Reflect: {
            int period = size * 2;
            int m = i % period;
            if (m < 0) m += period;
            return m < size ? m : period - 1 - m;
        }
    }
    return 0;
}

// Keeps far away samples inside int range before tiling.
int texel_coord(float v) {
    if (!std::isfinite(v)) return 0;
    return static_cast<int>(std::clamp(std::floor(v), -1.0e7f, 1.0e7f));
}

PremulPixel texel(const Pixmap& pixmap, SpreadMode spread, int x, int y) {
    int w = static_cast<int>(pixmap.width());
    int h = static_cast<int>(pixmap.height());
    return load_pixel(pixmap.pixel(static_cast<uint32_t>(tile(spread, x, w)),
                                   static_cast<uint32_t>(tile(spread, y, h))));
}

} // namespace

float apply_spread(SpreadMode spread, float t) {
    switch (spread) {
        case SpreadMode::Pad:
            return std::clamp(t, 0.0f, 1.0f);
        case SpreadMode::Repeat:
            return t - std::floor(t);
        case SpreadMode::Reflect: {
            float m = t - 2.0f * std::floor(t * 0.5f);
            return m <= 1.0f ? m : 2.0f - m;
        }
    }
    return t;
}

std::optional<Shader> Shader::create(const paint::Paint& paint, float opacity) {
    AffineTransform inverse = AffineTransform::identity();
    if (const auto* g = std::get_if<paint::LinearGradient>(&paint)) {
        auto inv = g->transform.invert();
        if (!inv) return std::nullopt;
        inverse = *inv;
    } else if (const auto* g = std::get_if<paint::RadialGradient>(&paint)) {
        auto inv = g->transform.invert();
        if (!inv) return std::nullopt;
        inverse = *inv;
    } else if (const auto* p = std::get_if<paint::ImagePattern>(&paint)) {
        if (!p->pixmap) return std::nullopt;
        auto inv = p->transform.invert();
        if (!inv) return std::nullopt;
        inverse = *inv;
    }

    float o = std::isfinite(opacity) ? std::clamp(opacity, 0.0f, 1.0f) : 0.0f;
    Shader shader(paint, inverse, o);
    if (const auto* solid = std::get_if<paint::SolidColor>(&paint)) {
        shader.solid_ = scaled(to_pixel(solid->color), o);
    }
    return shader;
}

PremulPixel Shader::sample(float x, float y) const {
    if (is_solid()) return solid_;

    Point p = inverse_.apply(Point{x, y});
    PremulPixel color;
    if (const auto* linear = std::get_if<paint::LinearGradient>(&paint_)) {
        color = sample_linear(*linear, p);
    } else if (const auto* radial = std::get_if<paint::RadialGradient>(&paint_)) {
        color = sample_radial(*radial, p).value_or(PremulPixel{});
    } else if (const auto* pattern = std::get_if<paint::ImagePattern>(&paint_)) {
        color = scaled(sample_pattern(*pattern, p), pattern->opacity);
    }
    return scaled(color, opacity_);
}

PremulPixel Shader::sample_stops(const paint::GradientStops& stops, SpreadMode spread,
                                 float t) const {
    t = apply_spread(spread, t);
    if (t <= stops.front().offset) return to_pixel(stops.front().color);
    if (t >= stops.back().offset) return to_pixel(stops.back().color);

    // Last stop whose offset is <= t; equal offsets produce a hard edge
    size_t i = 0;
    while (i + 1 < stops.size() && stops[i + 1].offset <= t) i++;
    if (i + 1 >= stops.size()) return to_pixel(stops.back().color);

    float t0 = stops[i].offset;
    float t1 = stops[i + 1].offset;
    float local = t1 > t0 ? (t - t0) / (t1 - t0) : 0.0f;
    return mix_stops(stops[i].color, stops[i + 1].color, local);
}

PremulPixel Shader::sample_linear(const paint::LinearGradient& g, Point p) const {
    Point axis = g.end - g.start;
    float len2 = axis.dot(axis);
    float t = len2 > 0 ? (p - g.start).dot(axis) / len2 : 0.0f;
    return sample_stops(g.stops, g.spread, t);
}

// Largest w with |p - c(w)| = r(w) and r(w) >= 0, where c and r interpolate
// between the two circles.
std::optional<PremulPixel> Shader::sample_radial(const paint::RadialGradient& g,
                                                 Point p) const {
    Point cd = g.end - g.start;
    Point pd = p - g.start;
    float dr = g.end_radius - g.start_radius;

    float a = cd.dot(cd) - dr * dr;
    float b = pd.dot(cd) + g.start_radius * dr;
    float c = pd.dot(pd) - g.start_radius * g.start_radius;

    auto radius_ok = [&](float w) { return g.start_radius + w * dr >= 0.0f; };

    float w;
    if (std::abs(a) < 1e-6f) {
        if (std::abs(b) < 1e-9f) return std::nullopt;
        w = c / (2.0f * b);
        if (!radius_ok(w)) return std::nullopt;
    } else {
        float disc = b * b - a * c;
        if (disc < 0) return std::nullopt;
        float sq = std::sqrt(disc);
        float w1 = (b + sq) / a;
        float w2 = (b - sq) / a;
        float hi = std::max(w1, w2);
        float lo = std::min(w1, w2);
        if (radius_ok(hi)) {
            w = hi;
        } else if (radius_ok(lo)) {
            w = lo;
        } else {
            return std::nullopt;
        }
    }
    return sample_stops(g.stops, g.spread, w);
}

PremulPixel Shader::sample_pattern(const paint::ImagePattern& pattern, Point p) const {
    const Pixmap& pixmap = *pattern.pixmap;
    switch (pattern.filter) {
        case paint::FilterQuality::Nearest:
            return texel(pixmap, pattern.spread, texel_coord(p.x), texel_coord(p.y));
        case paint::FilterQuality::Bilinear: {
            float u = p.x - 0.5f;
            float v = p.y - 0.5f;
            int x0 = texel_coord(u);
            int y0 = texel_coord(v);
            float tx = std::clamp(u - std::floor(u), 0.0f, 1.0f);
            float ty = std::clamp(v - std::floor(v), 0.0f, 1.0f);
            PremulPixel top = lerp(texel(pixmap, pattern.spread, x0, y0),
                                   texel(pixmap, pattern.spread, x0 + 1, y0), tx);
            PremulPixel bottom = lerp(texel(pixmap, pattern.spread, x0, y0 + 1),
                                      texel(pixmap, pattern.spread, x0 + 1, y0 + 1), tx);
            return lerp(top, bottom, ty);
        }
    }
    return {};
}

} // namespace easel::raster
