#pragma once
#include <easel/geometry/geometry.h>
#include <optional>

namespace easel::geometry {

// 2D affine transform matrix: [a b tx; c d ty; 0 0 1]
struct AffineTransform {
    float a = 1, b = 0, tx = 0;
    float c = 0, d = 1, ty = 0;

    static AffineTransform identity() { return {1, 0, 0, 0, 1, 0}; }
    static AffineTransform translate(float dx, float dy) { return {1, 0, dx, 0, 1, dy}; }
    static AffineTransform scale(float sx, float sy) { return {sx, 0, 0, 0, sy, 0}; }
    static AffineTransform rotate(float radians);

    // Canvas argument order: x' = a*x + c*y + e, y' = b*x + d*y + f
    static AffineTransform from_canvas(float ca, float cb, float cc, float cd, float ce, float cf) {
        return {ca, cc, ce, cb, cd, cf};
    }

    // Apply this transform to a point (px, py) -> (ox, oy)
    void apply(float px, float py, float& ox, float& oy) const {
        ox = a * px + b * py + tx;
        oy = c * px + d * py + ty;
    }

    Point apply(Point p) const {
        return {a * p.x + b * p.y + tx, c * p.x + d * p.y + ty};
    }

    // Linear part only; used for direction vectors.
    Point apply_vector(Point v) const {
        return {a * v.x + b * v.y, c * v.x + d * v.y};
    }

    // Returns nullopt when the matrix is singular or not finite.
    std::optional<AffineTransform> invert() const;

    // Concatenate: this * other (other is applied first)
    AffineTransform operator*(const AffineTransform& o) const {
        AffineTransform r;
        r.a  = a * o.a  + b * o.c;
        r.b  = a * o.b  + b * o.d;
        r.tx = a * o.tx + b * o.ty + tx;
        r.c  = c * o.a  + d * o.c;
        r.d  = c * o.b  + d * o.d;
        r.ty = c * o.tx + d * o.ty + ty;
        return r;
    }

    bool operator==(const AffineTransform&) const = default;

    bool is_identity() const {
        return a == 1 && b == 0 && tx == 0 && c == 0 && d == 1 && ty == 0;
    }

    bool is_finite() const;
};

} // namespace easel::geometry
