#include <easel/geometry/geometry.h>
#include <easel/geometry/transform.h>
#include <easel/core/error.h>
#include <cmath>
#include <sstream>

namespace easel::geometry {

float Point::length() const {
    return std::sqrt(x * x + y * y);
}

bool Point::is_finite() const {
    return std::isfinite(x) && std::isfinite(y);
}

Rect Rect::from_xywh(float x, float y, float width, float height) {
    if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(width) ||
        !std::isfinite(height) || width < 0 || height < 0 ||
        !std::isfinite(x + width) || !std::isfinite(y + height)) {
        std::ostringstream oss;
        oss << "invalid rect x=" << x << " y=" << y << " w=" << width << " h=" << height;
        throw core::Error(core::ErrorKind::InvalidGeometry, oss.str());
    }
    return Rect(x, y, width, height);
}

Rect Rect::from_ltrb(float left, float top, float right, float bottom) {
    return from_xywh(left, top, right - left, bottom - top);
}

AffineTransform AffineTransform::rotate(float radians) {
    float cs = std::cos(radians);
    float sn = std::sin(radians);
    return {cs, -sn, 0, sn, cs, 0};
}

std::optional<AffineTransform> AffineTransform::invert() const {
    if (!is_finite()) return std::nullopt;
    double det = static_cast<double>(a) * d - static_cast<double>(b) * c;
    if (det == 0.0 || !std::isfinite(det)) return std::nullopt;
    double inv_det = 1.0 / det;
    AffineTransform r;
    r.a = static_cast<float>(d * inv_det);
    r.b = static_cast<float>(-b * inv_det);
    r.c = static_cast<float>(-c * inv_det);
    r.d = static_cast<float>(a * inv_det);
    r.tx = static_cast<float>(-(static_cast<double>(r.a) * tx + static_cast<double>(r.b) * ty));
    r.ty = static_cast<float>(-(static_cast<double>(r.c) * tx + static_cast<double>(r.d) * ty));
    if (!r.is_finite()) return std::nullopt;
    return r;
}

bool AffineTransform::is_finite() const {
    return std::isfinite(a) && std::isfinite(b) && std::isfinite(tx) &&
           std::isfinite(c) && std::isfinite(d) && std::isfinite(ty);
}

} // namespace easel::geometry
