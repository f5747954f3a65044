#include <easel/paint/paint.h>
#include <easel/core/error.h>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace easel::paint {

namespace {

constexpr float kNearlyZero = 1.0f / 4096.0f;

void validate_stops(const GradientStops& stops) {
    if (stops.empty()) {
        throw core::Error(core::ErrorKind::InvalidGradient, "gradient has no color stops");
    }
    for (const auto& stop : stops) {
        if (!std::isfinite(stop.offset)) {
            throw core::Error(core::ErrorKind::InvalidGradient, "gradient stop offset is not finite");
        }
    }
}

void validate_point(const Point& p, const char* what) {
    if (!p.is_finite()) {
        std::ostringstream oss;
        oss << "gradient " << what << " point is not finite";
        throw core::Error(core::ErrorKind::InvalidGradient, oss.str());
    }
}

void validate_transform(const AffineTransform& transform) {
    if (!transform.invert()) {
        throw core::Error(core::ErrorKind::NonInvertibleTransform,
                          "paint transform cannot be inverted");
    }
}

} // namespace

GradientStops sort_gradient_stops(GradientStops stops) {
    std::stable_sort(stops.begin(), stops.end(),
                     [](const GradientStop& lhs, const GradientStop& rhs) {
                         return lhs.offset < rhs.offset;
                     });
    for (auto& stop : stops) {
        stop.offset = std::clamp(stop.offset, 0.0f, 1.0f);
    }
    return stops;
}

Paint make_linear_gradient(Point start, Point end, GradientStops stops,
                           SpreadMode spread, const AffineTransform& transform) {
    validate_stops(stops);
    validate_point(start, "start");
    validate_point(end, "end");
    validate_transform(transform);

    if (stops.size() == 1) {
        return SolidColor{stops.front().color};
    }
    stops = sort_gradient_stops(std::move(stops));

    // Coincident end points leave no direction to interpolate along
    if ((end - start).length() < kNearlyZero) {
        return SolidColor{stops.back().color};
    }

    LinearGradient gradient;
    gradient.start = start;
    gradient.end = end;
    gradient.stops = std::move(stops);
    gradient.spread = spread;
    gradient.transform = transform;
    return gradient;
}

Paint make_radial_gradient(Point start, float start_radius, Point end, float end_radius,
                           GradientStops stops, SpreadMode spread,
                           const AffineTransform& transform) {
    validate_stops(stops);
    validate_point(start, "start");
    validate_point(end, "end");
    validate_transform(transform);
    if (!std::isfinite(start_radius) || !std::isfinite(end_radius) ||
        start_radius < 0 || end_radius < 0) {
        std::ostringstream oss;
        oss << "invalid gradient radii r0=" << start_radius << " r1=" << end_radius;
        throw core::Error(core::ErrorKind::InvalidGradient, oss.str());
    }

    if (stops.size() == 1) {
        return SolidColor{stops.front().color};
    }
    stops = sort_gradient_stops(std::move(stops));

    bool same_center = (end - start).length() < kNearlyZero;
    bool same_radius = std::abs(end_radius - start_radius) < kNearlyZero;
    bool zero_radii = start_radius < kNearlyZero && end_radius < kNearlyZero;
    if ((same_center && same_radius) || zero_radii) {
        return SolidColor{stops.back().color};
    }

    RadialGradient gradient;
    gradient.start = start;
    gradient.start_radius = start_radius;
    gradient.end = end;
    gradient.end_radius = end_radius;
    gradient.stops = std::move(stops);
    gradient.spread = spread;
    gradient.transform = transform;
    return gradient;
}

ImagePattern make_image_pattern(const raster::PixmapView& view, SpreadMode spread,
                                FilterQuality filter, float opacity,
                                const AffineTransform& transform) {
    validate_transform(transform);
    ImagePattern pattern;
    pattern.pixmap = std::make_shared<const raster::Pixmap>(raster::Pixmap::from_view(view));
    pattern.spread = spread;
    pattern.filter = filter;
    pattern.opacity = std::clamp(opacity, 0.0f, 1.0f);
    pattern.transform = transform;
    return pattern;
}

bool is_zero_size_gradient(const Paint& paint) {
    return std::visit([](const auto&) { return false; }, paint);
}

} // namespace easel::paint
