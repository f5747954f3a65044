#include <easel/raster/stroker.h>
#include <easel/core/config.h>
#include <easel/path/path_builder.h>
#include <easel/raster/rasterizer.h>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <vector>

namespace easel::raster {

namespace {

using geometry::Point;
using paint::LineCap;
using paint::LineJoin;

constexpr float kEpsilon = 1e-6f;

Point unit(Point v) {
    float len = v.length();
    return len > 0 ? v * (1.0f / len) : Point{};
}

// Left-hand normal of a unit direction.
Point normal_of(Point dir) {
    return {-dir.y, dir.x};
}

class OutlineBuilder {
public:
    OutlineBuilder(float half_width, float resolution_scale)
        : half_width_(half_width), round_segments_(round_segments_for(half_width * resolution_scale)) {}

    void add_polygon(std::vector<Point> poly) {
        if (poly.size() < 3) return;
        float area = 0;
        for (size_t i = 0; i < poly.size(); i++) {
            area += poly[i].cross(poly[(i + 1) % poly.size()]);
        }
        if (std::abs(area) < kEpsilon) return;
        // One winding direction for every piece so overlaps add up
        if (area < 0) std::reverse(poly.begin(), poly.end());
        builder_.move_to(poly[0]);
        for (size_t i = 1; i < poly.size(); i++) builder_.line_to(poly[i]);
        builder_.close();
    }

    void add_circle(Point center) {
        std::vector<Point> poly;
        poly.reserve(static_cast<size_t>(round_segments_));
        for (int i = 0; i < round_segments_; i++) {
            float angle = 2.0f * std::numbers::pi_v<float> * static_cast<float>(i) /
                          static_cast<float>(round_segments_);
            poly.push_back({center.x + half_width_ * std::cos(angle),
                            center.y + half_width_ * std::sin(angle)});
        }
        add_polygon(std::move(poly));
    }

    void add_segment(Point a, Point b) {
        Point n = normal_of(unit(b - a)) * half_width_;
        add_polygon({a + n, b + n, b - n, a - n});
    }

    void add_join(Point p, Point d0, Point d1, LineJoin join, float miter_limit) {
        float cross = d0.cross(d1);
        float dot = d0.dot(d1);
        if (std::abs(cross) < kEpsilon && dot > 0) return;  // straight through

        if (join == LineJoin::Round) {
            add_circle(p);
            return;
        }

        Point n0 = normal_of(d0);
        Point n1 = normal_of(d1);
        float side = cross > 0 ? -1.0f : 1.0f;
        Point outer0 = p + n0 * (side * half_width_);
        Point outer1 = p + n1 * (side * half_width_);

        if (join == LineJoin::Miter) {
            float cos_half = std::sqrt(std::max(0.0f, (1.0f + n0.dot(n1)) * 0.5f));
            if (cos_half > kEpsilon && 1.0f / cos_half <= miter_limit) {
                Point bisector = unit(n0 + n1);
                Point tip = p + bisector * (side * half_width_ / cos_half);
                add_polygon({p, outer0, tip, outer1});
                return;
            }
        }
        add_polygon({p, outer0, outer1});
    }

    void add_cap(Point p, Point dir, LineCap cap) {
        switch (cap) {
            case LineCap::Butt:
                break;
            case LineCap::Round:
                add_circle(p);
                break;
            case LineCap::Square: {
                Point n = normal_of(dir) * half_width_;
                Point ext = dir * half_width_;
                add_polygon({p + n, p + n + ext, p - n + ext, p - n});
                break;
            }
        }
    }

    std::optional<path::Path> finish() { return builder_.finish(); }

private:
    static int round_segments_for(float device_radius) {
        const float tolerance = core::config::kCurveTolerance;
        int n = core::config::kRoundSegmentsPerTurn;
        if (device_radius > tolerance) {
            float step = 2.0f * std::acos(1.0f - tolerance / device_radius);
            if (step > 0) {
                n = std::max(n, static_cast<int>(std::ceil(2.0f * std::numbers::pi_v<float> / step)));
            }
        }
        return std::min(n, 1024);
    }

    path::PathBuilder builder_;
    float half_width_;
    int round_segments_;
};

} // namespace

std::optional<path::Path> stroke_to_path(const path::Path& path,
                                         const paint::StrokeOptions& stroke,
                                         float resolution_scale) {
    if (!std::isfinite(stroke.width) || stroke.width <= 0) return std::nullopt;
    if (!std::isfinite(resolution_scale) || resolution_scale <= 0) resolution_scale = 1.0f;

    const float half_width = stroke.width * 0.5f;
    OutlineBuilder outline(half_width, resolution_scale);

    float tolerance = core::config::kCurveTolerance / resolution_scale;
    std::vector<Polyline> polylines =
        flatten_path(path, AffineTransform::identity(), tolerance);

    for (auto& poly : polylines) {
        size_t raw_count = poly.points.size();
        std::vector<Point> pts;
        pts.reserve(raw_count);
        for (const auto& p : poly.points) {
            if (pts.empty() || (p - pts.back()).length() > kEpsilon) pts.push_back(p);
        }
        if (poly.closed && pts.size() > 1 && (pts.front() - pts.back()).length() <= kEpsilon) {
            pts.pop_back();
        }

        if (pts.size() == 1) {
            // Zero-length subpath: only caps that extend past the point show
            if (raw_count >= 2 && !poly.closed) {
                outline.add_cap(pts[0], {1, 0}, stroke.line_cap);
                outline.add_cap(pts[0], {-1, 0}, stroke.line_cap);
            }
            continue;
        }
        if (pts.empty()) continue;

        const size_t n = pts.size();
        const size_t segment_count = poly.closed ? n : n - 1;
        for (size_t i = 0; i < segment_count; i++) {
            outline.add_segment(pts[i], pts[(i + 1) % n]);
        }

        auto direction = [&](size_t seg) { return unit(pts[(seg + 1) % n] - pts[seg]); };

        if (poly.closed) {
            for (size_t i = 0; i < n; i++) {
                size_t prev = (i + n - 1) % n;
                outline.add_join(pts[i], direction(prev), direction(i),
                                 stroke.line_join, stroke.miter_limit);
            }
        } else {
            for (size_t i = 1; i + 1 < n; i++) {
                outline.add_join(pts[i], direction(i - 1), direction(i),
                                 stroke.line_join, stroke.miter_limit);
            }
            outline.add_cap(pts.front(), direction(0) * -1.0f, stroke.line_cap);
            outline.add_cap(pts.back(), direction(n - 2), stroke.line_cap);
        }
    }

    return outline.finish();
}

} // namespace easel::raster
