#include <easel/raster/rasterizer.h>
#include <easel/core/config.h>
#include <algorithm>
#include <cmath>

namespace easel::raster {

namespace {

using path::PathSegment;
using path::PathVerb;

struct Edge {
    float x0, y0, x1, y1;  // y0 < y1
    float dxdy;
    int dir;               // +1 when the original segment pointed down
};

struct Crossing {
    float x;
    int dir;
};

int subdivisions_for(float deviation, float tolerance) {
    if (!(deviation > 0)) return 1;
    // Clamped as a float; huge curves would overflow the int conversion
    float n = std::ceil(std::sqrt(deviation / tolerance));
    if (!(n < static_cast<float>(core::config::kMaxCurveSubdivisions))) {
        return core::config::kMaxCurveSubdivisions;
    }
    return std::max(1, static_cast<int>(n));
}

void flatten_quad(Point p0, Point p1, Point p2, float tolerance, std::vector<Point>& out) {
    Point dd = p0 - p1 * 2.0f + p2;
    int n = subdivisions_for(dd.length() / 4.0f, tolerance);
    for (int i = 1; i <= n; i++) {
        float t = static_cast<float>(i) / static_cast<float>(n);
        float mt = 1.0f - t;
        out.push_back(p0 * (mt * mt) + p1 * (2.0f * mt * t) + p2 * (t * t));
    }
}

void flatten_cubic(Point p0, Point p1, Point p2, Point p3, float tolerance,
                   std::vector<Point>& out) {
    float m = std::max((p0 - p1 * 2.0f + p2).length(), (p1 - p2 * 2.0f + p3).length());
    int n = subdivisions_for(m * 0.75f, tolerance);
    for (int i = 1; i <= n; i++) {
        float t = static_cast<float>(i) / static_cast<float>(n);
        float mt = 1.0f - t;
        out.push_back(p0 * (mt * mt * mt) + p1 * (3.0f * mt * mt * t) +
                      p2 * (3.0f * mt * t * t) + p3 * (t * t * t));
    }
}

// Adds `weight` of coverage for the horizontal span [xa, xb).
void add_span(std::vector<float>& acc, int width, float xa, float xb, float weight,
              bool anti_alias, int& touched_min, int& touched_max) {
    xa = std::max(xa, 0.0f);
    xb = std::min(xb, static_cast<float>(width));
    if (!(xb > xa)) return;

    if (!anti_alias) {
        int first = static_cast<int>(std::ceil(xa - 0.5f));
        int last = static_cast<int>(std::ceil(xb - 0.5f));  // exclusive
        first = std::max(first, 0);
        last = std::min(last, width);
        for (int i = first; i < last; i++) acc[static_cast<size_t>(i)] += weight;
        if (first < last) {
            touched_min = std::min(touched_min, first);
            touched_max = std::max(touched_max, last);
        }
        return;
    }

    int ia = static_cast<int>(std::floor(xa));
    int ib = static_cast<int>(std::floor(xb));
    if (ia == ib) {
        acc[static_cast<size_t>(ia)] += (xb - xa) * weight;
    } else {
        acc[static_cast<size_t>(ia)] += (static_cast<float>(ia + 1) - xa) * weight;
        for (int i = ia + 1; i < ib; i++) acc[static_cast<size_t>(i)] += weight;
        if (ib < width) acc[static_cast<size_t>(ib)] += (xb - static_cast<float>(ib)) * weight;
    }
    touched_min = std::min(touched_min, ia);
    touched_max = std::max(touched_max, std::min(ib + 1, width));
}

} // namespace

float max_scale(const AffineTransform& transform) {
    float sx = std::sqrt(transform.a * transform.a + transform.c * transform.c);
    float sy = std::sqrt(transform.b * transform.b + transform.d * transform.d);
    float s = std::max(sx, sy);
    return (std::isfinite(s) && s > 0) ? s : 1.0f;
}

std::vector<Polyline> flatten_path(const path::Path& path, const AffineTransform& transform,
                                   float tolerance) {
    std::vector<Polyline> result;
    Polyline current;
    auto flush = [&]() {
        if (!current.points.empty()) result.push_back(std::move(current));
        current = Polyline{};
    };

    path::for_each_segment(path, [&](const PathSegment& seg) {
        switch (seg.verb) {
            case PathVerb::Move:
                flush();
                current.points.push_back(transform.apply(seg.pts[0]));
                break;
            case PathVerb::Line:
                current.points.push_back(transform.apply(seg.pts[1]));
                break;
            case PathVerb::Quad:
                flatten_quad(transform.apply(seg.pts[0]), transform.apply(seg.pts[1]),
                             transform.apply(seg.pts[2]), tolerance, current.points);
                break;
            case PathVerb::Cubic:
                flatten_cubic(transform.apply(seg.pts[0]), transform.apply(seg.pts[1]),
                              transform.apply(seg.pts[2]), transform.apply(seg.pts[3]),
                              tolerance, current.points);
                break;
            case PathVerb::Close:
                current.closed = true;
                flush();
                break;
        }
    });
    flush();
    return result;
}

void rasterize_path(const path::Path& path, const AffineTransform& transform, FillRule rule,
                    bool anti_alias, int width, int height, const CoverageRowFn& fn) {
    if (width <= 0 || height <= 0) return;

    std::vector<Polyline> polylines = flatten_path(path, transform, core::config::kCurveTolerance);

    std::vector<Edge> edges;
    float min_y = 0, max_y = 0;
    bool have_bounds = false;
    for (const auto& poly : polylines) {
        size_t n = poly.points.size();
        if (n < 2) continue;
        // Filling closes every subpath implicitly
        for (size_t i = 0; i < n; i++) {
            Point a = poly.points[i];
            Point b = poly.points[(i + 1) % n];
            if (!a.is_finite() || !b.is_finite() || a.y == b.y) continue;
            Edge e;
            if (a.y < b.y) {
                e = {a.x, a.y, b.x, b.y, 0, 1};
            } else {
                e = {b.x, b.y, a.x, a.y, 0, -1};
            }
            e.dxdy = (e.x1 - e.x0) / (e.y1 - e.y0);
            edges.push_back(e);
            if (!have_bounds) {
                min_y = e.y0;
                max_y = e.y1;
                have_bounds = true;
            } else {
                min_y = std::min(min_y, e.y0);
                max_y = std::max(max_y, e.y1);
            }
        }
    }
    if (edges.empty()) return;

    std::sort(edges.begin(), edges.end(),
              [](const Edge& lhs, const Edge& rhs) { return lhs.y0 < rhs.y0; });

    const float rows = static_cast<float>(height);
    int row_begin = static_cast<int>(std::floor(std::clamp(min_y, 0.0f, rows)));
    int row_end = static_cast<int>(std::ceil(std::clamp(max_y, 0.0f, rows)));
    if (row_begin >= row_end) return;

    const int samples = anti_alias ? core::config::kSupersample : 1;
    const float weight = 1.0f / static_cast<float>(samples);

    std::vector<float> acc(static_cast<size_t>(width) + 1, 0.0f);
    std::vector<const Edge*> active;
    std::vector<Crossing> crossings;
    size_t next_edge = 0;

    for (int y = row_begin; y < row_end; y++) {
        int touched_min = width;
        int touched_max = 0;

        for (int s = 0; s < samples; s++) {
            float sy = anti_alias
                ? static_cast<float>(y) + (static_cast<float>(s) + 0.5f) * weight
                : static_cast<float>(y) + 0.5f;

            while (next_edge < edges.size() && edges[next_edge].y0 <= sy) {
                active.push_back(&edges[next_edge]);
                next_edge++;
            }
            active.erase(std::remove_if(active.begin(), active.end(),
                                        [sy](const Edge* e) { return e->y1 <= sy; }),
                         active.end());

            crossings.clear();
            for (const Edge* e : active) {
                if (sy < e->y0) continue;
                crossings.push_back({e->x0 + (sy - e->y0) * e->dxdy, e->dir});
            }
            if (crossings.size() < 2) continue;
            std::sort(crossings.begin(), crossings.end(),
                      [](const Crossing& lhs, const Crossing& rhs) { return lhs.x < rhs.x; });

            int winding = 0;
            for (size_t i = 0; i + 1 < crossings.size(); i++) {
                winding += crossings[i].dir;
                bool inside = (rule == FillRule::Winding) ? (winding != 0) : ((winding & 1) != 0);
                if (inside) {
                    add_span(acc, width, crossings[i].x, crossings[i + 1].x, weight,
                             anti_alias, touched_min, touched_max);
                }
            }
        }

        if (touched_min < touched_max) {
            for (int x = touched_min; x < touched_max; x++) {
                float& v = acc[static_cast<size_t>(x)];
                v = std::min(v, 1.0f);
            }
            fn(y, touched_min, touched_max, acc.data() + touched_min);
            std::fill(acc.begin() + touched_min, acc.begin() + touched_max, 0.0f);
        }
    }
}

} // namespace easel::raster
