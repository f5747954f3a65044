#include <easel/path/path_builder.h>
#include <easel/core/config.h>
#include <easel/core/error.h>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>

namespace easel::path {

namespace {

constexpr float kTwoPi = 2.0f * std::numbers::pi_v<float>;

// Positive representative of an angle, in [0, 2*pi).
float positive_angle(float radians) {
    float a = std::fmod(radians, kTwoPi);
    if (a < 0) a += kTwoPi;
    return a;
}

Point ellipse_point(Point center, float rx, float ry, float cos_r, float sin_r,
                    float angle) {
    float lx = rx * std::cos(angle);
    float ly = ry * std::sin(angle);
    return {center.x + lx * cos_r - ly * sin_r, center.y + lx * sin_r + ly * cos_r};
}

} // namespace

ArcSweep compute_arc_sweep(float start_angle, float end_angle, bool anticlockwise) {
    float start = start_angle;
    float end = end_angle;

    // Wrap angles mod 2*pi when the range carries redundant full turns
    if ((!anticlockwise && start > end + kTwoPi) ||
        (anticlockwise && end > start + kTwoPi)) {
        start = positive_angle(start);
        end = positive_angle(end);
    }

    float sweep;
    if (anticlockwise) {
        if (end - start == kTwoPi) {
            sweep = -kTwoPi;
        } else if (end > start) {
            sweep = -(kTwoPi - (end - start));
        } else {
            sweep = -(start - end);
        }
    } else {
        if (start - end == kTwoPi) {
            sweep = kTwoPi;
        } else if (start > end) {
            sweep = kTwoPi - (start - end);
        } else {
            sweep = end - start;
        }
    }
    return {start, sweep};
}

void PathBuilder::ensure_not_finished(const char* operation) const {
    if (finished_) {
        throw core::Error(core::ErrorKind::BuilderFinished,
                          std::string(operation) + " called on a finished path builder");
    }
}

void PathBuilder::inject_move_to_if_needed(Point fallback) {
    if (!move_to_required_) return;
    // After close() the next subpath starts where the closed one started
    if (!points_.empty()) {
        Point start = points_[last_move_to_index_];
        move_to(start);
    } else {
        move_to(fallback);
    }
}

void PathBuilder::move_to(Point point) {
    ensure_not_finished("move_to");
    if (!verbs_.empty() && verbs_.back() == PathVerb::Move) {
        // Consecutive moves collapse into the last one
        points_.back() = point;
    } else {
        last_move_to_index_ = points_.size();
        verbs_.push_back(PathVerb::Move);
        points_.push_back(point);
    }
    move_to_required_ = false;
}

void PathBuilder::line_to(Point point) {
    ensure_not_finished("line_to");
    // With no subpath yet, line_to only establishes the starting point
    if (move_to_required_ && points_.empty()) {
        move_to(point);
        return;
    }
    inject_move_to_if_needed(point);
    verbs_.push_back(PathVerb::Line);
    points_.push_back(point);
}

void PathBuilder::quadratic_curve_to(Point control_point, Point end_point) {
    ensure_not_finished("quadratic_curve_to");
    inject_move_to_if_needed(control_point);
    verbs_.push_back(PathVerb::Quad);
    points_.push_back(control_point);
    points_.push_back(end_point);
}

void PathBuilder::bezier_curve_to(Point control_point1, Point control_point2,
                                  Point control_point3) {
    ensure_not_finished("bezier_curve_to");
    inject_move_to_if_needed(control_point1);
    verbs_.push_back(PathVerb::Cubic);
    points_.push_back(control_point1);
    points_.push_back(control_point2);
    points_.push_back(control_point3);
}

void PathBuilder::close() {
    ensure_not_finished("close");
    if (!verbs_.empty() && verbs_.back() != PathVerb::Close) {
        verbs_.push_back(PathVerb::Close);
    }
    move_to_required_ = true;
}

void PathBuilder::rect(const Rect& rect) {
    ensure_not_finished("rect");
    move_to({rect.left(), rect.top()});
    line_to({rect.right(), rect.top()});
    line_to({rect.right(), rect.bottom()});
    line_to({rect.left(), rect.bottom()});
    close();
}

void PathBuilder::arc(Point origin, float radius, float start_angle, float end_angle,
                      bool anticlockwise) {
    ellipse(origin, radius, radius, 0.0f, start_angle, end_angle, anticlockwise);
}

void PathBuilder::ellipse(Point origin, float radius_x, float radius_y, float rotation_angle,
                          float start_angle, float end_angle, bool anticlockwise) {
    ensure_not_finished("ellipse");
    ArcSweep arc = compute_arc_sweep(start_angle, end_angle, anticlockwise);

    float cos_r = std::cos(rotation_angle);
    float sin_r = std::sin(rotation_angle);

    line_to(ellipse_point(origin, radius_x, radius_y, cos_r, sin_r, arc.start));

    float total = std::min(std::abs(arc.sweep), kTwoPi);
    if (!(total > 0)) return;
    // The small bias keeps an exact multiple of the segment angle from
    // rounding up to an extra segment
    int steps = std::max(1, static_cast<int>(std::ceil(total / core::config::kMaxArcSegmentAngle - 1e-4f)));
    float step = (arc.sweep < 0 ? -total : total) / static_cast<float>(steps);
    float half = step * 0.5f;
    float ctrl_scale = 1.0f / std::cos(half);

    for (int i = 0; i < steps; i++) {
        float a0 = arc.start + step * static_cast<float>(i);
        float a1 = arc.start + step * static_cast<float>(i + 1);
        float mid = a0 + half;
        // Tangents at a0 and a1 meet on the mid-angle ray, 1/cos(half) out
        float lx = radius_x * std::cos(mid) * ctrl_scale;
        float ly = radius_y * std::sin(mid) * ctrl_scale;
        Point ctrl{origin.x + lx * cos_r - ly * sin_r, origin.y + lx * sin_r + ly * cos_r};
        quadratic_curve_to(ctrl, ellipse_point(origin, radius_x, radius_y, cos_r, sin_r, a1));
    }
}

std::optional<Point> PathBuilder::get_current_point() const {
    ensure_not_finished("get_current_point");
    if (points_.empty()) return std::nullopt;
    return points_.back();
}

void PathBuilder::push_path(const Path& path) {
    ensure_not_finished("push_path");
    for_each_segment(path, [&](const PathSegment& seg) {
        switch (seg.verb) {
            case PathVerb::Move:
                move_to(seg.pts[0]);
                break;
            case PathVerb::Line:
                line_to(seg.pts[1]);
                break;
            case PathVerb::Quad:
                quadratic_curve_to(seg.pts[1], seg.pts[2]);
                break;
            case PathVerb::Cubic:
                bezier_curve_to(seg.pts[1], seg.pts[2], seg.pts[3]);
                break;
            case PathVerb::Close:
                close();
                break;
        }
    });
}

std::optional<Path> PathBuilder::finish() {
    ensure_not_finished("finish");
    finished_ = true;

    std::vector<PathVerb> verbs = std::move(verbs_);
    std::vector<Point> points = std::move(points_);

    // A trailing move starts nothing
    if (!verbs.empty() && verbs.back() == PathVerb::Move) {
        verbs.pop_back();
        points.pop_back();
    }
    if (verbs.size() < 2 || points.empty()) return std::nullopt;

    float min_x = points[0].x, max_x = points[0].x;
    float min_y = points[0].y, max_y = points[0].y;
    for (const auto& p : points) {
        if (!p.is_finite()) return std::nullopt;
        min_x = std::min(min_x, p.x);
        max_x = std::max(max_x, p.x);
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }
    Rect bounds = Rect::from_ltrb(min_x, min_y, max_x, max_y);
    return Path(std::move(verbs), std::move(points), bounds);
}

} // namespace easel::path
