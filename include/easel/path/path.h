#pragma once
#include <easel/geometry/geometry.h>
#include <easel/geometry/transform.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace easel::path {

using geometry::AffineTransform;
using geometry::Point;
using geometry::Rect;

class GenericPathBuilder;

enum class PathVerb : uint8_t {
    Move,   // 1 point
    Line,   // 1 point
    Quad,   // 2 points: control, end
    Cubic,  // 3 points: control 1, control 2, end
    Close,  // 0 points
};

// Immutable sequence of drawing commands in local path space. Only a
// PathBuilder (or transform()) can produce one, and every Path has finite
// points and at least one segment.
class Path {
public:
    const std::vector<PathVerb>& verbs() const { return verbs_; }
    const std::vector<Point>& points() const { return points_; }
    const Rect& bounds() const { return bounds_; }
    bool empty() const { return verbs_.empty(); }

    // Returns a new Path with every point mapped through `transform`.
    // Throws core::Error(InvalidGeometry) if any mapped point is not finite.
    Path transform(const AffineTransform& transform) const;

    std::unique_ptr<GenericPathBuilder> copy_to_builder() const;
    std::unique_ptr<GenericPathBuilder> transformed_copy_to_builder(
        const AffineTransform& transform) const;

    // Hit test against the path's vertices after applying `path_transform`.
    // This is vertex membership, not a filled-region test.
    bool contains_point(double x, double y, const AffineTransform& path_transform) const;

    static Path from_rect(const Rect& rect);

private:
    friend class PathBuilder;
    Path(std::vector<PathVerb> verbs, std::vector<Point> points, Rect bounds);

    std::vector<PathVerb> verbs_;
    std::vector<Point> points_;
    Rect bounds_;
};

// Calls `fn` once per segment with absolute points; Move and Close carry the
// subpath start point. Implicit closing lines are not reported.
struct PathSegment {
    PathVerb verb;
    Point pts[4];  // pts[0] is the segment's start point
};

template <typename Fn>
void for_each_segment(const Path& path, Fn&& fn) {
    const auto& pts = path.points();
    size_t pi = 0;
    Point last{};
    Point start{};
    for (PathVerb verb : path.verbs()) {
        PathSegment seg{verb, {last, {}, {}, {}}};
        switch (verb) {
            case PathVerb::Move:
                start = last = pts[pi++];
                seg.pts[0] = last;
                break;
            case PathVerb::Line:
                seg.pts[1] = pts[pi++];
                last = seg.pts[1];
                break;
            case PathVerb::Quad:
                seg.pts[1] = pts[pi];
                seg.pts[2] = pts[pi + 1];
                pi += 2;
                last = seg.pts[2];
                break;
            case PathVerb::Cubic:
                seg.pts[1] = pts[pi];
                seg.pts[2] = pts[pi + 1];
                seg.pts[3] = pts[pi + 2];
                pi += 3;
                last = seg.pts[3];
                break;
            case PathVerb::Close:
                seg.pts[1] = start;
                last = start;
                break;
        }
        fn(seg);
    }
}

} // namespace easel::path
