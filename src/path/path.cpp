#include <easel/path/path.h>
#include <easel/path/path_builder.h>
#include <easel/core/error.h>
#include <algorithm>

namespace easel::path {

Path::Path(std::vector<PathVerb> verbs, std::vector<Point> points, Rect bounds)
    : verbs_(std::move(verbs)), points_(std::move(points)), bounds_(bounds) {}

Path Path::transform(const AffineTransform& transform) const {
    std::vector<Point> mapped;
    mapped.reserve(points_.size());
    float min_x = 0, min_y = 0, max_x = 0, max_y = 0;
    for (size_t i = 0; i < points_.size(); i++) {
        Point p = transform.apply(points_[i]);
        if (!p.is_finite()) {
            throw core::Error(core::ErrorKind::InvalidGeometry,
                              "path transform produced a non-finite point");
        }
        if (i == 0) {
            min_x = max_x = p.x;
            min_y = max_y = p.y;
        } else {
            min_x = std::min(min_x, p.x);
            max_x = std::max(max_x, p.x);
            min_y = std::min(min_y, p.y);
            max_y = std::max(max_y, p.y);
        }
        mapped.push_back(p);
    }
    return Path(verbs_, std::move(mapped), Rect::from_ltrb(min_x, min_y, max_x, max_y));
}

std::unique_ptr<GenericPathBuilder> Path::copy_to_builder() const {
    auto builder = std::make_unique<PathBuilder>();
    builder->push_path(*this);
    return builder;
}

std::unique_ptr<GenericPathBuilder> Path::transformed_copy_to_builder(
    const AffineTransform& transform) const {
    auto builder = std::make_unique<PathBuilder>();
    builder->push_path(this->transform(transform));
    return builder;
}

bool Path::contains_point(double x, double y, const AffineTransform& path_transform) const {
    Path mapped = transform(path_transform);
    Point target{static_cast<float>(x), static_cast<float>(y)};
    return std::find(mapped.points_.begin(), mapped.points_.end(), target) != mapped.points_.end();
}

Path Path::from_rect(const Rect& rect) {
    PathBuilder pb;
    pb.rect(rect);
    auto path = pb.finish();
    if (!path) {
        throw core::Error(core::ErrorKind::InvalidGeometry, "rect produced an empty path");
    }
    return std::move(*path);
}

} // namespace easel::path
