#pragma once
#include <easel/path/path.h>
#include <functional>
#include <vector>

namespace easel::raster {

using geometry::AffineTransform;
using geometry::Point;

enum class FillRule { Winding, EvenOdd };

// A flattened subpath in device space.
struct Polyline {
    std::vector<Point> points;
    bool closed = false;
};

// Maps every point through `transform` and replaces curves by line segments
// that stay within `tolerance` of the true curve.
std::vector<Polyline> flatten_path(const path::Path& path, const AffineTransform& transform,
                                   float tolerance);

// Receives one pixel row of coverage values in [0, 1] for x in
// [x_begin, x_end). Only rows with some coverage are reported.
using CoverageRowFn = std::function<void(int y, int x_begin, int x_end, const float* coverage)>;

// Scan converts a path into per-pixel coverage inside a width x height
// device area. Anti-aliased rasterization uses exact horizontal coverage and
// core::config::kSupersample vertical samples per row; aliased
// rasterization samples pixel centers.
void rasterize_path(const path::Path& path, const AffineTransform& transform, FillRule rule,
                    bool anti_alias, int width, int height, const CoverageRowFn& fn);

// Largest scale factor the transform applies to any direction; used to pick
// a flattening tolerance in path space.
float max_scale(const AffineTransform& transform);

} // namespace easel::raster
