#pragma once
#include <easel/paint/stroke_options.h>
#include <easel/path/path.h>
#include <optional>

namespace easel::raster {

// Outlines `path` with the given stroke geometry. The result is a set of
// consistently wound polygons (segment bodies, joins, caps) whose union under
// the non-zero rule is the stroked area. `resolution_scale` is the largest
// device scale the outline will be drawn at; it controls curve and round
// join tessellation. Returns nullopt when nothing would be visible.
std::optional<path::Path> stroke_to_path(const path::Path& path,
                                         const paint::StrokeOptions& stroke,
                                         float resolution_scale);

} // namespace easel::raster
