#pragma once
#include <easel/core/config.h>

namespace easel::paint {

enum class LineJoin { Round, Bevel, Miter };
enum class LineCap { Butt, Round, Square };

struct StrokeOptions {
    float width = core::config::kDefaultLineWidth;
    float miter_limit = core::config::kDefaultMiterLimit;
    LineJoin line_join = LineJoin::Miter;
    LineCap line_cap = LineCap::Butt;

    void set_line_width(float value) { width = value; }
    void set_miter_limit(float value) { miter_limit = value; }
    void set_line_join(LineJoin value) { line_join = value; }
    void set_line_cap(LineCap value) { line_cap = value; }

    bool operator==(const StrokeOptions&) const = default;
};

} // namespace easel::paint
