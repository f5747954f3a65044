#pragma once
#include <easel/canvas/backend.h>
#include <easel/canvas/composition.h>
#include <easel/canvas/draw_target.h>
#include <easel/canvas/paint_state.h>
#include <easel/canvas/style.h>
#include <easel/core/diagnostics.h>
#include <easel/path/path_builder.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace easel::canvas {

// A 2D drawing context: one PaintState, a save/restore stack, a draw target
// and the current path. Path points are mapped through the transform that is
// current when they are added, so later transform changes leave the path
// where it was drawn.
//
// Calls that can fail return false (or nullopt). The failure is reported on
// the diagnostics emitter with Error severity and recorded as a FailureTrace;
// the paint state and clip stack are left as they were before the call.
class CanvasContext {
public:
    explicit CanvasContext(const IntSize& size,
                           std::shared_ptr<core::DiagnosticEmitter> diagnostics = nullptr);

    // State stack. restore() also pops the clips pushed since the matching
    // save(); it returns false when there is nothing to restore.
    void save();
    bool restore();
    size_t save_depth() const { return saved_states_.size(); }

    // Styles
    bool set_fill_style(const FillOrStrokeStyle& style);
    bool set_stroke_style(const FillOrStrokeStyle& style);
    void set_line_width(float width);
    void set_miter_limit(float limit);
    void set_line_join(paint::LineJoin join);
    void set_line_cap(paint::LineCap cap);
    void set_global_alpha(float alpha);
    void set_global_composition(const CompositionOrBlending& op);
    void set_shadow_color(const paint::RGBA& color);
    void set_shadow_offset_x(float value);
    void set_shadow_offset_y(float value);
    void set_shadow_blur(float value);
    void set_text_align(TextAlign align);
    void set_text_baseline(TextBaseline baseline);
    void set_image_smoothing_enabled(bool enabled);

    // Transforms, in canvas argument order (a, b, c, d, e, f)
    bool set_transform(float a, float b, float c, float d, float e, float f);
    bool transform(float a, float b, float c, float d, float e, float f);
    bool translate(float x, float y);
    bool scale(float x, float y);
    bool rotate(float angle);
    bool reset_transform();

    // Current path
    void begin_path();
    bool move_to(float x, float y);
    bool line_to(float x, float y);
    bool quadratic_curve_to(float cpx, float cpy, float x, float y);
    bool bezier_curve_to(float cp1x, float cp1y, float cp2x, float cp2y, float x, float y);
    bool arc(float x, float y, float radius, float start_angle, float end_angle,
             bool anticlockwise);
    bool ellipse(float x, float y, float radius_x, float radius_y, float rotation,
                 float start_angle, float end_angle, bool anticlockwise);
    bool rect(float x, float y, float width, float height);
    bool close_path();

    // Drawing
    bool fill();
    bool stroke();
    bool clip();
    bool is_point_in_path(double x, double y);
    bool fill_rect(float x, float y, float width, float height);
    bool stroke_rect(float x, float y, float width, float height);
    bool clear_rect(float x, float y, float width, float height);

    // Draws a whole image, or the (sx, sy, sw, sh) part of it, into the
    // (dx, dy, dw, dh) rect under the current transform.
    bool draw_image(const std::vector<uint8_t>& pixels, const IntSize& image_size,
                    float dx, float dy, float dw, float dh);
    bool draw_image(const std::vector<uint8_t>& pixels, const IntSize& image_size,
                    const IntRect& source, float dx, float dy, float dw, float dh);

    // Copies pixels verbatim, ignoring transform, alpha, composition and clip.
    bool put_image_data(const std::vector<uint8_t>& pixels, const IntSize& image_size,
                        int dx, int dy);
    // Pixels outside the canvas read as transparent black.
    std::optional<std::vector<uint8_t>> get_image_data(const IntRect& rect);

    // Back to the initial state: cleared pixels, default paint state, no
    // saved states, no clips, empty path.
    bool reset();

    const PaintState& state() const { return state_; }
    const GenericDrawTarget& draw_target() const { return *target_; }
    const Backend& backend() const { return backend_; }
    const core::FailureTraceCollector& failures() const { return failures_; }
    IntSize size() const { return target_->get_size(); }

private:
    struct SavedState {
        PaintState state;
        size_t clip_depth = 0;
    };

    template <typename Fn>
    bool guarded(const char* stage, Fn&& fn);

    // Current path in device space, or nullopt when nothing was recorded.
    std::optional<path::Path> current_path() const;
    // The current path mapped back into user space; nullopt when there is
    // no path or the transform is singular.
    std::optional<path::Path> current_user_path() const;
    Point to_device(float x, float y) const;
    void apply_transform(const AffineTransform& transform);
    void draw_shadow_if_needed();

    Backend backend_;
    std::unique_ptr<GenericDrawTarget> target_;
    PaintState state_;
    std::vector<SavedState> saved_states_;
    path::PathBuilder path_;
    bool image_smoothing_ = true;
    core::FailureTraceCollector failures_;
};

} // namespace easel::canvas
