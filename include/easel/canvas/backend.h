#pragma once
#include <easel/canvas/composition.h>
#include <easel/canvas/draw_target.h>
#include <easel/canvas/paint_state.h>
#include <easel/canvas/style.h>
#include <easel/core/diagnostics.h>
#include <memory>

namespace easel::canvas {

// Builds a Paint from style input. Gradient and pattern transforms are set
// to `transform` (the draw target's transform), so the paint maps straight
// to device space. Throws core::Error for invalid gradients or surfaces.
paint::Paint create_paint(const FillOrStrokeStyle& style, const AffineTransform& transform);

// Translates canvas-level values into draw target representations and
// creates draw targets. Every target it creates reports through the same
// diagnostics emitter.
class Backend {
public:
    explicit Backend(std::shared_ptr<core::DiagnosticEmitter> diagnostics = nullptr);

    paint::BlendMode get_composition_op(const DrawOptions& options) const;
    bool need_to_draw_shadow(const paint::Color& color) const;
    void set_shadow_color(const paint::RGBA& color, PaintState& state) const;
    void set_fill_style(const FillOrStrokeStyle& style, PaintState& state,
                        const GenericDrawTarget& target) const;
    void set_stroke_style(const FillOrStrokeStyle& style, PaintState& state,
                          const GenericDrawTarget& target) const;
    void set_global_composition(const CompositionOrBlending& op, PaintState& state) const;
    std::unique_ptr<GenericDrawTarget> create_draw_target(const IntSize& size) const;
    PaintState recreate_paint_state(const PaintState& state) const;

    const std::shared_ptr<core::DiagnosticEmitter>& diagnostics() const { return diagnostics_; }

private:
    void set_style(const FillOrStrokeStyle& style, PaintState& state,
                   paint::Paint PaintState::*member, const GenericDrawTarget& target) const;

    std::shared_ptr<core::DiagnosticEmitter> diagnostics_;
};

} // namespace easel::canvas
