#pragma once
#include <easel/paint/blend_mode.h>
#include <variant>

namespace easel::canvas {

// Porter-Duff values of globalCompositeOperation.
enum class CompositionStyle {
    SrcIn,
    SrcOut,
    SrcOver,
    SrcAtop,
    DestIn,
    DestOut,
    DestOver,
    DestAtop,
    Copy,
    Lighter,
    Xor,
    Clear,
};

// Separable and non-separable blend values of globalCompositeOperation.
enum class BlendingStyle {
    Multiply,
    Screen,
    Overlay,
    Darken,
    Lighten,
    ColorDodge,
    ColorBurn,
    HardLight,
    SoftLight,
    Difference,
    Exclusion,
    Hue,
    Saturation,
    Color,
    Luminosity,
};

using CompositionOrBlending = std::variant<CompositionStyle, BlendingStyle>;

paint::BlendMode to_blend_mode(CompositionStyle style);
paint::BlendMode to_blend_mode(BlendingStyle style);
paint::BlendMode to_blend_mode(const CompositionOrBlending& op);

} // namespace easel::canvas
