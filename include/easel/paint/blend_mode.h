#pragma once
#include <cstdint>

namespace easel::paint {

// Pixel combination rules understood by the raster layer.
enum class BlendMode : uint8_t {
    Clear,
    Source,
    Destination,
    SourceOver,
    DestinationOver,
    SourceIn,
    DestinationIn,
    SourceOut,
    DestinationOut,
    SourceAtop,
    DestinationAtop,
    Xor,
    Plus,
    Modulate,
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
    Multiply,
    Hue,
    Saturation,
    Color,
    Luminosity,
};

const char* blend_mode_name(BlendMode mode);

} // namespace easel::paint
