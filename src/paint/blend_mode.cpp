#include <easel/paint/blend_mode.h>

namespace easel::paint {

const char* blend_mode_name(BlendMode mode) {
    switch (mode) {
        case BlendMode::Clear:           return "clear";
        case BlendMode::Source:          return "source";
        case BlendMode::Destination:     return "destination";
        case BlendMode::SourceOver:      return "source-over";
        case BlendMode::DestinationOver: return "destination-over";
        case BlendMode::SourceIn:        return "source-in";
        case BlendMode::DestinationIn:   return "destination-in";
        case BlendMode::SourceOut:       return "source-out";
        case BlendMode::DestinationOut:  return "destination-out";
        case BlendMode::SourceAtop:      return "source-atop";
        case BlendMode::DestinationAtop: return "destination-atop";
        case BlendMode::Xor:             return "xor";
        case BlendMode::Plus:            return "plus";
        case BlendMode::Modulate:        return "modulate";
        case BlendMode::Screen:          return "screen";
        case BlendMode::Overlay:         return "overlay";
        case BlendMode::Darken:          return "darken";
        case BlendMode::Lighten:         return "lighten";
        case BlendMode::ColorDodge:      return "color-dodge";
        case BlendMode::ColorBurn:       return "color-burn";
        case BlendMode::HardLight:       return "hard-light";
        case BlendMode::SoftLight:       return "soft-light";
        case BlendMode::Difference:      return "difference";
        case BlendMode::Exclusion:       return "exclusion";
        case BlendMode::Multiply:        return "multiply";
        case BlendMode::Hue:             return "hue";
        case BlendMode::Saturation:      return "saturation";
        case BlendMode::Color:           return "color";
        case BlendMode::Luminosity:      return "luminosity";
    }
    return "unknown";
}

} // namespace easel::paint
