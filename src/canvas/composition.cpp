#include <easel/canvas/composition.h>

namespace easel::canvas {

using paint::BlendMode;

// Both switches list every enumerator and have no default so that a new
// style fails the build (-Werror=switch) until it is mapped.
BlendMode to_blend_mode(CompositionStyle style) {
    switch (style) {
        case CompositionStyle::SrcIn:    return BlendMode::SourceIn;
        case CompositionStyle::SrcOut:   return BlendMode::SourceOut;
        case CompositionStyle::SrcOver:  return BlendMode::SourceOver;
        case CompositionStyle::SrcAtop:  return BlendMode::SourceAtop;
        case CompositionStyle::DestIn:   return BlendMode::DestinationIn;
        case CompositionStyle::DestOut:  return BlendMode::DestinationOut;
        case CompositionStyle::DestOver: return BlendMode::DestinationOver;
        case CompositionStyle::DestAtop: return BlendMode::DestinationAtop;
        case CompositionStyle::Copy:     return BlendMode::Source;
        case CompositionStyle::Lighter:  return BlendMode::Plus;
        case CompositionStyle::Xor:      return BlendMode::Xor;
        case CompositionStyle::Clear:    return BlendMode::Clear;
    }
    return BlendMode::SourceOver;
}

BlendMode to_blend_mode(BlendingStyle style) {
    switch (style) {
        case BlendingStyle::Multiply:   return BlendMode::Multiply;
        case BlendingStyle::Screen:     return BlendMode::Screen;
        case BlendingStyle::Overlay:    return BlendMode::Overlay;
        case BlendingStyle::Darken:     return BlendMode::Darken;
        case BlendingStyle::Lighten:    return BlendMode::Lighten;
        case BlendingStyle::ColorDodge: return BlendMode::ColorDodge;
        case BlendingStyle::ColorBurn:  return BlendMode::ColorBurn;
        case BlendingStyle::HardLight:  return BlendMode::HardLight;
        case BlendingStyle::SoftLight:  return BlendMode::SoftLight;
        case BlendingStyle::Difference: return BlendMode::Difference;
        case BlendingStyle::Exclusion:  return BlendMode::Exclusion;
        case BlendingStyle::Hue:        return BlendMode::Hue;
        case BlendingStyle::Saturation: return BlendMode::Saturation;
        case BlendingStyle::Color:      return BlendMode::Color;
        case BlendingStyle::Luminosity: return BlendMode::Luminosity;
    }
    return BlendMode::SourceOver;
}

BlendMode to_blend_mode(const CompositionOrBlending& op) {
    return std::visit([](auto style) { return to_blend_mode(style); }, op);
}

} // namespace easel::canvas
