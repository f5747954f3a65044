#include <easel/canvas/composition.h>
#include <gtest/gtest.h>
#include <utility>
#include <vector>

using easel::canvas::BlendingStyle;
using easel::canvas::CompositionOrBlending;
using easel::canvas::CompositionStyle;
using easel::canvas::to_blend_mode;
using easel::paint::BlendMode;

// ------------------------------------------------------------------
// 1. Porter-Duff composition values
// ------------------------------------------------------------------

TEST(CompositionTest, CompositionStylesMapOneToOne) {
    const std::vector<std::pair<CompositionStyle, BlendMode>> cases = {
        {CompositionStyle::SrcIn, BlendMode::SourceIn},
        {CompositionStyle::SrcOut, BlendMode::SourceOut},
        {CompositionStyle::SrcOver, BlendMode::SourceOver},
        {CompositionStyle::SrcAtop, BlendMode::SourceAtop},
        {CompositionStyle::DestIn, BlendMode::DestinationIn},
        {CompositionStyle::DestOut, BlendMode::DestinationOut},
        {CompositionStyle::DestOver, BlendMode::DestinationOver},
        {CompositionStyle::DestAtop, BlendMode::DestinationAtop},
        {CompositionStyle::Xor, BlendMode::Xor},
        {CompositionStyle::Clear, BlendMode::Clear},
    };
    for (const auto& [style, mode] : cases) {
        EXPECT_EQ(to_blend_mode(style), mode);
    }
}

TEST(CompositionTest, CopyAndLighterUseRenamedModes) {
    EXPECT_EQ(to_blend_mode(CompositionStyle::Copy), BlendMode::Source);
    EXPECT_EQ(to_blend_mode(CompositionStyle::Lighter), BlendMode::Plus);
}

// ------------------------------------------------------------------
// 2. Blending values
// ------------------------------------------------------------------

TEST(CompositionTest, BlendingStylesMapOneToOne) {
    const std::vector<std::pair<BlendingStyle, BlendMode>> cases = {
        {BlendingStyle::Multiply, BlendMode::Multiply},
        {BlendingStyle::Screen, BlendMode::Screen},
        {BlendingStyle::Overlay, BlendMode::Overlay},
        {BlendingStyle::Darken, BlendMode::Darken},
        {BlendingStyle::Lighten, BlendMode::Lighten},
        {BlendingStyle::ColorDodge, BlendMode::ColorDodge},
        {BlendingStyle::ColorBurn, BlendMode::ColorBurn},
        {BlendingStyle::HardLight, BlendMode::HardLight},
        {BlendingStyle::SoftLight, BlendMode::SoftLight},
        {BlendingStyle::Difference, BlendMode::Difference},
        {BlendingStyle::Exclusion, BlendMode::Exclusion},
        {BlendingStyle::Hue, BlendMode::Hue},
        {BlendingStyle::Saturation, BlendMode::Saturation},
        {BlendingStyle::Color, BlendMode::Color},
        {BlendingStyle::Luminosity, BlendMode::Luminosity},
    };
    for (const auto& [style, mode] : cases) {
        EXPECT_EQ(to_blend_mode(style), mode);
    }
}

TEST(CompositionTest, VariantDispatchesToAlternative) {
    EXPECT_EQ(to_blend_mode(CompositionOrBlending{CompositionStyle::Copy}), BlendMode::Source);
    EXPECT_EQ(to_blend_mode(CompositionOrBlending{BlendingStyle::Screen}), BlendMode::Screen);
}
