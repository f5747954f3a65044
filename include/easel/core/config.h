#ifndef EASEL_CORE_CONFIG_H
#define EASEL_CORE_CONFIG_H

#include <cstddef>
#include <cstdint>

namespace easel::core::config {

inline constexpr float kDefaultLineWidth = 1.0f;
inline constexpr float kDefaultMiterLimit = 4.0f;

// Largest sweep covered by a single quadratic when flattening arcs.
inline constexpr float kMaxArcSegmentAngle = 0.78539816339744830962f;  // pi/4

// Maximum distance, in device pixels, between a curve and its polyline.
inline constexpr float kCurveTolerance = 0.2f;
inline constexpr int kMaxCurveSubdivisions = 256;

// Vertical coverage samples per pixel row when anti-aliasing.
inline constexpr int kSupersample = 4;

// Number of polygon segments used per full turn for round joins and caps.
inline constexpr int kRoundSegmentsPerTurn = 32;

inline constexpr std::uint32_t kMaxPixmapDimension = 1u << 15;

// Diagnostics retained per emitter, and the tail of them copied into a
// failure trace.
inline constexpr std::size_t kMaxDiagnosticEvents = 1024;
inline constexpr std::size_t kFailureContextEvents = 8;
inline constexpr std::size_t kMaxFailureTraces = 64;

inline constexpr const char kProgramName[] = "easel_render";
inline constexpr const char kVersionString[] = "easel_render 0.1.0";

inline constexpr std::uint32_t kDefaultRenderWidth = 256;
inline constexpr std::uint32_t kDefaultRenderHeight = 256;

}  // namespace easel::core::config

#endif  // EASEL_CORE_CONFIG_H
