#pragma once

#include <array>
#include <vector>
#include "common_defines.h"

namespace catface {

// Sideways nudge of the overlay per degree of head yaw, in canvas pixels.
constexpr float kDefaultYawOffsetFactor = 0.5f;
// Sprite size relative to the detected face box.
constexpr float kDefaultSpriteScale = 1.6f;

struct OverlayGeometryParams {
    float yaw_offset_factor{ kDefaultYawOffsetFactor };
    float sprite_scale{ kDefaultSpriteScale };
};

// Uniform letterboxing scale from source to canvas, or 0 when the context is degenerate.
float ComputeLetterboxScale(const FrameContext& ctx);

// Maps detections in source pixels to canvas-space draw instructions, one per
// detection and in the same order. Returns an empty list when any frame or
// canvas dimension is not positive. Pure: no state, no I/O.
std::vector<DrawInstruction> ComputeDrawInstructions(const std::vector<Detection>& detections,
                                                     const FrameContext& ctx,
                                                     float sprite_opacity = 1.0f,
                                                     const OverlayGeometryParams& params = OverlayGeometryParams());

// Corners of a rectangle rotated about its center: top-left, top-right,
// bottom-right, bottom-left before rotation.
std::array<Point2D, 4> ComputeCorners(const Point2D& center, float half_width, float half_height,
                                      float rotation_radians);

} // namespace catface
