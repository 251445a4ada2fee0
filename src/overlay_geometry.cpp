#include "overlay_geometry.h"

namespace catface {

namespace {

bool IsPositive(float value) {
    return std::isfinite(value) && value > 0.0f;
}

} // namespace

float ComputeLetterboxScale(const FrameContext& ctx) {
    if (!IsPositive(ctx.source_width) || !IsPositive(ctx.source_height) ||
        !IsPositive(ctx.canvas_width) || !IsPositive(ctx.canvas_height)) {
        return 0.0f;
    }
    const float scale_x = ctx.canvas_width / ctx.source_width;
    const float scale_y = ctx.canvas_height / ctx.source_height;
    return std::min(scale_x, scale_y);
}

std::vector<DrawInstruction> ComputeDrawInstructions(const std::vector<Detection>& detections,
                                                     const FrameContext& ctx,
                                                     float sprite_opacity,
                                                     const OverlayGeometryParams& params) {
    std::vector<DrawInstruction> instructions;
    const float scale = ComputeLetterboxScale(ctx);
    if (scale <= 0.0f) {
        return instructions;
    }

    const float opacity = std::isfinite(sprite_opacity) ? std::clamp(sprite_opacity, 0.0f, 1.0f) : 0.0f;
    instructions.reserve(detections.size());

    for (const auto& detection : detections) {
        const auto& box = detection.bounding_box;
        const float left = box.left * scale;
        const float top = box.top * scale;
        const float right = box.right * scale;
        const float bottom = box.bottom * scale;
        const float half_width = (right - left) * 0.5f;
        const float half_height = (bottom - top) * 0.5f;

        // Front camera preview is mirrored, so the yaw nudge is inverted
        const float horizontal_offset = ctx.mirrored
            ? -detection.head_yaw_degrees * params.yaw_offset_factor
            : detection.head_yaw_degrees * params.yaw_offset_factor;

        DrawInstruction instruction;
        instruction.center = Point2D(left + half_width + horizontal_offset, top + half_height);
        // Canvas rotation runs opposite to the detector's roll sign
        instruction.rotation_radians = -detection.head_roll_degrees * DEG2RAD;
        instruction.rect_half_width = half_width;
        instruction.rect_half_height = half_height;
        instruction.sprite_half_width = half_width * params.sprite_scale;
        instruction.sprite_half_height = half_height * params.sprite_scale;
        instruction.sprite_opacity = opacity;
        instructions.push_back(instruction);
    }
    return instructions;
}

std::array<Point2D, 4> ComputeCorners(const Point2D& center, float half_width, float half_height,
                                      float rotation_radians) {
    const float cos_angle = std::cos(rotation_radians);
    const float sin_angle = std::sin(rotation_radians);
    const std::array<Point2D, 4> local{
        Point2D(-half_width, -half_height),
        Point2D(half_width, -half_height),
        Point2D(half_width, half_height),
        Point2D(-half_width, half_height) };

    std::array<Point2D, 4> corners;
    for (size_t i = 0; i < local.size(); ++i) {
        corners[i].x = center.x + local[i].x * cos_angle - local[i].y * sin_angle;
        corners[i].y = center.y + local[i].x * sin_angle + local[i].y * cos_angle;
    }
    return corners;
}

} // namespace catface
