#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#define CATFACE_ASSERT(condition, message) \
    if (!(condition)) { \
        throw std::runtime_error("Assertion failed: " + std::string(message)); \
    }

namespace catface {

constexpr float kPi = 3.14159265358979323846f;
constexpr float DEG2RAD = kPi / 180.0f;
constexpr float RAD2DEG = 180.0f / kPi;

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

enum FaceDetectionIdx
{
    X = 0,
    Y,
    WIDTH,
    HEIGHT,
    R_EYE_X,
    R_EYE_Y,
    L_EYE_X,
    L_EYE_Y,
    NOSE_X,
    NOSE_Y,
    MOUTH_X,
    MOUTH_Y,
    R_EAR_X,
    R_EAR_Y,
    L_EAR_X,
    L_EAR_Y,
    FACE_DETECTION_COUNT
};

struct Point2D {
    float x; // X coordinate
    float y; // Y coordinate

    Point2D(float x = 0.0f, float y = 0.0f) : x(x), y(y) {}
};

struct Point3D {
    float x;
    float y;
    float z; // Depth relative to the face center, same scale as x

    Point3D(float x = 0.0f, float y = 0.0f, float z = 0.0f) : x(x), y(y), z(z) {}
};

// Axis-aligned box in source image pixels.
struct BoundingBox {
    float left{ 0.0f };
    float top{ 0.0f };
    float right{ 0.0f };
    float bottom{ 0.0f };

    BoundingBox() = default;
    BoundingBox(float left, float top, float right, float bottom)
        : left(left), top(top), right(right), bottom(bottom) {}

    float Width() const { return right - left; }
    float Height() const { return bottom - top; }
    Point2D Center() const { return { left + Width() * 0.5f, top + Height() * 0.5f }; }
    bool IsValid() const {
        return std::isfinite(left) && std::isfinite(top) && std::isfinite(right) && std::isfinite(bottom) &&
               right >= left && bottom >= top;
    }
};

// One face from a single frame. Yaw is positive when the nose moves toward the
// image's right, roll is positive for a counter-clockwise tilt in the image.
struct Detection {
    BoundingBox bounding_box;
    float head_yaw_degrees{ 0.0f };
    float head_roll_degrees{ 0.0f };
    float score{ 0.0f }; // Detector confidence, informational only
};

struct FrameContext {
    float source_width{ 0.0f };  // Camera frame width in pixels
    float source_height{ 0.0f }; // Camera frame height in pixels
    float canvas_width{ 0.0f };  // Drawing surface width in pixels
    float canvas_height{ 0.0f }; // Drawing surface height in pixels
    bool mirrored{ false };      // True when the active camera faces the user
};

struct DrawInstruction {
    Point2D center;                // Canvas space
    float rotation_radians{ 0.0f }; // Clockwise on a y-down canvas, about center
    float rect_half_width{ 0.0f };
    float rect_half_height{ 0.0f };
    float sprite_half_width{ 0.0f };
    float sprite_half_height{ 0.0f };
    float sprite_opacity{ 1.0f };  // [0, 1]
};

struct TapRipple {
    Point2D origin;                  // Canvas space point of the tap
    float elapsed_fraction{ 0.0f };  // [0, 1]
    float max_radius{ 50.0f };

    float Radius() const { return max_radius * elapsed_fraction; }
    float Opacity() const { return 1.0f - elapsed_fraction; }
};

// Latest completed detection, swapped as a unit by the detection pipeline.
struct DetectionResult {
    std::vector<Detection> detections;
    int frame_width{ 0 };
    int frame_height{ 0 };
    uint64_t sequence{ 0 }; // Number of completed detections so far
};

// Utility functions
inline Point2D ProjectPoint(const Point2D& point, const std::array<float, 6>& transform) {
    return { point.x * transform[0] + point.y * transform[1] + transform[2],
             point.x * transform[3] + point.y * transform[4] + transform[5] };
}
inline float Sigmoid(float x) { return 1.0f / (1.0f + std::exp(-x)); }
inline float SigmoidInv(float x) { return -1.0f * std::log(1.0f / x - 1.0f); }
inline float OverlapSimilarity(const float* box1, const float* box2) {
    // Intersection over union of two [x, y, w, h] boxes
    float x1 = std::max(box1[FaceDetectionIdx::X], box2[FaceDetectionIdx::X]);
    float y1 = std::max(box1[FaceDetectionIdx::Y], box2[FaceDetectionIdx::Y]);
    float x2 = std::min(box1[FaceDetectionIdx::X] + box1[FaceDetectionIdx::WIDTH], box2[FaceDetectionIdx::X] + box2[FaceDetectionIdx::WIDTH]);
    float y2 = std::min(box1[FaceDetectionIdx::Y] + box1[FaceDetectionIdx::HEIGHT], box2[FaceDetectionIdx::Y] + box2[FaceDetectionIdx::HEIGHT]);

    float intersection_area = std::max(0.0f, x2 - x1) * std::max(0.0f, y2 - y1);
    if (intersection_area == 0.0f) return 0.0f;

    float box1_area = box1[FaceDetectionIdx::WIDTH] * box1[FaceDetectionIdx::HEIGHT];
    float box2_area = box2[FaceDetectionIdx::WIDTH] * box2[FaceDetectionIdx::HEIGHT];
    float union_area = box1_area + box2_area - intersection_area;

    return intersection_area / union_area;
}
inline float NormalizeRadians(float angle) {
    // Normalize the angle to the range [-pi, pi]
    constexpr double two_pi = 2.0 * kPi;
    constexpr double two_pi_inv = 1.0 / two_pi;
    return static_cast<float>(angle - std::floor((angle + kPi) * two_pi_inv) * two_pi);
}
// Clockwise angle (radians, y-down image) that brings the segment p0 -> p1 level.
inline float CalcRotation(float x0, float y0, float x1, float y1, float target_angle = 0.0f) {
    float angle = target_angle - std::atan2(y0 - y1, x1 - x0);
    return NormalizeRadians(angle);
}

} // namespace catface
