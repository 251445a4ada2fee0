#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <string>
#include <vector>
#include "common_defines.h"
#include "overlay_geometry.h"

namespace catface {

struct AnchorConfig {
    float min_scale; // Minimum scale for anchors
    float max_scale; // Maximum scale for anchors
    float input_size; // Size of the input tensor
    float anchor_offset; // Offset for anchor center
    std::vector<int> strides; // Strides for feature maps
};

struct FaceDetectionConfig {
    std::string model_path; // Path to the face detection model
    int frame_width{ 0 };   // Width of the input frame
    int frame_height{ 0 };  // Height of the input frame
    float min_score_threshold{ 0.5f }; // Minimum score threshold for detection
    float min_suppression_threshold{ 0.3f }; // Minimum suppression threshold for non-max suppression
    int max_faces{ 4 }; // Upper bound on faces reported per frame
    AnchorConfig anchor_config; // Configuration for anchors
};

struct FaceLandmarksConfig {
    std::string model_path; // Path to the face landmarks model
    float min_score_threshold{ 0.5f }; // Minimum score threshold for landmarks detection
    int right_eye_index_for_rotation{ 33 }; // Index of the right eye landmark for rotation calculation
    int left_eye_index_for_rotation{ 263 }; // Index of the left eye landmark for rotation calculation
};

struct FaceManagerConfig {
    FaceDetectionConfig detection_config;
    FaceLandmarksConfig landmarks_config;
    bool enable_landmarks = true; // Refine head angles with the face mesh
    bool enable_performance_stats = true; // Enable performance statistics
};

struct CameraConfig {
    int index{ 0 };
    int frame_width{ 0 };
    int frame_height{ 0 };
    int fps{ 30 };
    bool front_facing{ true }; // Front cameras are mirrored on screen
};

struct OverlayConfig {
    int canvas_width{ 0 };
    int canvas_height{ 0 };
    std::string sprite_path; // Empty disables the sprite
    OverlayGeometryParams geometry;
};

struct AnimationConfig {
    std::chrono::milliseconds ripple_duration{ 500 };
    float ripple_max_radius{ 50.0f };
    std::chrono::milliseconds fade_out_delay{ 500 };  // Tap to sprite hidden
    std::chrono::milliseconds fade_in_delay{ 3000 };  // Sprite hidden to visible again
};

struct CatFaceConfig {
    CameraConfig camera;
    FaceManagerConfig face_manager;
    OverlayConfig overlay;
    AnimationConfig animation;
};

class ConfigManager {
public:
    static void LoadFromFile(const std::string& config_path, CatFaceConfig& config);
    // Relative paths inside the document resolve against base_dir.
    static void LoadFromJson(const nlohmann::json& json, const std::string& base_dir, CatFaceConfig& config);

private:
    static void ParseCameraConfig(const nlohmann::json& json, CameraConfig& config);
    static void ParseAnchorConfig(const nlohmann::json& json, AnchorConfig& config);
    static void ParseDetectionConfig(const nlohmann::json& json, FaceDetectionConfig& config);
    static void ParseLandmarksConfig(const nlohmann::json& json, FaceLandmarksConfig& config);
    static void ParseOverlayConfig(const nlohmann::json& json, OverlayConfig& config);
    static void ParseAnimationConfig(const nlohmann::json& json, AnimationConfig& config);
    static std::string ResolvePath(const std::string& path, const std::string& base_dir);
};

} // namespace catface
