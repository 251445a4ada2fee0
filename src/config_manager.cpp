#include "config_manager.h"
#include <fstream>
#include <filesystem>

namespace catface {

void ConfigManager::LoadFromFile(const std::string& config_path, CatFaceConfig& config) {
    CATFACE_ASSERT(std::filesystem::exists(config_path), "Configuration file does not exist: " + config_path);
    CATFACE_ASSERT(std::filesystem::is_regular_file(config_path), "Configuration path is not a file: " + config_path);
    std::ifstream file(config_path);
    CATFACE_ASSERT(file.is_open(), "Failed to open configuration file: " + config_path);

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse configuration file " + config_path + ": " + e.what());
    }

    const auto base_dir = std::filesystem::path(config_path).parent_path().string();
    LoadFromJson(json, base_dir, config);
}

void ConfigManager::LoadFromJson(const nlohmann::json& json, const std::string& base_dir, CatFaceConfig& config) {
    // Parse camera config
    CATFACE_ASSERT(json.contains("camera"), "Missing 'camera' section in configuration file.");
    ParseCameraConfig(json["camera"], config.camera);

    // Parse detection config
    CATFACE_ASSERT(json.contains("face_detection"), "Missing 'face_detection' section in configuration file.");
    ParseDetectionConfig(json["face_detection"], config.face_manager.detection_config);
    config.face_manager.detection_config.model_path =
        ResolvePath(config.face_manager.detection_config.model_path, base_dir);
    config.face_manager.detection_config.frame_width = config.camera.frame_width;
    config.face_manager.detection_config.frame_height = config.camera.frame_height;

    // Parse landmarks config
    CATFACE_ASSERT(json.contains("face_landmarks"), "Missing 'face_landmarks' section in configuration file.");
    ParseLandmarksConfig(json["face_landmarks"], config.face_manager.landmarks_config);
    config.face_manager.landmarks_config.model_path =
        ResolvePath(config.face_manager.landmarks_config.model_path, base_dir);

    // Manager flags are all optional
    if (json.contains("face_manager")) {
        const auto& manager_json = json["face_manager"];
        if (manager_json.contains("enable_landmarks")) {
            config.face_manager.enable_landmarks = manager_json["enable_landmarks"].get<bool>();
        }
        if (manager_json.contains("enable_performance_stats")) {
            config.face_manager.enable_performance_stats = manager_json["enable_performance_stats"].get<bool>();
        }
    }

    CATFACE_ASSERT(json.contains("overlay"), "Missing 'overlay' section in configuration file.");
    ParseOverlayConfig(json["overlay"], config.overlay);
    if (!config.overlay.sprite_path.empty()) {
        config.overlay.sprite_path = ResolvePath(config.overlay.sprite_path, base_dir);
    }

    if (json.contains("animation")) {
        ParseAnimationConfig(json["animation"], config.animation);
    }
}

void ConfigManager::ParseCameraConfig(const nlohmann::json& json, CameraConfig& config) {
    CATFACE_ASSERT(json.contains("index"), "Missing 'index' in camera section.");
    CATFACE_ASSERT(json.contains("frame_width"), "Missing 'frame_width' in camera section.");
    CATFACE_ASSERT(json.contains("frame_height"), "Missing 'frame_height' in camera section.");

    config.index = json["index"].get<int>();
    config.frame_width = json["frame_width"].get<int>();
    config.frame_height = json["frame_height"].get<int>();
    CATFACE_ASSERT(config.frame_width > 0 && config.frame_height > 0, "Invalid frame dimensions in camera section.");

    if (json.contains("fps")) {
        config.fps = json["fps"].get<int>();
    }
    if (json.contains("front_facing")) {
        config.front_facing = json["front_facing"].get<bool>();
    }
}

void ConfigManager::ParseAnchorConfig(const nlohmann::json& json, AnchorConfig& config) {
    CATFACE_ASSERT(json.contains("min_scale"), "Missing 'min_scale' in anchor configuration.");
    CATFACE_ASSERT(json.contains("max_scale"), "Missing 'max_scale' in anchor configuration.");
    CATFACE_ASSERT(json.contains("input_size"), "Missing 'input_size' in anchor configuration.");
    CATFACE_ASSERT(json.contains("anchor_offset"), "Missing 'anchor_offset' in anchor configuration.");
    CATFACE_ASSERT(json.contains("strides"), "Missing 'strides' in anchor configuration.");

    config.min_scale = json["min_scale"].get<float>();
    config.max_scale = json["max_scale"].get<float>();
    config.input_size = json["input_size"].get<float>();
    config.anchor_offset = json["anchor_offset"].get<float>();
    config.strides = json["strides"].get<std::vector<int>>();
    CATFACE_ASSERT(!config.strides.empty(), "Anchor 'strides' must not be empty.");
}

void ConfigManager::ParseDetectionConfig(const nlohmann::json& json, FaceDetectionConfig& config) {
    CATFACE_ASSERT(json.contains("model_path"), "Missing 'model_path' in face detection configuration.");
    CATFACE_ASSERT(json.contains("min_score_threshold"), "Missing 'min_score_threshold' in face detection configuration.");
    CATFACE_ASSERT(json.contains("min_suppression_threshold"), "Missing 'min_suppression_threshold' in face detection configuration.");
    CATFACE_ASSERT(json.contains("anchor_config"), "Missing 'anchor_config' in face detection configuration.");

    config.model_path = json["model_path"].get<std::string>();
    config.min_score_threshold = json["min_score_threshold"].get<float>();
    config.min_suppression_threshold = json["min_suppression_threshold"].get<float>();
    if (json.contains("max_faces")) {
        config.max_faces = json["max_faces"].get<int>();
        CATFACE_ASSERT(config.max_faces > 0, "'max_faces' must be positive.");
    }

    ParseAnchorConfig(json["anchor_config"], config.anchor_config);
}

void ConfigManager::ParseLandmarksConfig(const nlohmann::json& json, FaceLandmarksConfig& config) {
    CATFACE_ASSERT(json.contains("model_path"), "Missing 'model_path' in face landmarks configuration.");
    CATFACE_ASSERT(json.contains("min_score_threshold"), "Missing 'min_score_threshold' in face landmarks configuration.");

    config.model_path = json["model_path"].get<std::string>();
    config.min_score_threshold = json["min_score_threshold"].get<float>();
    if (json.contains("right_eye_index_for_rotation")) {
        config.right_eye_index_for_rotation = json["right_eye_index_for_rotation"].get<int>();
    }
    if (json.contains("left_eye_index_for_rotation")) {
        config.left_eye_index_for_rotation = json["left_eye_index_for_rotation"].get<int>();
    }
}

void ConfigManager::ParseOverlayConfig(const nlohmann::json& json, OverlayConfig& config) {
    CATFACE_ASSERT(json.contains("canvas_width"), "Missing 'canvas_width' in overlay section.");
    CATFACE_ASSERT(json.contains("canvas_height"), "Missing 'canvas_height' in overlay section.");

    config.canvas_width = json["canvas_width"].get<int>();
    config.canvas_height = json["canvas_height"].get<int>();
    CATFACE_ASSERT(config.canvas_width > 0 && config.canvas_height > 0, "Invalid canvas dimensions in overlay section.");

    if (json.contains("sprite_path")) {
        config.sprite_path = json["sprite_path"].get<std::string>();
    }
    if (json.contains("yaw_offset_factor")) {
        config.geometry.yaw_offset_factor = json["yaw_offset_factor"].get<float>();
    }
    if (json.contains("sprite_scale")) {
        config.geometry.sprite_scale = json["sprite_scale"].get<float>();
        CATFACE_ASSERT(config.geometry.sprite_scale > 0.0f, "'sprite_scale' must be positive.");
    }
}

void ConfigManager::ParseAnimationConfig(const nlohmann::json& json, AnimationConfig& config) {
    if (json.contains("ripple_duration_ms")) {
        config.ripple_duration = std::chrono::milliseconds(json["ripple_duration_ms"].get<int>());
        CATFACE_ASSERT(config.ripple_duration.count() > 0, "'ripple_duration_ms' must be positive.");
    }
    if (json.contains("ripple_max_radius")) {
        config.ripple_max_radius = json["ripple_max_radius"].get<float>();
    }
    if (json.contains("fade_out_delay_ms")) {
        config.fade_out_delay = std::chrono::milliseconds(json["fade_out_delay_ms"].get<int>());
    }
    if (json.contains("fade_in_delay_ms")) {
        config.fade_in_delay = std::chrono::milliseconds(json["fade_in_delay_ms"].get<int>());
    }
    CATFACE_ASSERT(config.fade_out_delay.count() >= 0 && config.fade_in_delay.count() >= 0,
                   "Fade delays must not be negative.");
}

std::string ConfigManager::ResolvePath(const std::string& path, const std::string& base_dir) {
    const std::filesystem::path candidate(path);
    if (candidate.is_absolute() || base_dir.empty()) {
        return path;
    }
    return (std::filesystem::path(base_dir) / candidate).lexically_normal().string();
}

} // namespace catface
