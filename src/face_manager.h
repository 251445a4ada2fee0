#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include "face_detector.h"
#include "face_detection.h"
#include "face_landmarks.h"

namespace catface {

// TFLite backed detector: BlazeFace boxes, optionally refined by the face mesh.
class FaceManager : public FaceDetector {
public:
    explicit FaceManager(const FaceManagerConfig& config);
    std::vector<Detection> Detect(const cv::Mat& frame_bgr) override;

    // Faces the mesh rejected, which kept the detector's angle estimates
    uint64_t GetUnrefinedFaceCount() const { return unrefined_faces_.load(); }

private:
    FaceDetection face_detection_; // Face detection instance
    std::unique_ptr<FaceLandmarks> face_landmarks_; // Null when refinement is disabled
    cv::Mat frame_rgb_;
    std::vector<Detection> detections_;
    std::atomic<uint64_t> unrefined_faces_{ 0 };
};

} // namespace catface
