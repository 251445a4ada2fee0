#include "face_manager.h"
#include <algorithm>

namespace catface {

FaceManager::FaceManager(const FaceManagerConfig& config)
    : face_detection_(config.detection_config) {
    if (config.enable_landmarks) {
        face_landmarks_ = std::make_unique<FaceLandmarks>(config.landmarks_config);
    }
}

std::vector<Detection> FaceManager::Detect(const cv::Mat& frame_bgr) {
    CATFACE_ASSERT(!frame_bgr.empty(), "FaceManager received an empty frame.");
    cv::cvtColor(frame_bgr, frame_rgb_, cv::COLOR_BGR2RGB);

    if (!face_detection_.Run(frame_rgb_, detections_)) {
        throw std::runtime_error("Face detection inference failed");
    }
    detections_.erase(std::remove_if(detections_.begin(), detections_.end(),
                                     [](const Detection& detection) { return !detection.bounding_box.IsValid(); }),
                      detections_.end());

    // A face the mesh rejects keeps the detector's own angle estimates
    if (face_landmarks_) {
        for (auto& detection : detections_) {
            if (!face_landmarks_->Run(frame_rgb_, detection)) {
                ++unrefined_faces_;
            }
        }
    }
    return detections_;
}

} // namespace catface
