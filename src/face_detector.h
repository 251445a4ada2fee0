#pragma once

#include <vector>
#include <opencv2/core.hpp>
#include "common_defines.h"

namespace catface {

// Finds faces in one BGR frame. Detections are in frame pixels. May throw; the
// caller treats a failed call as a frame without faces.
class FaceDetector {
public:
    virtual ~FaceDetector() = default;
    virtual std::vector<Detection> Detect(const cv::Mat& frame_bgr) = 0;
};

} // namespace catface
