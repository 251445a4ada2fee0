#include "camera_source.h"
#include <iostream>

namespace catface {

CameraSource::CameraSource(const CameraConfig& config)
    : config_(config), width_(config.frame_width), height_(config.frame_height) {}

CameraSource::~CameraSource() {
    Close();
}

bool CameraSource::Open() {
    // Force V4L2 backend instead of GStreamer
    if (!cap_.open(config_.index, cv::CAP_V4L2)) {
        std::cerr << "Error: Could not open camera " << config_.index << " with V4L2 backend." << std::endl;
        return false;
    }

    std::cout << "Using backend: " << cap_.getBackendName() << std::endl;
    std::cout << "=== Camera Capabilities ===" << std::endl;
    std::cout << "Default resolution: " << cap_.get(cv::CAP_PROP_FRAME_WIDTH) << "x"
              << cap_.get(cv::CAP_PROP_FRAME_HEIGHT) << std::endl;
    std::cout << "Default FPS: " << cap_.get(cv::CAP_PROP_FPS) << std::endl;

    // Size first, the driver may reject the rest otherwise
    bool width_set = cap_.set(cv::CAP_PROP_FRAME_WIDTH, config_.frame_width);
    bool height_set = cap_.set(cv::CAP_PROP_FRAME_HEIGHT, config_.frame_height);
    bool fps_set = cap_.set(cv::CAP_PROP_FPS, config_.fps);
    bool buffer_set = cap_.set(cv::CAP_PROP_BUFFERSIZE, 3);
    bool fourcc_set = cap_.set(cv::CAP_PROP_FOURCC, cv::VideoWriter::fourcc('Y', 'U', 'Y', 'V'));

    std::cout << "=== Property Setting Results ===" << std::endl;
    std::cout << "Width set: " << (width_set ? "SUCCESS" : "FAILED") << std::endl;
    std::cout << "Height set: " << (height_set ? "SUCCESS" : "FAILED") << std::endl;
    std::cout << "FPS set: " << (fps_set ? "SUCCESS" : "FAILED") << std::endl;
    std::cout << "Buffer set: " << (buffer_set ? "SUCCESS" : "FAILED") << std::endl;
    std::cout << "FOURCC set: " << (fourcc_set ? "SUCCESS" : "FAILED") << std::endl;

    // A camera that ignores the requested size still works, frames report their own size
    width_ = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH));
    height_ = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
    std::cout << "=== Final Camera Properties ===" << std::endl;
    std::cout << "Actual resolution: " << width_ << "x" << height_ << std::endl;
    std::cout << "Actual FPS: " << cap_.get(cv::CAP_PROP_FPS) << std::endl;

    if (width_ <= 0 || height_ <= 0) {
        std::cerr << "Error: Camera " << config_.index << " reports no usable resolution." << std::endl;
        cap_.release();
        return false;
    }
    return true;
}

bool CameraSource::Read(cv::Mat& frame_out) {
    if (!cap_.isOpened()) {
        std::cerr << "Error: Camera is not opened." << std::endl;
        return false;
    }
    if (!cap_.read(frame_out) || frame_out.empty()) {
        std::cerr << "Error: Could not read frame from camera." << std::endl;
        return false;
    }
    return true;
}

void CameraSource::Close() {
    if (cap_.isOpened()) {
        cap_.release();
    }
}

} // namespace catface
