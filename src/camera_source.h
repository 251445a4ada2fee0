#pragma once

#include <opencv2/opencv.hpp>
#include "config_manager.h"

namespace catface {

// Anything that hands out BGR frames on demand.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual bool Open() = 0;
    virtual bool Read(cv::Mat& frame_out) = 0;
    virtual void Close() = 0;
    virtual bool IsOpened() const = 0;

    virtual int GetWidth() const = 0;
    virtual int GetHeight() const = 0;
    virtual bool IsFrontFacing() const = 0;
};

class CameraSource : public FrameSource {
public:
    explicit CameraSource(const CameraConfig& config);
    ~CameraSource() override;

    bool Open() override;
    bool Read(cv::Mat& frame_out) override;
    void Close() override;
    bool IsOpened() const override { return cap_.isOpened(); }

    int GetWidth() const override { return width_; }
    int GetHeight() const override { return height_; }
    bool IsFrontFacing() const override { return config_.front_facing; }

private:
    cv::VideoCapture cap_;
    CameraConfig config_;
    int width_{ 0 };
    int height_{ 0 };
};

} // namespace catface
