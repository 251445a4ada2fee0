#pragma once

#include <string>
#include <opencv2/core.hpp>

namespace catface {

// The overlay image, decoded once and kept as BGRA.
class SpriteAsset {
public:
    // A missing or undecodable file leaves the sprite empty and returns false.
    bool Load(const std::string& path);
    void Release() { image_.release(); }

    bool IsLoaded() const { return !image_.empty(); }
    const cv::Mat& GetImage() const { return image_; }

private:
    cv::Mat image_; // CV_8UC4
};

} // namespace catface
