#include "sprite_asset.h"
#include <filesystem>
#include <iostream>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace catface {

bool SpriteAsset::Load(const std::string& path) {
    image_.release();
    if (path.empty() || !std::filesystem::is_regular_file(path)) {
        std::cerr << "Warning: Sprite image not found: " << path << ", drawing without sprite" << std::endl;
        return false;
    }

    cv::Mat decoded = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (decoded.empty() || decoded.depth() != CV_8U) {
        std::cerr << "Warning: Could not decode sprite image " << path << ", drawing without sprite" << std::endl;
        return false;
    }

    switch (decoded.channels()) {
    case 4:
        image_ = decoded;
        break;
    case 3:
        cv::cvtColor(decoded, image_, cv::COLOR_BGR2BGRA);
        break;
    case 1:
        cv::cvtColor(decoded, image_, cv::COLOR_GRAY2BGRA);
        break;
    default:
        std::cerr << "Warning: Unsupported channel count " << decoded.channels() << " in sprite " << path << std::endl;
        return false;
    }

    std::cout << "Sprite loaded from " << path << " (" << image_.cols << "x" << image_.rows << ")" << std::endl;
    return true;
}

} // namespace catface
