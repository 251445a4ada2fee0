#pragma once

#include <vector>
#include <opencv2/opencv.hpp>
#include "tflite_model.h"
#include "common_defines.h"
#include "config_manager.h"

namespace catface {

// MediaPipe face mesh run on a rotated crop around one detection. Used to
// refine the head angles the detector only estimates from six keypoints.
class FaceLandmarks : public TfLiteModel {
public:
    explicit FaceLandmarks(const FaceLandmarksConfig& config);
    virtual ~FaceLandmarks() = default;

    // Returns false when inference fails or the face score is too low; the
    // detection is only modified on success.
    bool Run(const cv::Mat& image_in /* RGB */, Detection& detection_in_out);

    static float RollFromLandmarks(const Point3D& right_eye, const Point3D& left_eye);
    static float YawFromLandmarks(const Point3D& right_eye, const Point3D& left_eye);

private:
    struct CropRegion {
        Point2D center;
        float size{ 0.0f };     // Side of the square crop in frame pixels
        float rotation{ 0.0f }; // Clockwise radians
    };

    CropRegion RegionFromDetection(const Detection& detection) const;
    void PreprocessInput(const cv::Mat& image_in, const CropRegion& region);
    bool PostprocessOutput(const CropRegion& region, Detection& detection_in_out);
    void TensorsToLandmarks(const CropRegion& region);

    float tensor_scale_{ 1.0f }; // Scale factor for input tensor
    cv::Mat model_input_; // Input matrix for the model
    cv::Mat resized_input_; // Cropped input before normalization
    cv::Mat rotated_source_; // Crop corners in the frame
    cv::Mat rotated_destination_; // Crop corners in the model input
    std::vector<Point3D> landmarks_; // Detected landmarks
    FaceLandmarksConfig config_; // Configuration for face landmarks detection
};

} // namespace catface
