#pragma once

#include <array>
#include <vector>
#include <opencv2/opencv.hpp>
#include "tflite_model.h"
#include "common_defines.h"
#include "config_manager.h"

namespace catface {

// BlazeFace short range detector. Reports up to max_faces axis-aligned boxes
// with head angles estimated from the six keypoints.
class FaceDetection : public TfLiteModel {
public:
    using RawFace = std::array<float, FaceDetectionIdx::FACE_DETECTION_COUNT>;

    explicit FaceDetection(const FaceDetectionConfig& config);
    virtual ~FaceDetection() = default;
    bool Run(const cv::Mat& image_in /* RGB */, std::vector<Detection>& detections_out);

    // Head angles from decoded keypoints in frame pixels.
    static float EstimateRollDegrees(const RawFace& face);
    static float EstimateYawDegrees(const RawFace& face);

private:
    void BuildAnchors(const AnchorConfig& config);
    void UpdateFrameGeometry(int frame_width, int frame_height);
    void PreprocessInput(const cv::Mat& image_in);
    bool PostprocessOutput(std::vector<Detection>& detections_out);
    int TensorsToDetections(float* boxes, float* scores) const;
    void WeightedNonMaxSuppression(const float* boxes, const float* scores, int num_boxes);
    Detection DetectionProjection(RawFace& face, float score) const;

    float tensor_scale_{ 1.0f }; // Scale factor for input tensor
    int input_rect_size_{ 0 }; // Side of the square model input
    int frame_width_{ 0 };
    int frame_height_{ 0 };
    cv::Mat model_input_; // Input matrix for the model
    cv::Mat resized_input_; // Letterboxed input before normalization
    cv::Mat letterbox_transform_; // Frame pixels to model input pixels
    std::array<float, 6> projection_matrix_; // Normalized model coordinates to frame pixels
    std::vector<int> sorted_scores_indices_; // Sorted indices of scores for non-max suppression
    std::vector<Point2D> anchors_; // SSD anchors parameters
    std::vector<RawFace> faces_; // Suppressed face clusters of the last run
    std::vector<float> face_scores_;
    FaceDetectionConfig config_; // Configuration for face detection
};

} // namespace catface
