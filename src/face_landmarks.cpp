#include "face_landmarks.h"

namespace catface {

FaceLandmarks::FaceLandmarks(const FaceLandmarksConfig& config)
    : TfLiteModel(config.model_path), config_(config) {

    // Compare raw logits against the inverse sigmoid instead of squashing the score
    config_.min_score_threshold = SigmoidInv(config_.min_score_threshold);

    CATFACE_ASSERT(GetInputTensorCount() == 1, "Expected exactly one input tensor for FaceLandmarks model.");
    CATFACE_ASSERT(GetInputTensorShape(0)->size == 4,
                   "Expected input tensor shape to be [1, height, width, channels].");
    CATFACE_ASSERT(GetOutputTensorCount() == 2, "Expected exactly two output tensors for FaceLandmarks model.");

    auto input_rect_size = GetInputTensorShape(0)->data[1];
    auto input_rect_size_float = static_cast<float>(input_rect_size);
    tensor_scale_ = 1.0f / input_rect_size_float;
    model_input_ = cv::Mat(input_rect_size, input_rect_size, CV_32FC3, GetInputTensorData(0));

    // Same corner order as cv::boxPoints: bottom-left, top-left, top-right, bottom-right
    std::array<float, 8> destination_corners = {
        0.0f,                   input_rect_size_float,
        0.0f,                   0.0f,
        input_rect_size_float,  0.0f,
        input_rect_size_float,  input_rect_size_float
    };
    rotated_source_ = cv::Mat(4, 2, CV_32F);
    rotated_destination_ = cv::Mat(4, 2, CV_32F);
    std::copy(destination_corners.begin(), destination_corners.end(), rotated_destination_.ptr<float>());

    resized_input_ = cv::Mat(input_rect_size, input_rect_size, CV_8UC3);

    const auto output_shape = GetOutputTensorShape(0);
    const int num_landmarks = output_shape->data[output_shape->size - 1] / 3;
    CATFACE_ASSERT(num_landmarks > std::max(config_.right_eye_index_for_rotation, config_.left_eye_index_for_rotation),
                   "Eye landmark indices exceed the FaceLandmarks model output.");
    landmarks_.resize(num_landmarks);
}

bool FaceLandmarks::Run(const cv::Mat& image_in, Detection& detection_in_out) {
    const auto region = RegionFromDetection(detection_in_out);
    if (region.size <= 0.0f) {
        return false;
    }

    PreprocessInput(image_in, region);

    if (!Invoke()) {
        return false;
    }

    return PostprocessOutput(region, detection_in_out);
}

FaceLandmarks::CropRegion FaceLandmarks::RegionFromDetection(const Detection& detection) const {
    // The mesh model expects a square crop with margin around the face
    constexpr float box_scale_size = 1.5f;

    CropRegion region;
    region.center = detection.bounding_box.Center();
    region.size = std::max(detection.bounding_box.Width(), detection.bounding_box.Height()) * box_scale_size;
    region.rotation = -detection.head_roll_degrees * DEG2RAD;
    return region;
}

void FaceLandmarks::PreprocessInput(const cv::Mat& image_in, const CropRegion& region) {
    const cv::RotatedRect rotated_rect(
        cv::Point2f(region.center.x, region.center.y),
        cv::Size2f(region.size, region.size),
        region.rotation * RAD2DEG);
    cv::boxPoints(rotated_rect, rotated_source_);
    cv::warpPerspective(image_in, resized_input_, cv::getPerspectiveTransform(
        rotated_source_, rotated_destination_), model_input_.size());

    constexpr double scale_range_zero = 1.0 / 255.0; // [0, 255] to [0, 1]
    resized_input_.convertTo(model_input_, CV_32FC3, scale_range_zero, 0.0);
}

bool FaceLandmarks::PostprocessOutput(const CropRegion& region, Detection& detection_in_out) {
    const float raw_score = GetOutputTensorData(1)[0];
    if (raw_score < config_.min_score_threshold) {
        return false;
    }

    TensorsToLandmarks(region);

    const auto& right_eye = landmarks_[config_.right_eye_index_for_rotation];
    const auto& left_eye = landmarks_[config_.left_eye_index_for_rotation];
    detection_in_out.head_roll_degrees = RollFromLandmarks(right_eye, left_eye);
    detection_in_out.head_yaw_degrees = YawFromLandmarks(right_eye, left_eye);
    return true;
}

void FaceLandmarks::TensorsToLandmarks(const CropRegion& region) {
    // Crop-normalized landmarks back to frame pixels
    const auto raw_landmarks = reinterpret_cast<const Point3D*>(GetOutputTensorData(0));
    const auto sin_angle = std::sin(region.rotation);
    const auto cos_angle = std::cos(region.rotation);
    const auto z_scale = region.size * tensor_scale_;
    for (size_t i = 0; i < landmarks_.size(); ++i) {
        const auto x = raw_landmarks[i].x * tensor_scale_ - 0.5f;
        const auto y = raw_landmarks[i].y * tensor_scale_ - 0.5f;

        Point3D landmark;
        landmark.x = (x * cos_angle - y * sin_angle) * region.size + region.center.x;
        landmark.y = (x * sin_angle + y * cos_angle) * region.size + region.center.y;
        landmark.z = raw_landmarks[i].z * z_scale;
        landmarks_[i] = landmark;
    }
}

float FaceLandmarks::RollFromLandmarks(const Point3D& right_eye, const Point3D& left_eye) {
    return -CalcRotation(right_eye.x, right_eye.y, left_eye.x, left_eye.y) * RAD2DEG;
}

float FaceLandmarks::YawFromLandmarks(const Point3D& right_eye, const Point3D& left_eye) {
    // The eye corner turning away from the camera gains depth
    const float planar = std::hypot(left_eye.x - right_eye.x, left_eye.y - right_eye.y);
    return std::atan2(left_eye.z - right_eye.z, planar) * RAD2DEG;
}

} // namespace catface
