#include "face_detection.h"
#include <numeric>

namespace catface {

FaceDetection::FaceDetection(const FaceDetectionConfig& config)
    : TfLiteModel(config.model_path), config_(config) {

    CATFACE_ASSERT(config_.frame_width > 0 && config_.frame_height > 0,
                   "Invalid frame dimensions for FaceDetection.");
    CATFACE_ASSERT(config_.max_faces > 0, "FaceDetection needs max_faces > 0.");

    BuildAnchors(config_.anchor_config);

    // Compare raw logits against the inverse sigmoid instead of squashing every score
    config_.min_score_threshold = SigmoidInv(config_.min_score_threshold);

    CATFACE_ASSERT(GetInputTensorCount() == 1, "Expected exactly one input tensor for FaceDetection model.");
    CATFACE_ASSERT(GetInputTensorShape(0)->size == 4,
                   "Expected input tensor shape to be [1, height, width, channels].");
    CATFACE_ASSERT(GetOutputTensorCount() == 2, "Expected exactly two output tensors for FaceDetection model.");
    CATFACE_ASSERT(GetOutputTensorShape(0)->data[GetOutputTensorShape(0)->size - 1] == FaceDetectionIdx::FACE_DETECTION_COUNT,
                   "Expected 16 values per box in FaceDetection output.");

    input_rect_size_ = GetInputTensorShape(0)->data[1];
    tensor_scale_ = 1.0f / static_cast<float>(input_rect_size_);
    model_input_ = cv::Mat(input_rect_size_, input_rect_size_, CV_32FC3, GetInputTensorData(0));
    model_input_ = -1.0f;
    resized_input_ = cv::Mat(input_rect_size_, input_rect_size_, CV_8UC3);

    CATFACE_ASSERT(static_cast<int>(anchors_.size()) == GetOutputTensorShape(1)->data[1],
                   "SSD anchors size does not match the output tensor size.");
    sorted_scores_indices_.resize(anchors_.size());
    faces_.reserve(config_.max_faces);
    face_scores_.reserve(config_.max_faces);

    UpdateFrameGeometry(config_.frame_width, config_.frame_height);
}

void FaceDetection::BuildAnchors(const AnchorConfig& config)
{
    int anchor_size = 0;
    for (const auto& stride: config.strides){
        auto feature_map_size = static_cast<int>(std::ceil(config.input_size / stride));
        anchor_size += (feature_map_size * feature_map_size * 2);
    }
    anchors_.clear();
    anchors_.reserve(anchor_size);

    int layer_id = 0;
    const int strides_size = static_cast<int>(config.strides.size());
    while (layer_id < strides_size){
        int last_same_stride_layer = layer_id;
        int aspect_ratio_size = 0;
        // Layers sharing a stride contribute their anchors to the same grid cell
        while (last_same_stride_layer < strides_size &&
                config.strides[layer_id] == config.strides[last_same_stride_layer]){
            aspect_ratio_size += 2;
            last_same_stride_layer++;
        }

        const int stride = config.strides[layer_id];
        auto feature_map_size = static_cast<int>(std::ceil(config.input_size / stride));

        for (int y = 0; y < feature_map_size; ++y){
            for (int x = 0; x < feature_map_size; ++x){
                const float x_center = (x + config.anchor_offset) / feature_map_size;
                const float y_center = (y + config.anchor_offset) / feature_map_size;
                for (int anchor_id = 0; anchor_id < aspect_ratio_size; ++anchor_id){
                    anchors_.emplace_back(x_center, y_center);
                }
            }
        }
        layer_id = last_same_stride_layer;
    }
}

void FaceDetection::UpdateFrameGeometry(int frame_width, int frame_height) {
    frame_width_ = frame_width;
    frame_height_ = frame_height;

    // Letterbox the frame into the square input, keeping the aspect ratio
    const auto input_size = static_cast<float>(input_rect_size_);
    const float scale = input_size / static_cast<float>(std::max(frame_width, frame_height));
    const float pad_x = (input_size - frame_width * scale) * 0.5f;
    const float pad_y = (input_size - frame_height * scale) * 0.5f;

    letterbox_transform_ = (cv::Mat_<double>(2, 3) << scale, 0.0, pad_x, 0.0, scale, pad_y);

    const std::array<float, 6> projection_matrix{
        input_size / scale, 0.0f, -pad_x / scale,
        0.0f, input_size / scale, -pad_y / scale
    };
    projection_matrix_ = projection_matrix;
}

bool FaceDetection::Run(const cv::Mat& image_in, std::vector<Detection>& detections_out) {
    detections_out.clear();
    CATFACE_ASSERT(!image_in.empty() && image_in.type() == CV_8UC3, "FaceDetection expects a non-empty RGB frame.");

    if (image_in.cols != frame_width_ || image_in.rows != frame_height_) {
        UpdateFrameGeometry(image_in.cols, image_in.rows);
    }

    PreprocessInput(image_in);

    if (!Invoke()) {
        return false;
    }

    return PostprocessOutput(detections_out);
}

void FaceDetection::PreprocessInput(const cv::Mat& image_in) {
    // Padding becomes -1 after normalization, which is what the model saw in training
    cv::warpAffine(image_in, resized_input_, letterbox_transform_, model_input_.size(),
                   cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar::all(0));

    constexpr double scale_range_minus_one = 2.0 / 255.0; // [0, 255] to [-1, 1]
    resized_input_.convertTo(model_input_, CV_32FC3, scale_range_minus_one, -1.0);
}

bool FaceDetection::PostprocessOutput(std::vector<Detection>& detections_out) {
    float* output_boxes = GetOutputTensorData(0);
    float* output_scores = GetOutputTensorData(1);

    const int num_boxes = TensorsToDetections(output_boxes, output_scores);
    if (num_boxes == 0) {
        return true; // Inference ran, nobody in frame
    }

    WeightedNonMaxSuppression(output_boxes, output_scores, num_boxes);

    detections_out.reserve(faces_.size());
    for (size_t i = 0; i < faces_.size(); ++i) {
        detections_out.push_back(DetectionProjection(faces_[i], face_scores_[i]));
    }
    return true;
}

int FaceDetection::TensorsToDetections(float* boxes, float* scores) const {
    constexpr auto score_clipping_threshold = 100.0f;

    const auto tensor_scale = tensor_scale_;
    const auto score_threshold = config_.min_score_threshold;

    int num_boxes_passed = 0;
    const int num_boxes = static_cast<int>(anchors_.size());
    for (int i = 0; i < num_boxes; ++i) {
        auto score = scores[i];
        if (score < score_threshold)
            continue;

        const auto anchor = anchors_[i];
        const auto box_read = &boxes[i * FaceDetectionIdx::FACE_DETECTION_COUNT];
        const auto x_center = box_read[FaceDetectionIdx::X] * tensor_scale + anchor.x;
        const auto y_center = box_read[FaceDetectionIdx::Y] * tensor_scale + anchor.y;
        const auto width = box_read[FaceDetectionIdx::WIDTH] * tensor_scale;
        const auto height = box_read[FaceDetectionIdx::HEIGHT] * tensor_scale;

        if (width <= 0 || height <= 0)
            continue;

        // Compact passing boxes to the front of the buffer; i >= num_boxes_passed so reads stay ahead of writes
        auto box_write = &boxes[num_boxes_passed * FaceDetectionIdx::FACE_DETECTION_COUNT];
        for (int k = FaceDetectionIdx::R_EYE_X; k < FaceDetectionIdx::FACE_DETECTION_COUNT; k += 2) {
            box_write[k] = box_read[k] * tensor_scale + anchor.x;
            box_write[k + 1] = box_read[k + 1] * tensor_scale + anchor.y;
        }
        box_write[FaceDetectionIdx::X] = x_center - width / 2.0f;
        box_write[FaceDetectionIdx::Y] = y_center - height / 2.0f;
        box_write[FaceDetectionIdx::WIDTH] = width;
        box_write[FaceDetectionIdx::HEIGHT] = height;

        score = std::clamp(score, -score_clipping_threshold, score_clipping_threshold);
        scores[num_boxes_passed] = Sigmoid(score);

        num_boxes_passed++;
    }
    return num_boxes_passed;
}

void FaceDetection::WeightedNonMaxSuppression(const float* boxes, const float* scores, int num_boxes) {
    faces_.clear();
    face_scores_.clear();

    std::iota(sorted_scores_indices_.begin(), sorted_scores_indices_.begin() + num_boxes, 0);
    std::sort(sorted_scores_indices_.begin(), sorted_scores_indices_.begin() + num_boxes,
              [&scores](int a, int b) { return scores[a] > scores[b]; });

    // Each pass takes the best remaining box, averages everything overlapping it
    // and removes the whole cluster
    int remaining = num_boxes;
    while (remaining > 0 && static_cast<int>(faces_.size()) < config_.max_faces) {
        const auto best_box = &boxes[sorted_scores_indices_[0] * FaceDetectionIdx::FACE_DETECTION_COUNT];
        const float best_score = scores[sorted_scores_indices_[0]];

        float total_score = 0.0f;
        RawFace weighted_face{};
        int kept = 0;
        for (int i = 0; i < remaining; ++i) {
            const auto sorted_idx = sorted_scores_indices_[i];
            const auto candidate_box = &boxes[sorted_idx * FaceDetectionIdx::FACE_DETECTION_COUNT];
            if (i > 0 && OverlapSimilarity(best_box, candidate_box) <= config_.min_suppression_threshold) {
                sorted_scores_indices_[kept++] = sorted_idx;
                continue;
            }
            const auto candidate_score = scores[sorted_idx];
            total_score += candidate_score;
            weighted_face[FaceDetectionIdx::X] += candidate_box[FaceDetectionIdx::X] * candidate_score;
            weighted_face[FaceDetectionIdx::Y] += candidate_box[FaceDetectionIdx::Y] * candidate_score;
            weighted_face[FaceDetectionIdx::WIDTH] += (candidate_box[FaceDetectionIdx::X] + candidate_box[FaceDetectionIdx::WIDTH]) * candidate_score;
            weighted_face[FaceDetectionIdx::HEIGHT] += (candidate_box[FaceDetectionIdx::Y] + candidate_box[FaceDetectionIdx::HEIGHT]) * candidate_score;
            for (int k = FaceDetectionIdx::R_EYE_X; k < FaceDetectionIdx::FACE_DETECTION_COUNT; ++k) {
                weighted_face[k] += candidate_box[k] * candidate_score;
            }
        }
        remaining = kept;

        const auto scaled_score = 1.0f / total_score;
        RawFace face{};
        face[FaceDetectionIdx::X] = weighted_face[FaceDetectionIdx::X] * scaled_score;
        face[FaceDetectionIdx::Y] = weighted_face[FaceDetectionIdx::Y] * scaled_score;
        face[FaceDetectionIdx::WIDTH] = weighted_face[FaceDetectionIdx::WIDTH] * scaled_score - face[FaceDetectionIdx::X];
        face[FaceDetectionIdx::HEIGHT] = weighted_face[FaceDetectionIdx::HEIGHT] * scaled_score - face[FaceDetectionIdx::Y];
        for (int k = FaceDetectionIdx::R_EYE_X; k < FaceDetectionIdx::FACE_DETECTION_COUNT; ++k) {
            face[k] = weighted_face[k] * scaled_score;
        }
        faces_.push_back(face);
        face_scores_.push_back(best_score);
    }
}

Detection FaceDetection::DetectionProjection(RawFace& face, float score) const {
    // Keypoints to frame pixels, needed for the head angles
    for (int k = FaceDetectionIdx::R_EYE_X; k < FaceDetectionIdx::FACE_DETECTION_COUNT; k += 2) {
        const auto point = ProjectPoint({ face[k], face[k + 1] }, projection_matrix_);
        face[k] = point.x;
        face[k + 1] = point.y;
    }

    const auto left_top = ProjectPoint({ face[FaceDetectionIdx::X], face[FaceDetectionIdx::Y] }, projection_matrix_);
    const auto right_bottom = ProjectPoint(
        { face[FaceDetectionIdx::X] + face[FaceDetectionIdx::WIDTH], face[FaceDetectionIdx::Y] + face[FaceDetectionIdx::HEIGHT] },
        projection_matrix_);

    Detection detection;
    detection.bounding_box = BoundingBox(left_top.x, left_top.y, right_bottom.x, right_bottom.y);
    detection.head_roll_degrees = EstimateRollDegrees(face);
    detection.head_yaw_degrees = EstimateYawDegrees(face);
    detection.score = score;
    return detection;
}

float FaceDetection::EstimateRollDegrees(const RawFace& face) {
    const float dx = face[FaceDetectionIdx::L_EYE_X] - face[FaceDetectionIdx::R_EYE_X];
    const float dy = face[FaceDetectionIdx::L_EYE_Y] - face[FaceDetectionIdx::R_EYE_Y];
    if (std::hypot(dx, dy) < 1e-3f) {
        return 0.0f;
    }
    // CalcRotation is clockwise, roll is counter-clockwise
    const float rotation = CalcRotation(face[FaceDetectionIdx::R_EYE_X], face[FaceDetectionIdx::R_EYE_Y],
                                        face[FaceDetectionIdx::L_EYE_X], face[FaceDetectionIdx::L_EYE_Y]);
    return -rotation * RAD2DEG;
}

float FaceDetection::EstimateYawDegrees(const RawFace& face) {
    const float dx = face[FaceDetectionIdx::L_EYE_X] - face[FaceDetectionIdx::R_EYE_X];
    const float dy = face[FaceDetectionIdx::L_EYE_Y] - face[FaceDetectionIdx::R_EYE_Y];
    const float eye_distance = std::hypot(dx, dy);
    if (eye_distance < 1e-3f) {
        return 0.0f;
    }

    // Nose offset along the eye axis, relative to half the eye distance
    const float mid_x = (face[FaceDetectionIdx::L_EYE_X] + face[FaceDetectionIdx::R_EYE_X]) * 0.5f;
    const float mid_y = (face[FaceDetectionIdx::L_EYE_Y] + face[FaceDetectionIdx::R_EYE_Y]) * 0.5f;
    const float along = ((face[FaceDetectionIdx::NOSE_X] - mid_x) * dx + (face[FaceDetectionIdx::NOSE_Y] - mid_y) * dy) / eye_distance;
    const float ratio = std::clamp(along / (eye_distance * 0.5f), -1.0f, 1.0f);
    return std::asin(ratio) * RAD2DEG;
}

} // namespace catface
