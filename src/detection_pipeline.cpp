#include "detection_pipeline.h"
#include <iostream>
#include <system_error>
#include <thread>

namespace catface {

DetectionPipeline::DetectionPipeline(std::shared_ptr<FaceDetector> detector)
    : detector_(std::move(detector)), in_flight_(std::make_shared<std::atomic<bool>>(false)) {
    CATFACE_ASSERT(detector_ != nullptr, "DetectionPipeline needs a detector.");
}

DetectionPipeline::~DetectionPipeline() {
    Cancel();
}

bool DetectionPipeline::Submit(const cv::Mat& frame) {
    if (frame.empty()) {
        std::cerr << "Warning: Empty frame not submitted for detection." << std::endl;
        return false;
    }

    // Unharvested results hold the slot as well, so nothing is overwritten
    bool expected = false;
    if (pending_ || !in_flight_->compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        ++dropped_frames_;
        return false;
    }

    auto promise = std::make_shared<std::promise<std::vector<Detection>>>();
    auto pending = std::make_unique<Pending>();
    pending->future = promise->get_future();
    pending->frame_width = frame.cols;
    pending->frame_height = frame.rows;

    // The camera may reuse its buffer for the next frame
    cv::Mat frame_copy = frame.clone();
    auto detector = detector_;
    auto in_flight = in_flight_;
    try {
        std::thread([detector, in_flight, promise, frame_copy]() {
            std::vector<Detection> detections;
            std::exception_ptr error;
            try {
                detections = detector->Detect(frame_copy);
            } catch (...) {
                error = std::current_exception();
            }
            // Free the slot before publishing so a ready future implies an idle detector
            in_flight->store(false, std::memory_order_release);
            if (error) {
                promise->set_exception(error);
            } else {
                promise->set_value(std::move(detections));
            }
        }).detach();
    } catch (const std::system_error& e) {
        in_flight_->store(false, std::memory_order_release);
        std::cerr << "Error: Could not start detection worker: " << e.what() << std::endl;
        return false;
    }

    pending_ = std::move(pending);
    return true;
}

bool DetectionPipeline::Poll() {
    if (!pending_ || pending_->future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return false;
    }

    DetectionResult result;
    result.frame_width = pending_->frame_width;
    result.frame_height = pending_->frame_height;
    try {
        result.detections = pending_->future.get();
    } catch (const std::exception& e) {
        // Only this frame is lost: it counts as a frame without faces
        ++failures_;
        std::cerr << "Detection error: " << e.what() << std::endl;
    } catch (...) {
        ++failures_;
        std::cerr << "Detection error: unknown exception from detector" << std::endl;
    }
    result.sequence = latest_.sequence + 1;

    pending_.reset();
    latest_ = std::move(result);
    return true;
}

bool DetectionPipeline::WaitForPending(std::chrono::milliseconds timeout) {
    if (!pending_) {
        return true;
    }
    return pending_->future.wait_for(timeout) == std::future_status::ready;
}

void DetectionPipeline::Cancel() {
    // Dropping the future discards the result; the worker still owns its promise
    pending_.reset();
}

} // namespace catface
