#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <opencv2/core.hpp>
#include "common_defines.h"
#include "face_detector.h"

namespace catface {

// Runs at most one detection at a time off the main loop. Frames that arrive
// while a detection is in flight are dropped. A finished detection replaces the
// latest result in one swap during Poll(), so readers never see a partial list.
// All methods are called from the main loop.
// The worker is detached and shares ownership of everything it touches, so a
// detector that never returns leaks its thread but never a dangling object.
class DetectionPipeline {
public:
    explicit DetectionPipeline(std::shared_ptr<FaceDetector> detector);
    ~DetectionPipeline();

    DetectionPipeline(const DetectionPipeline&) = delete;
    DetectionPipeline& operator=(const DetectionPipeline&) = delete;

    // Starts a detection on a copy of the frame. Returns false if busy.
    bool Submit(const cv::Mat& frame);
    // Swaps in a finished result. Returns true when the latest result changed.
    bool Poll();
    // Blocks until the pending detection finishes or the timeout expires.
    bool WaitForPending(std::chrono::milliseconds timeout);
    // Forgets any pending result. The detector keeps the slot until it returns.
    void Cancel();

    bool IsBusy() const { return pending_ != nullptr || in_flight_->load(std::memory_order_acquire); }
    const DetectionResult& GetLatest() const { return latest_; }
    uint64_t GetDroppedFrameCount() const { return dropped_frames_; }
    uint64_t GetCompletedCount() const { return latest_.sequence; }
    uint64_t GetFailureCount() const { return failures_; }

private:
    struct Pending {
        std::future<std::vector<Detection>> future;
        int frame_width{ 0 };
        int frame_height{ 0 };
    };

    std::shared_ptr<FaceDetector> detector_;
    // Shared with the worker, which clears it after publishing its result
    std::shared_ptr<std::atomic<bool>> in_flight_;
    std::unique_ptr<Pending> pending_;
    DetectionResult latest_;
    uint64_t dropped_frames_{ 0 };
    uint64_t failures_{ 0 };
};

} // namespace catface
