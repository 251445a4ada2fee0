#include "overlay_session.h"
#include <cmath>
#include <iostream>
#include <opencv2/core.hpp>

namespace catface {

SessionConfig SessionConfig::FromConfig(const CatFaceConfig& config) {
    SessionConfig session_config;
    session_config.canvas_width = config.overlay.canvas_width;
    session_config.canvas_height = config.overlay.canvas_height;
    session_config.sprite_path = config.overlay.sprite_path;
    session_config.geometry = config.overlay.geometry;
    session_config.animation = config.animation;
    return session_config;
}

OverlaySession::OverlaySession(const SessionConfig& config, std::unique_ptr<FrameSource> frame_source,
                               std::shared_ptr<FaceDetector> detector)
    : config_(config),
      frame_source_(std::move(frame_source)),
      pipeline_(std::move(detector)),
      animator_(config.animation),
      renderer_(config.style) {
    CATFACE_ASSERT(frame_source_ != nullptr, "OverlaySession needs a frame source.");
    CATFACE_ASSERT(config_.canvas_width > 0 && config_.canvas_height > 0, "Invalid canvas dimensions for OverlaySession.");
}

OverlaySession::~OverlaySession() {
    Stop();
}

bool OverlaySession::Start() {
    if (state_ == State::kRunning) {
        return true;
    }
    if (state_ == State::kFailed) {
        return false; // Acquisition failures are not retried
    }

    if (!frame_source_->Open()) {
        std::cerr << "Error: No usable camera, overlay session cannot start." << std::endl;
        state_ = State::kFailed;
        return false;
    }
    mirrored_ = frame_source_->IsFrontFacing();

    // Without a sprite only the outline boxes are drawn
    if (config_.sprite_path.empty() || !sprite_.Load(config_.sprite_path)) {
        std::cout << "Sprite disabled, drawing outlines only" << std::endl;
    }

    animator_.Reset();
    state_ = State::kRunning;
    std::cout << "Overlay session started (" << frame_source_->GetWidth() << "x" << frame_source_->GetHeight()
              << (mirrored_ ? ", mirrored" : "") << ")" << std::endl;
    return true;
}

bool OverlaySession::Update(TimePoint now) {
    if (state_ != State::kRunning) {
        return false;
    }

    // Pick up a finished detection first so this frame can take the free slot
    if (pipeline_.Poll()) {
        TakeLatestDetections();
    }

    bool frame_read = frame_source_->Read(raw_frame_);
    if (frame_read) {
        if (mirrored_) {
            cv::flip(raw_frame_, frame_, 1);
        } else {
            frame_ = raw_frame_;
        }
        pipeline_.Submit(frame_);
    }

    animator_.Tick(now);
    return frame_read;
}

void OverlaySession::OnTap(const Point2D& point, TimePoint now) {
    if (state_ != State::kRunning) {
        return;
    }
    animator_.OnTap(point, now);
}

const cv::Mat& OverlaySession::Render() {
    switch (state_) {
    case State::kRunning: {
        const auto ripple = animator_.IsRippleRunning() ? animator_.GetRipple() : std::nullopt;
        renderer_.Draw(frame_, GetFrameContext(), GetDrawInstructions(), ripple, sprite_, canvas_);
        break;
    }
    case State::kFailed:
        renderer_.DrawMessage(config_.canvas_width, config_.canvas_height, "Camera unavailable", canvas_);
        break;
    case State::kIdle:
    case State::kStopped:
        renderer_.DrawMessage(config_.canvas_width, config_.canvas_height, "", canvas_);
        break;
    }
    return canvas_;
}

void OverlaySession::Stop() {
    if (state_ != State::kRunning) {
        return;
    }

    // Let a running detection finish before the camera goes away, then drop its result
    if (!pipeline_.WaitForPending(config_.shutdown_timeout)) {
        std::cerr << "Warning: Detector still busy at shutdown, abandoning its result" << std::endl;
    }
    pipeline_.Cancel();
    detections_.clear();
    animator_.Reset();
    frame_source_->Close();
    sprite_.Release();
    raw_frame_.release();
    frame_.release();
    state_ = State::kStopped;
    std::cout << "Overlay session stopped" << std::endl;
}

void OverlaySession::TakeLatestDetections() {
    detections_.clear();
    for (auto detection : pipeline_.GetLatest().detections) {
        // Boxes with non-finite or inverted edges cannot be drawn
        if (!detection.bounding_box.IsValid() || !std::isfinite(detection.head_yaw_degrees) ||
            !std::isfinite(detection.head_roll_degrees)) {
            continue;
        }
        // Detection ran on the flipped frame, so yaw is measured in display space.
        // The geometry expects the sensor's sign and flips it for mirrored output.
        if (mirrored_) {
            detection.head_yaw_degrees = -detection.head_yaw_degrees;
        }
        detections_.push_back(detection);
    }
}

FrameContext OverlaySession::GetFrameContext() const {
    const auto& latest = pipeline_.GetLatest();
    FrameContext ctx;
    ctx.source_width = static_cast<float>(latest.frame_width);
    ctx.source_height = static_cast<float>(latest.frame_height);
    ctx.canvas_width = static_cast<float>(config_.canvas_width);
    ctx.canvas_height = static_cast<float>(config_.canvas_height);
    ctx.mirrored = mirrored_;
    return ctx;
}

std::vector<DrawInstruction> OverlaySession::GetDrawInstructions() const {
    return ComputeDrawInstructions(detections_, GetFrameContext(),
                                   animator_.GetSpriteOpacity(), config_.geometry);
}

} // namespace catface
