#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "camera_source.h"
#include "common_defines.h"
#include "config_manager.h"
#include "detection_pipeline.h"
#include "face_detector.h"
#include "interaction_animator.h"
#include "overlay_geometry.h"
#include "overlay_renderer.h"
#include "sprite_asset.h"

namespace catface {

struct SessionConfig {
    int canvas_width{ 0 };
    int canvas_height{ 0 };
    std::string sprite_path;
    OverlayGeometryParams geometry;
    AnimationConfig animation;
    RendererStyle style;
    std::chrono::milliseconds shutdown_timeout{ 2000 }; // Wait for a running detection on Stop()

    static SessionConfig FromConfig(const CatFaceConfig& config);
};

// One camera overlay session. Owns the camera, the detection pipeline, the
// sprite and the animator; everything is acquired in Start() and released in
// Stop(). Driven by the host loop through Update(), OnTap() and Render().
class OverlaySession {
public:
    enum class State { kIdle, kRunning, kFailed, kStopped };

    OverlaySession(const SessionConfig& config, std::unique_ptr<FrameSource> frame_source,
                   std::shared_ptr<FaceDetector> detector);
    ~OverlaySession();

    OverlaySession(const OverlaySession&) = delete;
    OverlaySession& operator=(const OverlaySession&) = delete;

    // False when the camera cannot be opened; the session is then kFailed for good.
    bool Start();
    // Picks up finished detections, reads one frame, feeds the detector if it
    // is idle and advances the animations. False when no frame was read.
    bool Update(TimePoint now);
    void OnTap(const Point2D& point, TimePoint now);
    const cv::Mat& Render();
    void Stop();

    FrameContext GetFrameContext() const;
    std::vector<DrawInstruction> GetDrawInstructions() const;

    State GetState() const { return state_; }
    bool HasSprite() const { return sprite_.IsLoaded(); }
    const InteractionAnimator& GetAnimator() const { return animator_; }
    const DetectionPipeline& GetPipeline() const { return pipeline_; }
    const SessionConfig& GetConfig() const { return config_; }

private:
    void TakeLatestDetections();

    SessionConfig config_;
    std::unique_ptr<FrameSource> frame_source_;
    DetectionPipeline pipeline_;
    InteractionAnimator animator_;
    OverlayRenderer renderer_;
    SpriteAsset sprite_;
    State state_{ State::kIdle };
    bool mirrored_{ false };
    cv::Mat raw_frame_;
    cv::Mat frame_; // Frame as displayed, mirrored for a front camera
    cv::Mat canvas_;
    std::vector<Detection> detections_; // Latest result, yaw in sensor convention
};

} // namespace catface
