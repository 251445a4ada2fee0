#include "overlay_session.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <thread>

using namespace catface;
using std::chrono::milliseconds;

namespace {

// Serves a flat gray frame of a fixed size.
class FakeFrameSource : public FrameSource {
public:
    FakeFrameSource(int width, int height, bool can_open, bool front_facing)
        : width_(width), height_(height), can_open_(can_open), front_facing_(front_facing) {}

    bool Open() override {
        opened_ = can_open_;
        ++open_calls_;
        return opened_;
    }
    bool Read(cv::Mat& frame_out) override {
        if (!opened_) {
            return false;
        }
        frame_out = cv::Mat(height_, width_, CV_8UC3, cv::Scalar(60, 60, 60));
        // Marker in the top-left corner shows whether the frame was mirrored
        frame_out(cv::Rect(0, 0, 4, 4)).setTo(cv::Scalar(255, 255, 255));
        return true;
    }
    void Close() override { opened_ = false; }
    bool IsOpened() const override { return opened_; }
    int GetWidth() const override { return width_; }
    int GetHeight() const override { return height_; }
    bool IsFrontFacing() const override { return front_facing_; }

    int GetOpenCalls() const { return open_calls_; }

private:
    int width_;
    int height_;
    bool can_open_;
    bool front_facing_;
    bool opened_{ false };
    int open_calls_{ 0 };
};

// Reports one face in the left half of the frame, turned toward the frame's
// right edge.
class FixedDetector : public FaceDetector {
public:
    std::vector<Detection> Detect(const cv::Mat& frame_bgr) override {
        Detection detection;
        detection.bounding_box = BoundingBox(0, 0, static_cast<float>(frame_bgr.cols) / 2,
                                             static_cast<float>(frame_bgr.rows) / 2);
        detection.head_yaw_degrees = 10.0f;
        detection.score = 0.9f;
        return { detection };
    }
};

// One usable face plus boxes no renderer can draw.
class NoisyDetector : public FaceDetector {
public:
    std::vector<Detection> Detect(const cv::Mat& /*frame_bgr*/) override {
        Detection good;
        good.bounding_box = BoundingBox(10, 10, 30, 30);
        Detection not_a_number;
        not_a_number.bounding_box = BoundingBox(std::nanf(""), 10, 30, 30);
        Detection inverted;
        inverted.bounding_box = BoundingBox(30, 10, 10, 30);
        Detection bad_angle;
        bad_angle.bounding_box = BoundingBox(40, 10, 60, 30);
        bad_angle.head_roll_degrees = std::numeric_limits<float>::infinity();
        return { not_a_number, good, inverted, bad_angle };
    }
};

SessionConfig MakeConfig() {
    SessionConfig config;
    config.canvas_width = 200;
    config.canvas_height = 100;
    config.sprite_path = "";
    return config;
}

// Updates until the first detection has been swapped in.
bool RunUntilDetected(OverlaySession& session, TimePoint now) {
    const auto deadline = Clock::now() + std::chrono::seconds(5);
    while (Clock::now() < deadline) {
        session.Update(now);
        if (session.GetPipeline().GetCompletedCount() > 0) {
            return true;
        }
        std::this_thread::sleep_for(milliseconds(1));
    }
    return false;
}

} // namespace

int main() {
    std::cout << "=== Testing Overlay Session ===" << std::endl;
    const TimePoint t0 = Clock::now();

    std::cout << "\n[Test 1] Camera failure is terminal..." << std::endl;
    {
        auto source = std::make_unique<FakeFrameSource>(100, 50, false, true);
        auto* source_ptr = source.get();
        OverlaySession session(MakeConfig(), std::move(source), std::make_shared<FixedDetector>());
        assert(session.GetState() == OverlaySession::State::kIdle);

        assert(!session.Start());
        assert(session.GetState() == OverlaySession::State::kFailed);
        assert(!session.Start() && "No retry");
        assert(source_ptr->GetOpenCalls() == 1);
        assert(!session.Update(t0));

        const cv::Mat& canvas = session.Render();
        assert(canvas.cols == 200 && canvas.rows == 100);
        assert(cv::countNonZero(canvas.reshape(1)) > 0 && "Error caption shown");
        assert(session.GetDrawInstructions().empty());
    }
    std::cout << "  ✓ kFailed with an error presentation" << std::endl;

    std::cout << "\n[Test 2] Running session draws detected faces..." << std::endl;
    {
        OverlaySession session(MakeConfig(), std::make_unique<FakeFrameSource>(100, 50, true, true),
                               std::make_shared<FixedDetector>());
        assert(session.Start());
        assert(session.GetState() == OverlaySession::State::kRunning);
        assert(!session.HasSprite() && "Empty sprite path disables the sprite");
        assert(session.GetDrawInstructions().empty() && "Nothing before the first detection");

        assert(RunUntilDetected(session, t0));
        const auto ctx = session.GetFrameContext();
        assert(ctx.source_width == 100.0f && ctx.source_height == 50.0f);
        assert(ctx.canvas_width == 200.0f && ctx.canvas_height == 100.0f);
        assert(ctx.mirrored && "Front camera is mirrored");

        const auto instructions = session.GetDrawInstructions();
        assert(instructions.size() == 1);
        // Box (0,0)-(50,25) scaled by 2, nudged toward the turn by yaw 10 * 0.5
        assert(std::fabs(instructions[0].center.x - 55.0f) < 1e-3f);
        assert(std::fabs(instructions[0].center.y - 25.0f) < 1e-3f);
        assert(std::fabs(instructions[0].rect_half_width - 50.0f) < 1e-3f);

        const cv::Mat& canvas = session.Render();
        assert(canvas.cols == 200 && canvas.rows == 100);
        assert(canvas.at<cv::Vec3b>(2, 2) == cv::Vec3b(60, 60, 60) && "Marker moved away by the mirror");
        assert(canvas.at<cv::Vec3b>(2, 197) == cv::Vec3b(255, 255, 255) && "Marker shows up on the right");
    }
    std::cout << "  ✓ Mirrored preview with one instruction" << std::endl;

    std::cout << "\n[Test 3] Taps drive the sprite fade..." << std::endl;
    {
        OverlaySession session(MakeConfig(), std::make_unique<FakeFrameSource>(100, 50, true, false),
                               std::make_shared<FixedDetector>());
        session.OnTap(Point2D(10, 10), t0);
        assert(!session.GetAnimator().GetRipple().has_value() && "Taps before Start are ignored");

        assert(session.Start());
        assert(RunUntilDetected(session, t0));
        assert(!session.GetFrameContext().mirrored);

        session.OnTap(Point2D(100, 50), t0);
        assert(session.GetAnimator().IsRippleRunning());
        session.Update(t0 + milliseconds(600));
        assert(!session.GetAnimator().IsRippleRunning());
        assert(session.GetDrawInstructions()[0].sprite_opacity == 0.0f && "Hidden 500 ms after the tap");
        session.Update(t0 + milliseconds(3600));
        assert(session.GetDrawInstructions()[0].sprite_opacity == 1.0f && "Visible again at 3500 ms");
    }
    std::cout << "  ✓ Fade reaches the instructions" << std::endl;

    std::cout << "\n[Test 4] Stop releases everything..." << std::endl;
    {
        auto source = std::make_unique<FakeFrameSource>(100, 50, true, true);
        auto* source_ptr = source.get();
        OverlaySession session(MakeConfig(), std::move(source), std::make_shared<FixedDetector>());
        assert(session.Start());
        assert(session.Update(t0));
        session.OnTap(Point2D(5, 5), t0);

        session.Stop();
        assert(session.GetState() == OverlaySession::State::kStopped);
        assert(!source_ptr->IsOpened() && "Camera closed");
        assert(!session.GetAnimator().GetRipple().has_value() && "Animations reset");
        assert(!session.Update(t0) && "No frames after Stop");

        session.OnTap(Point2D(5, 5), t0);
        assert(!session.GetAnimator().GetRipple().has_value() && "Taps after Stop are ignored");

        session.Stop();
        assert(session.GetState() == OverlaySession::State::kStopped && "Stop is idempotent");
        const cv::Mat& canvas = session.Render();
        assert(canvas.cols == 200 && cv::countNonZero(canvas.reshape(1)) == 0 && "Blank after Stop");
    }
    std::cout << "  ✓ kStopped, camera closed, taps ignored" << std::endl;

    std::cout << "\n[Test 5] Head turn nudges the sprite the same way on both cameras..." << std::endl;
    {
        OverlaySession front(MakeConfig(), std::make_unique<FakeFrameSource>(100, 50, true, true),
                             std::make_shared<FixedDetector>());
        OverlaySession rear(MakeConfig(), std::make_unique<FakeFrameSource>(100, 50, true, false),
                            std::make_shared<FixedDetector>());
        assert(front.Start() && rear.Start());
        assert(RunUntilDetected(front, t0) && RunUntilDetected(rear, t0));
        assert(front.GetFrameContext().mirrored && !rear.GetFrameContext().mirrored);

        // Both detectors see the nose toward the displayed right
        const auto front_instructions = front.GetDrawInstructions();
        const auto rear_instructions = rear.GetDrawInstructions();
        assert(front_instructions.size() == 1 && rear_instructions.size() == 1);
        const float front_nudge = front_instructions[0].center.x - 50.0f;
        const float rear_nudge = rear_instructions[0].center.x - 50.0f;
        assert(std::fabs(front_nudge - 5.0f) < 1e-3f && "Front camera: toward the displayed right");
        assert(std::fabs(rear_nudge - 5.0f) < 1e-3f && "Rear camera: toward the displayed right");

        // The pipeline keeps the detector's own measurement
        assert(front.GetPipeline().GetLatest().detections[0].head_yaw_degrees == 10.0f);
    }
    std::cout << "  ✓ Same on-screen direction, front and rear" << std::endl;

    std::cout << "\n[Test 6] Undrawable boxes are skipped..." << std::endl;
    {
        OverlaySession session(MakeConfig(), std::make_unique<FakeFrameSource>(100, 50, true, false),
                               std::make_shared<NoisyDetector>());
        assert(session.Start());
        assert(RunUntilDetected(session, t0));
        assert(session.GetPipeline().GetLatest().detections.size() == 4);

        const auto instructions = session.GetDrawInstructions();
        assert(instructions.size() == 1 && "Only the finite box remains");
        assert(std::fabs(instructions[0].center.x - 40.0f) < 1e-3f && std::fabs(instructions[0].center.y - 40.0f) < 1e-3f);
        const cv::Mat& canvas = session.Render();
        assert(canvas.cols == 200 && canvas.rows == 100);
    }
    std::cout << "  ✓ One instruction from four boxes" << std::endl;

    std::cout << "\n[Test 7] Invalid construction..." << std::endl;
    {
        bool threw = false;
        try {
            SessionConfig config = MakeConfig();
            config.canvas_width = 0;
            OverlaySession session(config, std::make_unique<FakeFrameSource>(10, 10, true, true),
                                   std::make_shared<FixedDetector>());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Canvas size is required");
    }
    std::cout << "  ✓ Rejected" << std::endl;

    std::cout << "\n=== All overlay session tests passed ===" << std::endl;
    return 0;
}
