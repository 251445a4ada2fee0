#pragma once

#include <optional>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>
#include "common_defines.h"
#include "sprite_asset.h"

namespace catface {

struct RendererStyle {
    cv::Scalar box_color{ 174, 240, 105 };   // Green accent, BGR
    int box_thickness{ 2 };
    cv::Scalar ripple_color{ 243, 150, 33 }; // Blue, BGR
    int ripple_thickness{ 2 };
};

// Turns the frame plus draw instructions into the displayed canvas. Holds no
// per-frame state.
class OverlayRenderer {
public:
    explicit OverlayRenderer(const RendererStyle& style = RendererStyle());

    // canvas_out becomes a canvas_width x canvas_height BGR image. The camera
    // frame is scaled by the letterboxing scale and anchored at the origin, the
    // same mapping the geometry uses. Instructions are assumed to come from
    // ComputeDrawInstructions with the same context.
    void Draw(const cv::Mat& frame, const FrameContext& ctx,
              const std::vector<DrawInstruction>& instructions,
              const std::optional<TapRipple>& ripple,
              const SpriteAsset& sprite, cv::Mat& canvas_out) const;

    // Black canvas with a single caption, for states without a camera.
    void DrawMessage(int canvas_width, int canvas_height, const std::string& text, cv::Mat& canvas_out) const;

private:
    void DrawPreview(const cv::Mat& frame, float scale, cv::Mat& canvas) const;
    void DrawOutline(const DrawInstruction& instruction, cv::Mat& canvas) const;
    void DrawSprite(const DrawInstruction& instruction, const cv::Mat& sprite, cv::Mat& canvas) const;
    void DrawRipple(const TapRipple& ripple, cv::Mat& canvas) const;

    RendererStyle style_;
};

} // namespace catface
