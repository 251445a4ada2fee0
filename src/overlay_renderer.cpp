#include "overlay_renderer.h"
#include "overlay_geometry.h"

namespace catface {

OverlayRenderer::OverlayRenderer(const RendererStyle& style) : style_(style) {}

void OverlayRenderer::Draw(const cv::Mat& frame, const FrameContext& ctx,
                           const std::vector<DrawInstruction>& instructions,
                           const std::optional<TapRipple>& ripple,
                           const SpriteAsset& sprite, cv::Mat& canvas_out) const {
    const int canvas_width = static_cast<int>(std::lround(ctx.canvas_width));
    const int canvas_height = static_cast<int>(std::lround(ctx.canvas_height));
    if (canvas_width <= 0 || canvas_height <= 0) {
        canvas_out.release();
        return;
    }
    canvas_out.create(canvas_height, canvas_width, CV_8UC3);
    canvas_out.setTo(cv::Scalar::all(0));

    // The preview follows the live frame, the instructions follow the frame they were detected on
    if (!frame.empty()) {
        FrameContext preview_ctx = ctx;
        preview_ctx.source_width = static_cast<float>(frame.cols);
        preview_ctx.source_height = static_cast<float>(frame.rows);
        const float preview_scale = ComputeLetterboxScale(preview_ctx);
        if (preview_scale > 0.0f) {
            DrawPreview(frame, preview_scale, canvas_out);
        }
    }

    for (const auto& instruction : instructions) {
        DrawOutline(instruction, canvas_out);
        if (sprite.IsLoaded() && instruction.sprite_opacity > 0.0f) {
            DrawSprite(instruction, sprite.GetImage(), canvas_out);
        }
    }

    // A finished ripple has zero opacity and is skipped
    if (ripple && ripple->Opacity() > 0.0f) {
        DrawRipple(*ripple, canvas_out);
    }
}

void OverlayRenderer::DrawMessage(int canvas_width, int canvas_height, const std::string& text,
                                  cv::Mat& canvas_out) const {
    if (canvas_width <= 0 || canvas_height <= 0) {
        canvas_out.release();
        return;
    }
    canvas_out.create(canvas_height, canvas_width, CV_8UC3);
    canvas_out.setTo(cv::Scalar::all(0));
    if (!text.empty()) {
        cv::putText(canvas_out, text, cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 1,
                    cv::Scalar(0, 0, 255), 2);
    }
}

void OverlayRenderer::DrawPreview(const cv::Mat& frame, float scale, cv::Mat& canvas) const {
    const int width = std::min(canvas.cols, static_cast<int>(std::lround(frame.cols * scale)));
    const int height = std::min(canvas.rows, static_cast<int>(std::lround(frame.rows * scale)));
    if (width <= 0 || height <= 0) {
        return;
    }
    cv::Mat roi = canvas(cv::Rect(0, 0, width, height));
    if (frame.type() == CV_8UC3) {
        cv::resize(frame, roi, roi.size(), 0, 0, cv::INTER_LINEAR);
        return;
    }
    cv::Mat converted;
    if (frame.channels() == 4) {
        cv::cvtColor(frame, converted, cv::COLOR_BGRA2BGR);
    } else if (frame.channels() == 1) {
        cv::cvtColor(frame, converted, cv::COLOR_GRAY2BGR);
    } else {
        return;
    }
    cv::resize(converted, roi, roi.size(), 0, 0, cv::INTER_LINEAR);
}

void OverlayRenderer::DrawOutline(const DrawInstruction& instruction, cv::Mat& canvas) const {
    const auto corners = ComputeCorners(instruction.center, instruction.rect_half_width,
                                        instruction.rect_half_height, instruction.rotation_radians);
    std::vector<std::vector<cv::Point>> polygon(1);
    polygon[0].reserve(corners.size());
    for (const auto& corner : corners) {
        polygon[0].emplace_back(static_cast<int>(std::lround(corner.x)), static_cast<int>(std::lround(corner.y)));
    }
    cv::polylines(canvas, polygon, true, style_.box_color, style_.box_thickness, cv::LINE_AA);
}

void OverlayRenderer::DrawSprite(const DrawInstruction& instruction, const cv::Mat& sprite, cv::Mat& canvas) const {
    const float destination_width = instruction.sprite_half_width * 2.0f;
    const float destination_height = instruction.sprite_half_height * 2.0f;
    if (destination_width < 1.0f || destination_height < 1.0f) {
        return;
    }

    // Cover fit: scale until both sides are filled and crop the overflow evenly
    const float cover_scale = std::max(destination_width / sprite.cols, destination_height / sprite.rows);
    const float source_width = destination_width / cover_scale;
    const float source_height = destination_height / cover_scale;
    const float source_x = (sprite.cols - source_width) * 0.5f;
    const float source_y = (sprite.rows - source_height) * 0.5f;

    const auto corners = ComputeCorners(instruction.center, instruction.sprite_half_width,
                                        instruction.sprite_half_height, instruction.rotation_radians);
    float min_x = corners[0].x, max_x = corners[0].x, min_y = corners[0].y, max_y = corners[0].y;
    for (const auto& corner : corners) {
        min_x = std::min(min_x, corner.x);
        max_x = std::max(max_x, corner.x);
        min_y = std::min(min_y, corner.y);
        max_y = std::max(max_y, corner.y);
    }
    const cv::Rect bounds = cv::Rect(cv::Point(static_cast<int>(std::floor(min_x)), static_cast<int>(std::floor(min_y))),
                                     cv::Point(static_cast<int>(std::ceil(max_x)), static_cast<int>(std::ceil(max_y)))) &
                            cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (bounds.empty()) {
        return;
    }

    const cv::Point2f source_points[3] = {
        cv::Point2f(source_x, source_y),
        cv::Point2f(source_x + source_width, source_y),
        cv::Point2f(source_x, source_y + source_height) };
    const cv::Point2f destination_points[3] = {
        cv::Point2f(corners[0].x - bounds.x, corners[0].y - bounds.y),
        cv::Point2f(corners[1].x - bounds.x, corners[1].y - bounds.y),
        cv::Point2f(corners[3].x - bounds.x, corners[3].y - bounds.y) };
    const cv::Mat transform = cv::getAffineTransform(source_points, destination_points);

    cv::Mat warped;
    cv::warpAffine(sprite, warped, transform, bounds.size(), cv::INTER_LINEAR,
                   cv::BORDER_CONSTANT, cv::Scalar::all(0));

    // out = sprite * alpha + canvas * (1 - alpha), alpha scaled by the fade
    const float opacity = std::clamp(instruction.sprite_opacity, 0.0f, 1.0f) / 255.0f;
    cv::Mat roi = canvas(bounds);
    for (int y = 0; y < roi.rows; ++y) {
        const auto* sprite_row = warped.ptr<cv::Vec4b>(y);
        auto* canvas_row = roi.ptr<cv::Vec3b>(y);
        for (int x = 0; x < roi.cols; ++x) {
            const float alpha = sprite_row[x][3] * opacity;
            if (alpha <= 0.0f) {
                continue;
            }
            for (int c = 0; c < 3; ++c) {
                canvas_row[x][c] = cv::saturate_cast<uchar>(sprite_row[x][c] * alpha + canvas_row[x][c] * (1.0f - alpha));
            }
        }
    }
}

void OverlayRenderer::DrawRipple(const TapRipple& ripple, cv::Mat& canvas) const {
    const int radius = static_cast<int>(std::lround(ripple.Radius()));
    if (radius <= 0) {
        return;
    }
    const cv::Point center(static_cast<int>(std::lround(ripple.origin.x)), static_cast<int>(std::lround(ripple.origin.y)));
    const int reach = radius + style_.ripple_thickness;
    const cv::Rect bounds = cv::Rect(center.x - reach, center.y - reach, 2 * reach + 1, 2 * reach + 1) &
                            cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (bounds.empty()) {
        return;
    }

    cv::Mat roi = canvas(bounds);
    cv::Mat overlay = roi.clone();
    cv::circle(overlay, center - bounds.tl(), radius, style_.ripple_color, style_.ripple_thickness, cv::LINE_AA);
    const double opacity = std::clamp(ripple.Opacity(), 0.0f, 1.0f);
    cv::addWeighted(overlay, opacity, roi, 1.0 - opacity, 0.0, roi);
}

} // namespace catface
