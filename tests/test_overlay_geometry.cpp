#include "overlay_geometry.h"
#include <cassert>
#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>

using namespace catface;

namespace {

bool Near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) <= eps;
}

FrameContext MakeContext(float source_width, float source_height, float canvas_width, float canvas_height,
                         bool mirrored = false) {
    FrameContext ctx;
    ctx.source_width = source_width;
    ctx.source_height = source_height;
    ctx.canvas_width = canvas_width;
    ctx.canvas_height = canvas_height;
    ctx.mirrored = mirrored;
    return ctx;
}

Detection MakeDetection(float left, float top, float right, float bottom, float yaw = 0.0f, float roll = 0.0f) {
    Detection detection;
    detection.bounding_box = BoundingBox(left, top, right, bottom);
    detection.head_yaw_degrees = yaw;
    detection.head_roll_degrees = roll;
    return detection;
}

} // namespace

int main() {
    std::cout << "=== Testing Overlay Geometry ===" << std::endl;

    std::cout << "\n[Test 1] Identity scale on a square frame..." << std::endl;
    {
        const auto ctx = MakeContext(100, 100, 100, 100);
        assert(Near(ComputeLetterboxScale(ctx), 1.0f) && "Scale should be 1");
        const auto out = ComputeDrawInstructions({ MakeDetection(0, 0, 50, 50) }, ctx);
        assert(out.size() == 1 && "One instruction per detection");
        assert(Near(out[0].center.x, 25.0f) && Near(out[0].center.y, 25.0f) && "Center should be (25, 25)");
        assert(Near(out[0].rect_half_width, 25.0f) && Near(out[0].rect_half_height, 25.0f) && "Half extents should be 25");
        assert(Near(out[0].sprite_half_width, 40.0f) && Near(out[0].sprite_half_height, 40.0f) && "Sprite is 1.6x the box");
        assert(Near(out[0].rotation_radians, 0.0f) && "No roll, no rotation");
        assert(Near(out[0].sprite_opacity, 1.0f) && "Default opacity is 1");
    }
    std::cout << "  ✓ Box maps unchanged" << std::endl;

    std::cout << "\n[Test 2] Letterboxing picks the smaller axis ratio..." << std::endl;
    {
        const auto ctx = MakeContext(200, 100, 100, 100);
        assert(Near(ComputeLetterboxScale(ctx), 0.5f) && "Scale should be min(0.5, 1.0)");
        const auto out = ComputeDrawInstructions({ MakeDetection(0, 0, 200, 100) }, ctx);
        assert(out.size() == 1);
        const float left = out[0].center.x - out[0].rect_half_width;
        const float top = out[0].center.y - out[0].rect_half_height;
        const float right = out[0].center.x + out[0].rect_half_width;
        const float bottom = out[0].center.y + out[0].rect_half_height;
        assert(Near(left, 0.0f) && Near(top, 0.0f) && "Rect starts at the origin");
        assert(Near(right, 100.0f) && Near(bottom, 50.0f) && "Rect ends at (100, 50)");
    }
    std::cout << "  ✓ Full frame box spans (0,0)-(100,50)" << std::endl;

    std::cout << "\n[Test 3] Yaw offset flips with mirroring..." << std::endl;
    {
        const auto detection = MakeDetection(0, 0, 50, 50, 10.0f);
        const auto mirrored = ComputeDrawInstructions({ detection }, MakeContext(100, 100, 100, 100, true));
        const auto plain = ComputeDrawInstructions({ detection }, MakeContext(100, 100, 100, 100, false));
        assert(Near(mirrored[0].center.x - 25.0f, -5.0f) && "Mirrored offset should be -5");
        assert(Near(plain[0].center.x - 25.0f, 5.0f) && "Plain offset should be +5");
        assert(Near(mirrored[0].center.y, 25.0f) && Near(plain[0].center.y, 25.0f) && "Yaw only moves x");
    }
    std::cout << "  ✓ Offset is -5 mirrored, +5 otherwise" << std::endl;

    std::cout << "\n[Test 4] Roll is negated into canvas rotation..." << std::endl;
    {
        const auto out = ComputeDrawInstructions({ MakeDetection(10, 10, 30, 30, 0.0f, 90.0f) },
                                                 MakeContext(100, 100, 100, 100));
        assert(Near(out[0].rotation_radians, -kPi / 2.0f) && "Roll 90 should give -pi/2");
        assert(Near(out[0].center.x, 20.0f) && Near(out[0].center.y, 20.0f) && "Rotation keeps the center");
    }
    std::cout << "  ✓ rotation = -pi/2" << std::endl;

    std::cout << "\n[Test 5] Identical inputs give bit-identical output..." << std::endl;
    {
        const std::vector<Detection> detections{
            MakeDetection(12.5f, 7.25f, 80.0f, 66.0f, -17.0f, 33.0f),
            MakeDetection(0.0f, 0.0f, 3.0f, 9.0f, 4.0f, -8.0f) };
        const auto ctx = MakeContext(640, 480, 1080, 1920, true);
        const auto first = ComputeDrawInstructions(detections, ctx, 0.75f);
        const auto second = ComputeDrawInstructions(detections, ctx, 0.75f);
        assert(first.size() == second.size() && first.size() == 2);
        for (size_t i = 0; i < first.size(); ++i) {
            assert(std::memcmp(&first[i].center.x, &second[i].center.x, sizeof(float)) == 0);
            assert(std::memcmp(&first[i].center.y, &second[i].center.y, sizeof(float)) == 0);
            assert(std::memcmp(&first[i].rotation_radians, &second[i].rotation_radians, sizeof(float)) == 0);
            assert(std::memcmp(&first[i].sprite_half_width, &second[i].sprite_half_width, sizeof(float)) == 0);
            assert(std::memcmp(&first[i].sprite_half_height, &second[i].sprite_half_height, sizeof(float)) == 0);
        }
        // Order follows the input
        assert(first[0].rect_half_width > first[1].rect_half_width && "Output keeps input order");
    }
    std::cout << "  ✓ Deterministic and ordered" << std::endl;

    std::cout << "\n[Test 6] Degenerate contexts draw nothing..." << std::endl;
    {
        const std::vector<Detection> detections{ MakeDetection(0, 0, 50, 50) };
        assert(ComputeDrawInstructions(detections, MakeContext(0, 100, 100, 100)).empty() && "Zero width");
        assert(ComputeDrawInstructions(detections, MakeContext(-5, 100, 100, 100)).empty() && "Negative width");
        assert(ComputeDrawInstructions(detections, MakeContext(100, 0, 100, 100)).empty() && "Zero height");
        assert(ComputeDrawInstructions(detections, MakeContext(100, 100, 0, 100)).empty() && "Zero canvas");
        const float nan = std::numeric_limits<float>::quiet_NaN();
        assert(ComputeDrawInstructions(detections, MakeContext(nan, 100, 100, 100)).empty() && "NaN width");
        assert(ComputeLetterboxScale(MakeContext(0, 0, 100, 100)) == 0.0f);
        assert(ComputeDrawInstructions({}, MakeContext(100, 100, 100, 100)).empty() && "No faces, no output");
    }
    std::cout << "  ✓ Empty output, no division" << std::endl;

    std::cout << "\n[Test 7] Opacity is clamped and tunables are honored..." << std::endl;
    {
        const auto ctx = MakeContext(100, 100, 100, 100, true);
        const auto detection = MakeDetection(0, 0, 50, 50, 10.0f);
        assert(Near(ComputeDrawInstructions({ detection }, ctx, 1.5f)[0].sprite_opacity, 1.0f));
        assert(Near(ComputeDrawInstructions({ detection }, ctx, -0.5f)[0].sprite_opacity, 0.0f));
        assert(Near(ComputeDrawInstructions({ detection }, ctx, 0.25f)[0].sprite_opacity, 0.25f));

        OverlayGeometryParams params;
        params.yaw_offset_factor = 1.0f;
        params.sprite_scale = 2.0f;
        const auto out = ComputeDrawInstructions({ detection }, ctx, 1.0f, params);
        assert(Near(out[0].center.x, 15.0f) && "Factor 1 moves by the full yaw");
        assert(Near(out[0].sprite_half_width, 50.0f) && "Sprite scale 2 doubles the box");
    }
    std::cout << "  ✓ Opacity in [0, 1], params applied" << std::endl;

    std::cout << "\n[Test 8] Rotated corners..." << std::endl;
    {
        const auto flat = ComputeCorners(Point2D(10, 20), 4, 2, 0.0f);
        assert(Near(flat[0].x, 6) && Near(flat[0].y, 18) && "Top-left");
        assert(Near(flat[1].x, 14) && Near(flat[1].y, 18) && "Top-right");
        assert(Near(flat[2].x, 14) && Near(flat[2].y, 22) && "Bottom-right");
        assert(Near(flat[3].x, 6) && Near(flat[3].y, 22) && "Bottom-left");

        // Positive rotation turns clockwise on a y-down canvas
        const auto quarter = ComputeCorners(Point2D(0, 0), 4, 2, kPi / 2.0f);
        assert(Near(quarter[0].x, 2) && Near(quarter[0].y, -4) && "Top-left moves to the upper right");
        assert(Near(quarter[1].x, 2) && Near(quarter[1].y, 4));
    }
    std::cout << "  ✓ Corners follow the rotation" << std::endl;

    std::cout << "\n=== All overlay geometry tests passed ===" << std::endl;
    return 0;
}
