#include <opencv2/opencv.hpp>
#include "camera_source.h"
#include "config_manager.h"
#include "face_manager.h"
#include "overlay_session.h"
#include "common_defines.h"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace {

constexpr const char* kWindowName = "Cat Face";

void OnMouse(int event, int x, int y, int /*flags*/, void* user_data) {
    if (event != cv::EVENT_LBUTTONDOWN) {
        return;
    }
    auto* session = static_cast<catface::OverlaySession*>(user_data);
    session->OnTap(catface::Point2D(static_cast<float>(x), static_cast<float>(y)), catface::Clock::now());
}

// Shows the blank error presentation until the user quits. No retry.
int ShowFailure(catface::OverlaySession& session) {
    while (true) {
        cv::imshow(kWindowName, session.Render());
        char key = cv::waitKey(30) & 0xFF;
        if (key == 'q' || key == 27) {
            break;
        }
    }
    cv::destroyAllWindows();
    return -1;
}

int Run(const std::string& config_path) {
    // Load Configuration
    catface::CatFaceConfig config;
    catface::ConfigManager::LoadFromFile(config_path, config);
    const bool show_stats = config.face_manager.enable_performance_stats;

    auto detector = std::make_shared<catface::FaceManager>(config.face_manager);
    auto camera = std::make_unique<catface::CameraSource>(config.camera);
    catface::OverlaySession session(catface::SessionConfig::FromConfig(config), std::move(camera), detector);

    cv::namedWindow(kWindowName, cv::WINDOW_AUTOSIZE);
    cv::setMouseCallback(kWindowName, OnMouse, &session);

    if (!session.Start()) {
        return ShowFailure(session);
    }

    int frame_count = 0;
    double total_frame_time = 0.0;
    double min_frame_time = std::numeric_limits<double>::max();
    double max_frame_time = 0.0;

    std::cout << "Starting camera feed..." << std::endl;
    std::cout << "Click to tap, press 'q' to quit, 's' to save current frame" << std::endl;
    while (true) {
        // TICK - Start frame processing timer
        const auto frame_start = catface::Clock::now();

        if (!session.Update(frame_start)) {
            std::cerr << "Error: Camera stopped delivering frames." << std::endl;
            break;
        }
        cv::Mat canvas = session.Render();

        // TOCK - End frame processing timer
        const auto frame_end = catface::Clock::now();
        const double frame_time_ms = std::chrono::duration<double, std::milli>(frame_end - frame_start).count();
        total_frame_time += frame_time_ms;
        min_frame_time = std::min(min_frame_time, frame_time_ms);
        max_frame_time = std::max(max_frame_time, frame_time_ms);
        const double current_fps = frame_time_ms > 0.0 ? 1000.0 / frame_time_ms : 0.0;

        if (show_stats && !canvas.empty()) {
            std::stringstream perf_text;
            perf_text << std::fixed << std::setprecision(1)
                      << "Frame: " << frame_time_ms << "ms | "
                      << "Faces: " << session.GetPipeline().GetLatest().detections.size() << " | "
                      << "FPS: " << current_fps;
            cv::putText(canvas, perf_text.str(), cv::Point(10, canvas.rows - 20),
                        cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(255, 255, 255), 1);
        }

        cv::imshow(kWindowName, canvas);
        frame_count++;

        // Handle keyboard input
        char key = cv::waitKey(1) & 0xFF;
        if (key == 'q' || key == 27) { // 'q' or ESC key
            break;
        } else if (key == 's') {
            std::string filename = "catface_frame_" + std::to_string(frame_count) + ".jpg";
            if (cv::imwrite(filename, canvas)) {
                std::cout << "Frame saved as: " << filename << std::endl;
            } else {
                std::cerr << "Error: Could not save frame to " << filename << std::endl;
            }
        }

        if (show_stats && frame_count % 30 == 0) {
            const auto& pipeline = session.GetPipeline();
            std::cout << "Frame " << frame_count << " | "
                      << "Processing: " << std::fixed << std::setprecision(2) << frame_time_ms << "ms | "
                      << "Detections: " << pipeline.GetCompletedCount() << " | "
                      << "Dropped: " << pipeline.GetDroppedFrameCount() << " | "
                      << "FPS: " << std::fixed << std::setprecision(1) << current_fps << std::endl;
        }
    }

    const uint64_t completed = session.GetPipeline().GetCompletedCount();
    const uint64_t dropped = session.GetPipeline().GetDroppedFrameCount();
    const uint64_t failures = session.GetPipeline().GetFailureCount();

    // Release resources
    session.Stop();
    cv::destroyAllWindows();

    if (show_stats && frame_count > 0) {
        std::cout << "\n=== PERFORMANCE SUMMARY ===" << std::endl;
        std::cout << "Total frames processed: " << frame_count << std::endl;
        std::cout << "Average frame time: " << std::fixed << std::setprecision(2)
                  << (total_frame_time / frame_count) << " ms/frame" << std::endl;
        std::cout << "Average FPS: " << std::fixed << std::setprecision(1)
                  << (1000.0 * frame_count / total_frame_time) << std::endl;
        std::cout << "Min frame time: " << std::fixed << std::setprecision(2)
                  << min_frame_time << " ms" << std::endl;
        std::cout << "Max frame time: " << std::fixed << std::setprecision(2)
                  << max_frame_time << " ms" << std::endl;
        std::cout << "Completed detections: " << completed << std::endl;
        std::cout << "Frames dropped while detecting: " << dropped << std::endl;
        std::cout << "Detection failures: " << failures << std::endl;
        std::cout << "Faces without mesh refinement: " << detector->GetUnrefinedFaceCount() << std::endl;
    }

    std::cout << "\nCamera feed ended." << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    const std::string config_path = argc > 1 ? argv[1] : std::string(CATFACE_ASSETS_DIR) + "/catface_config.json";
    try {
        return Run(config_path);
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return -1;
    }
}
