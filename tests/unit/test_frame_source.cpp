#include "camera/frame_source.hpp"

#include <iostream>
#include <string>

int main() {
    crane::CameraConfig cfg;
    cfg.device_index = 2;

    crane::CaptureTarget t = crane::resolveCaptureTarget(cfg);
    if (t.api_preference != cv::CAP_ANY || !t.use_index || t.index != 2 || !t.apply_structured_params) {
        std::cerr << "generic capture should open by index\n";
        return 1;
    }
    if (crane::describeCaptureTarget(t) != "any:index=2") {
        std::cerr << "description mismatch: " << crane::describeCaptureTarget(t) << "\n";
        return 1;
    }

    cfg.backend = crane::CameraBackend::DirectDevice;
    cfg.device_path = "/dev/video7";
    t = crane::resolveCaptureTarget(cfg);
    if (t.api_preference != cv::CAP_V4L2 || t.use_index || t.location != "/dev/video7") {
        std::cerr << "device path should override the index\n";
        return 1;
    }

    cfg.backend = crane::CameraBackend::VendorSdk;
    cfg.device_path.clear();
    cfg.device_index = 1;
    cfg.width = 1920;
    cfg.height = 1080;
    cfg.fps = 30;
    t = crane::resolveCaptureTarget(cfg);
    if (t.api_preference != cv::CAP_GSTREAMER || t.apply_structured_params ||
        t.location.find("sensor-id=1") == std::string::npos ||
        t.location.find("width=1920, height=1080, framerate=30/1") == std::string::npos ||
        t.location.find("appsink") == std::string::npos) {
        std::cerr << "csi backend should build the nvarguscamerasrc pipeline: " << t.location << "\n";
        return 1;
    }

    cfg.gstreamer_pipeline = "videotestsrc ! appsink";
    cfg.backend = crane::CameraBackend::DirectDevice;
    t = crane::resolveCaptureTarget(cfg);
    if (t.api_preference != cv::CAP_GSTREAMER || t.location != "videotestsrc ! appsink" || t.apply_structured_params) {
        std::cerr << "a raw pipeline should win over every other field\n";
        return 1;
    }

    if (std::string(crane::captureStatusName(crane::CaptureStatus::Lost)) != "lost") {
        std::cerr << "status name mismatch\n";
        return 1;
    }

    // A device node that does not exist is reported without touching OpenCV.
    crane::CameraConfig missing;
    missing.backend = crane::CameraBackend::DirectDevice;
    missing.device_path = "/dev/crane_no_such_camera";
    std::string err;
    if (crane::openFrameSource(missing, err) != nullptr || err.find("not found") == std::string::npos) {
        std::cerr << "missing device should fail fast: " << err << "\n";
        return 1;
    }

    return 0;
}
