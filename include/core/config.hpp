#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace crane {

enum class CameraBackend {
    GenericCapture,  // "capture": cv::VideoCapture auto-selected back end
    Pipeline,        // "gstreamer": raw GStreamer pipeline string
    DirectDevice,    // "v4l2": /dev/videoN through V4L2
    VendorSdk,       // "csi": Jetson nvarguscamerasrc pipeline built from structured params
};

enum class MovementDirection {
    Increasing,  // left_to_right
    Decreasing,  // right_to_left
};

struct CameraConfig {
    CameraBackend backend{CameraBackend::GenericCapture};
    int device_index{0};
    std::string device_path{};  // optional, e.g. /dev/video2 (overrides device_index)
    int width{1280};
    int height{720};
    int fps{30};
    std::string gstreamer_pipeline{};  // when non-empty, bypasses width/height/fps/device
    int open_timeout_ms{3000};
    int read_timeout_ms{1000};
};

struct RoiRect {
    int x{0};
    int y{0};
    int w{0};  // 0 = to the right frame edge
    int h{0};  // 0 = to the bottom frame edge
};

struct BridgeConfig {
    CameraConfig camera{};
    int marker_size_mm{35};
    MovementDirection movement_direction{MovementDirection::Increasing};
    RoiRect roi{};
    std::map<int, double> marker_positions_m{{1, 0.0}};
    int confirm_threshold{5};
};

struct HookConfig {
    CameraConfig camera{CameraBackend::GenericCapture, 1};
    int marker_size_mm{35};
    int marker_id{1};
};

struct FieldbusConfig {
    std::string host{"127.0.0.1"};
    int port{5020};
    int unit_id{1};
    int bridge_base_register{100};
    int hook_base_register{200};
    int connect_timeout_ms{1000};
    int reconnect_min_ms{200};
    int reconnect_max_ms{5000};
};

struct RuntimeConfig {
    std::string runtime_dir{"data/runtime"};
    double sample_rate_hz{8.0};
    int max_capture_retries{10};
    int restart_delay_ms{1000};
    int stop_timeout_ms{3000};
    std::string control_socket{"/tmp/crane_arbiter.sock"};
    std::string intrinsics_file{};
    std::string bridge_launch_command{
        "crane_supervisor --circuit=bridge --config=data/calibration_config.json -- "
        "crane_bridge_pose --config=data/calibration_config.json"};
    std::string hook_launch_command{
        "crane_supervisor --circuit=hook --config=data/calibration_config.json -- "
        "crane_hook_pose --config=data/calibration_config.json"};
};

struct AppConfig {
    BridgeConfig bridge;
    HookConfig hook;
    FieldbusConfig fieldbus;
    RuntimeConfig runtime;
};

bool parseCameraBackend(const std::string& text, CameraBackend& out);
const char* cameraBackendName(CameraBackend backend);
bool parseMovementDirection(const std::string& text, MovementDirection& out);
const char* movementDirectionName(MovementDirection direction);

bool loadConfig(const std::string& path, AppConfig& out, std::string& error);
bool validateConfig(const AppConfig& cfg, std::string& error);

}  // namespace crane
