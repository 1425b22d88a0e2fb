#include "core/config.hpp"

#include <cmath>
#include <utility>

#include <opencv2/core.hpp>

#include "fieldbus/register_codec.hpp"

namespace crane {

namespace {

template <typename T>
void readOrDefault(const cv::FileNode& node, const char* key, T& out) {
    if (node.empty()) {
        return;
    }
    const cv::FileNode child = node[key];
    if (!child.empty()) {
        child >> out;
    }
}

bool readCamera(const cv::FileNode& node, CameraConfig& out, std::string& error) {
    if (node.empty()) {
        return true;
    }
    std::string mode;
    readOrDefault(node, "source_mode", mode);
    if (!mode.empty() && !parseCameraBackend(mode, out.backend)) {
        error = "unknown camera source_mode '" + mode + "'";
        return false;
    }
    readOrDefault(node, "device_index", out.device_index);
    readOrDefault(node, "camera_id", out.device_index);
    readOrDefault(node, "device_path", out.device_path);
    readOrDefault(node, "width", out.width);
    readOrDefault(node, "height", out.height);
    readOrDefault(node, "fps", out.fps);
    readOrDefault(node, "gstreamer_pipeline", out.gstreamer_pipeline);
    readOrDefault(node, "open_timeout_ms", out.open_timeout_ms);
    readOrDefault(node, "read_timeout_ms", out.read_timeout_ms);
    return true;
}

bool readMarkerPositions(const cv::FileNode& node, std::map<int, double>& out, std::string& error) {
    if (node.empty()) {
        return true;
    }
    if (node.type() != cv::FileNode::SEQ) {
        error = "bridge.marker_positions must be a list of {id, x_m}";
        return false;
    }
    std::map<int, double> parsed;
    for (const auto& item : node) {
        const cv::FileNode id_node = item["id"];
        const cv::FileNode x_node = item["x_m"];
        if (id_node.empty() || x_node.empty()) {
            error = "bridge.marker_positions entries need both id and x_m";
            return false;
        }
        int id = -1;
        double x_m = 0.0;
        id_node >> id;
        x_node >> x_m;
        parsed[id] = x_m;
    }
    out = std::move(parsed);
    return true;
}

bool rangeFits(int base, int count) {
    return base >= 0 && base + count <= 65536;
}

}  // namespace

bool parseCameraBackend(const std::string& text, CameraBackend& out) {
    if (text == "capture" || text == "generic") {
        out = CameraBackend::GenericCapture;
    } else if (text == "gstreamer" || text == "pipeline") {
        out = CameraBackend::Pipeline;
    } else if (text == "v4l2" || text == "device") {
        out = CameraBackend::DirectDevice;
    } else if (text == "csi" || text == "jetson") {
        out = CameraBackend::VendorSdk;
    } else {
        return false;
    }
    return true;
}

const char* cameraBackendName(CameraBackend backend) {
    switch (backend) {
        case CameraBackend::GenericCapture: return "capture";
        case CameraBackend::Pipeline: return "gstreamer";
        case CameraBackend::DirectDevice: return "v4l2";
        case CameraBackend::VendorSdk: return "csi";
    }
    return "unknown";
}

bool parseMovementDirection(const std::string& text, MovementDirection& out) {
    if (text == "increasing" || text == "left_to_right") {
        out = MovementDirection::Increasing;
    } else if (text == "decreasing" || text == "right_to_left") {
        out = MovementDirection::Decreasing;
    } else {
        return false;
    }
    return true;
}

const char* movementDirectionName(MovementDirection direction) {
    return direction == MovementDirection::Increasing ? "increasing" : "decreasing";
}

bool validateConfig(const AppConfig& cfg, std::string& error) {
    const CameraConfig* cameras[] = {&cfg.bridge.camera, &cfg.hook.camera};
    for (const CameraConfig* cam : cameras) {
        if (cam->width <= 0 || cam->height <= 0 || cam->fps <= 0) {
            error = "camera dimensions/fps must be > 0";
            return false;
        }
        if (cam->device_index < 0) {
            error = "camera.device_index must be >= 0";
            return false;
        }
        if (cam->backend == CameraBackend::Pipeline && cam->gstreamer_pipeline.empty()) {
            error = "camera.gstreamer_pipeline must not be empty when source_mode=gstreamer";
            return false;
        }
        if (cam->open_timeout_ms <= 0 || cam->read_timeout_ms <= 0) {
            error = "camera open/read timeouts must be > 0";
            return false;
        }
    }

    if (cfg.bridge.marker_size_mm <= 0 || cfg.hook.marker_size_mm <= 0) {
        error = "marker_size_mm must be > 0";
        return false;
    }
    if (cfg.bridge.marker_positions_m.empty()) {
        error = "bridge.marker_positions must not be empty";
        return false;
    }
    for (const auto& kv : cfg.bridge.marker_positions_m) {
        if (kv.first < 0 || kv.first > 65535 || !std::isfinite(kv.second)) {
            error = "bridge.marker_positions has an invalid entry for id " + std::to_string(kv.first);
            return false;
        }
    }
    if (cfg.bridge.roi.x < 0 || cfg.bridge.roi.y < 0 || cfg.bridge.roi.w < 0 || cfg.bridge.roi.h < 0) {
        error = "bridge.roi must not be negative";
        return false;
    }
    if (cfg.bridge.confirm_threshold < 0) {
        error = "bridge.confirm_threshold must be >= 0";
        return false;
    }
    if (cfg.hook.marker_id < 0 || cfg.hook.marker_id > 65535) {
        error = "hook.marker_id must be in [0,65535]";
        return false;
    }

    const FieldbusConfig& fb = cfg.fieldbus;
    if (fb.port <= 0 || fb.port > 65535) {
        error = "fieldbus.port must be in [1,65535]";
        return false;
    }
    if (fb.unit_id < 0 || fb.unit_id > 255) {
        error = "fieldbus.unit_id must be in [0,255]";
        return false;
    }
    if (!rangeFits(fb.bridge_base_register, fieldbus::kBridgeRegisterCount) ||
        !rangeFits(fb.hook_base_register, fieldbus::kHookRegisterCount)) {
        error = "fieldbus register ranges must fit in the 16-bit address space";
        return false;
    }
    if (fieldbus::rangesOverlap(
            fieldbus::bridgeRange(static_cast<uint16_t>(fb.bridge_base_register)),
            fieldbus::hookRange(static_cast<uint16_t>(fb.hook_base_register)))) {
        error = "fieldbus bridge and hook register ranges overlap";
        return false;
    }
    if (fb.connect_timeout_ms <= 0 || fb.reconnect_min_ms <= 0 || fb.reconnect_max_ms < fb.reconnect_min_ms) {
        error = "fieldbus connect timeout must be > 0 and reconnect_min_ms <= reconnect_max_ms";
        return false;
    }

    const RuntimeConfig& rt = cfg.runtime;
    if (!(rt.sample_rate_hz > 0.0)) {
        error = "runtime.sample_rate_hz must be > 0";
        return false;
    }
    if (rt.max_capture_retries < 0 || rt.restart_delay_ms < 0 || rt.stop_timeout_ms <= 0) {
        error = "runtime retry/delay/timeout values are out of range";
        return false;
    }
    if (rt.runtime_dir.empty()) {
        error = "runtime.runtime_dir must not be empty";
        return false;
    }
    error.clear();
    return true;
}

bool loadConfig(const std::string& path, AppConfig& out, std::string& error) {
    try {
        const cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            error = "failed to open config file: " + path;
            return false;
        }

        const cv::FileNode bridge = fs["bridge"];
        const cv::FileNode hook = fs["hook"];
        const cv::FileNode fieldbus = fs["fieldbus"];
        const cv::FileNode runtime = fs["runtime"];

        if (!readCamera(bridge.empty() ? cv::FileNode() : bridge["camera"], out.bridge.camera, error) ||
            !readCamera(hook.empty() ? cv::FileNode() : hook["camera"], out.hook.camera, error)) {
            return false;
        }

        readOrDefault(bridge, "marker_size_mm", out.bridge.marker_size_mm);
        std::string direction;
        readOrDefault(bridge, "movement_direction", direction);
        if (!direction.empty() && !parseMovementDirection(direction, out.bridge.movement_direction)) {
            error = "unknown bridge.movement_direction '" + direction + "'";
            return false;
        }
        if (!bridge.empty()) {
            const cv::FileNode roi = bridge["roi"];
            readOrDefault(roi, "x", out.bridge.roi.x);
            readOrDefault(roi, "y", out.bridge.roi.y);
            readOrDefault(roi, "w", out.bridge.roi.w);
            readOrDefault(roi, "h", out.bridge.roi.h);
            if (!readMarkerPositions(bridge["marker_positions"], out.bridge.marker_positions_m, error)) {
                return false;
            }
        }
        readOrDefault(bridge, "confirm_threshold", out.bridge.confirm_threshold);

        readOrDefault(hook, "marker_size_mm", out.hook.marker_size_mm);
        readOrDefault(hook, "marker_id", out.hook.marker_id);

        readOrDefault(fieldbus, "host", out.fieldbus.host);
        readOrDefault(fieldbus, "port", out.fieldbus.port);
        readOrDefault(fieldbus, "unit_id", out.fieldbus.unit_id);
        readOrDefault(fieldbus, "bridge_base_register", out.fieldbus.bridge_base_register);
        readOrDefault(fieldbus, "hook_base_register", out.fieldbus.hook_base_register);
        readOrDefault(fieldbus, "connect_timeout_ms", out.fieldbus.connect_timeout_ms);
        readOrDefault(fieldbus, "reconnect_min_ms", out.fieldbus.reconnect_min_ms);
        readOrDefault(fieldbus, "reconnect_max_ms", out.fieldbus.reconnect_max_ms);

        readOrDefault(runtime, "runtime_dir", out.runtime.runtime_dir);
        readOrDefault(runtime, "sample_rate_hz", out.runtime.sample_rate_hz);
        readOrDefault(runtime, "max_capture_retries", out.runtime.max_capture_retries);
        readOrDefault(runtime, "restart_delay_ms", out.runtime.restart_delay_ms);
        readOrDefault(runtime, "stop_timeout_ms", out.runtime.stop_timeout_ms);
        readOrDefault(runtime, "control_socket", out.runtime.control_socket);
        readOrDefault(runtime, "intrinsics_file", out.runtime.intrinsics_file);
        readOrDefault(runtime, "bridge_launch_command", out.runtime.bridge_launch_command);
        readOrDefault(runtime, "hook_launch_command", out.runtime.hook_launch_command);
    } catch (const cv::Exception& e) {
        error = "failed to parse config file " + path + ": " + e.what();
        return false;
    }

    return validateConfig(out, error);
}

}  // namespace crane
