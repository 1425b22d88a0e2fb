#include "core/command_line.hpp"

#include <fstream>
#include <iostream>

#include <opencv2/core/utility.hpp>

namespace crane {

namespace {

const char* const kKeys =
    "{help h usage ?         |                              | print this message}"
    "{config                 | data/calibration_config.json | configuration file (JSON or YAML)}"
    "{fps                    | -1                           | sample rate override in Hz}"
    "{camera-id              | -1                           | camera device index override}"
    "{modbus-host            |                              | register server host override}"
    "{modbus-port            | -1                           | register server port override}"
    "{modbus-unit-id         | -1                           | register server unit id override}"
    "{modbus-base-register   | -1                           | base register of this circuit's range}"
    "{use-gstreamer          |                              | open the camera through the CSI pipeline}"
    "{intrinsics             |                              | camera intrinsics YAML (K and D)}"
    "{max-frames             | 0                            | stop after this many frames, 0 runs forever}";

bool fileExists(const std::string& path) {
    std::ifstream in(path);
    return in.is_open();
}

}  // namespace

CommandLineResult parseTelemetryCommandLine(int argc, const char* const argv[], runtime::Circuit circuit,
                                            TelemetryCommandLine& out, std::string& error) {
    cv::CommandLineParser parser(argc, argv, kKeys);
    parser.about(std::string("crane ") + runtime::circuitName(circuit) + " pose telemetry");
    if (parser.has("help")) {
        parser.printMessage();
        return CommandLineResult::HelpShown;
    }

    out.config_path = parser.get<std::string>("config");
    out.intrinsics_path = parser.get<std::string>("intrinsics");
    const int max_frames = parser.get<int>("max-frames");
    out.overrides.fps = parser.get<double>("fps");
    out.overrides.camera_id = parser.get<int>("camera-id");
    out.overrides.modbus_host = parser.get<std::string>("modbus-host");
    out.overrides.modbus_port = parser.get<int>("modbus-port");
    out.overrides.modbus_unit_id = parser.get<int>("modbus-unit-id");
    out.overrides.modbus_base_register = parser.get<int>("modbus-base-register");
    out.overrides.use_gstreamer = parser.has("use-gstreamer");

    if (!parser.check()) {
        parser.printErrors();
        error = "invalid command line";
        return CommandLineResult::Invalid;
    }
    if (max_frames < 0) {
        error = "--max-frames must be >= 0";
        return CommandLineResult::Invalid;
    }
    out.max_frames = static_cast<uint64_t>(max_frames);
    return CommandLineResult::Run;
}

void applyOverrides(const TelemetryOverrides& o, runtime::Circuit circuit, AppConfig& cfg) {
    const bool bridge = circuit == runtime::Circuit::Bridge;
    CameraConfig& camera = bridge ? cfg.bridge.camera : cfg.hook.camera;

    if (o.fps > 0.0) {
        cfg.runtime.sample_rate_hz = o.fps;
    }
    if (o.camera_id >= 0) {
        camera.device_index = o.camera_id;
        camera.device_path.clear();
    }
    if (o.use_gstreamer && camera.gstreamer_pipeline.empty()) {
        camera.backend = CameraBackend::VendorSdk;
    }
    if (!o.modbus_host.empty()) {
        cfg.fieldbus.host = o.modbus_host;
    }
    if (o.modbus_port >= 0) {
        cfg.fieldbus.port = o.modbus_port;
    }
    if (o.modbus_unit_id >= 0) {
        cfg.fieldbus.unit_id = o.modbus_unit_id;
    }
    if (o.modbus_base_register >= 0) {
        (bridge ? cfg.fieldbus.bridge_base_register : cfg.fieldbus.hook_base_register) = o.modbus_base_register;
    }
}

bool loadTelemetryConfig(const TelemetryCommandLine& cli, runtime::Circuit circuit, AppConfig& out,
                         std::string& error) {
    AppConfig cfg;
    if (fileExists(cli.config_path)) {
        if (!loadConfig(cli.config_path, cfg, error)) {
            return false;
        }
    } else {
        std::cerr << "[WARN] config " << cli.config_path << " not found, using defaults\n";
    }
    applyOverrides(cli.overrides, circuit, cfg);
    if (!cli.intrinsics_path.empty()) {
        cfg.runtime.intrinsics_file = cli.intrinsics_path;
    }
    if (!validateConfig(cfg, error)) {
        return false;
    }
    out = cfg;
    return true;
}

}  // namespace crane
