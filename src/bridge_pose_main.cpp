#include "camera/camera_calibration.hpp"
#include "camera/frame_source.hpp"
#include "core/command_line.hpp"
#include "core/config.hpp"
#include "core/config_watcher.hpp"
#include "core/telemetry.hpp"
#include "core/time_utils.hpp"
#include "fieldbus/modbus_server.hpp"
#include "fieldbus/pose_publisher.hpp"
#include "fieldbus/register_bank.hpp"
#include "fieldbus/register_codec.hpp"
#include "pose/bridge_pose_engine.hpp"
#include "pose/marker_detector.hpp"
#include "pose/pose_loop.hpp"

#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <string>

namespace {
std::atomic<bool> g_running{true};

void onStopSignal(int) {
    g_running.store(false);
}

enum ExitCode {
    kExitOk = 0,
    kExitConfig = 1,
    kExitCameraUnavailable = 2,
    kExitRegisterServer = 3,
    kExitCameraLost = 4,
};
}

int main(int argc, char** argv) {
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);

    crane::TelemetryCommandLine cli;
    std::string error;
    switch (crane::parseTelemetryCommandLine(argc, argv, crane::runtime::Circuit::Bridge, cli, error)) {
        case crane::CommandLineResult::HelpShown: return kExitOk;
        case crane::CommandLineResult::Invalid:
            std::cerr << "[ERROR] " << error << '\n';
            return kExitConfig;
        case crane::CommandLineResult::Run: break;
    }

    crane::AppConfig config;
    if (!crane::loadTelemetryConfig(cli, crane::runtime::Circuit::Bridge, config, error)) {
        std::cerr << "[ERROR] config load failed: " << error << '\n';
        return kExitConfig;
    }

    crane::CameraCalibration calibration;
    if (!config.runtime.intrinsics_file.empty() && !calibration.loadFromFile(config.runtime.intrinsics_file, error)) {
        std::cerr << "[ERROR] intrinsics load failed: " << error << '\n';
        return kExitConfig;
    }

    const auto bridge_range = crane::fieldbus::bridgeRange(static_cast<uint16_t>(config.fieldbus.bridge_base_register));
    const auto hook_range = crane::fieldbus::hookRange(static_cast<uint16_t>(config.fieldbus.hook_base_register));
    crane::fieldbus::RegisterBank bank(crane::fieldbus::registerSpaceSize(bridge_range, hook_range));
    crane::fieldbus::ModbusServer server(bank, static_cast<uint8_t>(config.fieldbus.unit_id));
    if (!server.start(config.fieldbus.host, static_cast<uint16_t>(config.fieldbus.port), error)) {
        std::cerr << "[ERROR] register server failed: " << error << '\n';
        return kExitRegisterServer;
    }
    std::cout << "[MODBUS] serving " << bank.size() << " registers on " << config.fieldbus.host << ':'
              << server.port() << " unit " << config.fieldbus.unit_id << " (bridge " << bridge_range.base
              << ".." << bridge_range.end() - 1 << ", hook " << hook_range.base << ".." << hook_range.end() - 1
              << ")\n";

    auto camera = crane::openFrameSource(config.bridge.camera, error);
    if (!camera) {
        std::cerr << "[ERROR] camera unavailable: " << error << '\n';
        server.stop();
        return kExitCameraUnavailable;
    }
    std::cout << "[INFO] bridge camera: " << camera->description() << '\n';

    crane::ArucoMarkerDetector detector;
    crane::BridgePoseEngine engine(config.bridge, calibration.intrinsics(), detector);
    crane::fieldbus::BankRegisterSink sink(bank);
    crane::ConfigWatcher watcher(cli.config_path);
    crane::Telemetry telemetry;

    std::cout << "[INFO] bridge pose running at " << config.runtime.sample_rate_hz << " Hz, direction "
              << crane::movementDirectionName(config.bridge.movement_direction) << ", "
              << config.bridge.marker_positions_m.size() << " markers\n";

    bool last_valid = false;
    int64_t last_status_ns = crane::nowSteadyNs();
    auto on_frame = [&](const crane::FramePacket& packet) {
        if (watcher.changed()) {
            crane::AppConfig reloaded;
            std::string reload_error;
            if (crane::loadTelemetryConfig(cli, crane::runtime::Circuit::Bridge, reloaded, reload_error)) {
                engine.updateConfig(reloaded.bridge);
                std::cout << "[INFO] bridge config reloaded\n";
            } else {
                std::cerr << "[WARN] config reload rejected: " << reload_error << '\n';
            }
        }

        const crane::BridgePoseSample sample = engine.process(packet);
        std::string publish_error;
        if (!crane::fieldbus::publishBridgeSample(sink, bridge_range.base, sample, publish_error)) {
            telemetry.recordPublishFailure();
            std::cerr << "[WARN] bridge publish failed: " << publish_error << '\n';
        }
        telemetry.recordFrame(sample.valid);

        if (sample.valid != last_valid) {
            std::cout << "[POSE] " << (sample.valid ? "marker " + std::to_string(sample.marker_id) + " locked"
                                                    : std::string("no confirmed marker"))
                      << '\n';
            last_valid = sample.valid;
        }

        const int64_t now_ns = crane::nowSteadyNs();
        if (now_ns - last_status_ns >= 1000000000LL) {
            const auto snap = telemetry.snapshot();
            std::cout << std::fixed << std::setprecision(3) << "[POSE] fps=" << snap.frames_per_sec
                      << " frames=" << snap.frames << " valid=" << snap.valid_samples
                      << " capture_failures=" << snap.capture_failures << " x=" << sample.x_m
                      << " y=" << sample.y_m << " id=" << sample.marker_id << " ok=" << (sample.valid ? 1 : 0)
                      << " markers=" << engine.lastObservationCount()
                      << " last_confirmed=" << engine.state().ledger.lastConfirmedId()
                      << " clients=" << server.clientCount() << '\n';
            last_status_ns = now_ns;
        }
    };

    crane::PoseLoopOptions options;
    options.sample_rate_hz = config.runtime.sample_rate_hz;
    options.max_capture_retries = config.runtime.max_capture_retries;
    options.max_frames = cli.max_frames;

    const crane::PoseLoopExit exit = crane::runPoseLoop(*camera, options, on_frame, g_running, telemetry, error);
    camera->close();
    server.stop();

    if (exit == crane::PoseLoopExit::CameraLost) {
        std::cerr << "[ERROR] camera lost: " << error << '\n';
        return kExitCameraLost;
    }
    std::cout << "[INFO] bridge pose stopped\n";
    return kExitOk;
}
