#include "camera/camera_calibration.hpp"
#include "camera/frame_source.hpp"
#include "core/command_line.hpp"
#include "core/config.hpp"
#include "core/config_watcher.hpp"
#include "core/telemetry.hpp"
#include "core/time_utils.hpp"
#include "fieldbus/pose_publisher.hpp"
#include "fieldbus/register_codec.hpp"
#include "pose/hook_pose_engine.hpp"
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
    kExitCameraLost = 4,
};
}

int main(int argc, char** argv) {
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);

    crane::TelemetryCommandLine cli;
    std::string error;
    switch (crane::parseTelemetryCommandLine(argc, argv, crane::runtime::Circuit::Hook, cli, error)) {
        case crane::CommandLineResult::HelpShown: return kExitOk;
        case crane::CommandLineResult::Invalid:
            std::cerr << "[ERROR] " << error << '\n';
            return kExitConfig;
        case crane::CommandLineResult::Run: break;
    }

    crane::AppConfig config;
    if (!crane::loadTelemetryConfig(cli, crane::runtime::Circuit::Hook, config, error)) {
        std::cerr << "[ERROR] config load failed: " << error << '\n';
        return kExitConfig;
    }

    crane::CameraCalibration calibration;
    if (!config.runtime.intrinsics_file.empty() && !calibration.loadFromFile(config.runtime.intrinsics_file, error)) {
        std::cerr << "[ERROR] intrinsics load failed: " << error << '\n';
        return kExitConfig;
    }

    auto camera = crane::openFrameSource(config.hook.camera, error);
    if (!camera) {
        std::cerr << "[ERROR] camera unavailable: " << error << '\n';
        return kExitCameraUnavailable;
    }
    std::cout << "[INFO] hook camera: " << camera->description() << '\n';

    const uint16_t hook_base = static_cast<uint16_t>(config.fieldbus.hook_base_register);
    crane::fieldbus::RemoteRegisterSink sink(config.fieldbus.host, static_cast<uint16_t>(config.fieldbus.port),
                                             static_cast<uint8_t>(config.fieldbus.unit_id),
                                             config.fieldbus.connect_timeout_ms, config.fieldbus.reconnect_min_ms,
                                             config.fieldbus.reconnect_max_ms);
    std::cout << "[MODBUS] hook writes " << hook_base << ".." << hook_base + crane::fieldbus::kHookRegisterCount - 1 << " on " << config.fieldbus.host
              << ':' << config.fieldbus.port << " unit " << config.fieldbus.unit_id << '\n';

    crane::ArucoMarkerDetector detector;
    crane::HookPoseEngine engine(config.hook, calibration.intrinsics(), detector);
    crane::ConfigWatcher watcher(cli.config_path);
    crane::Telemetry telemetry;

    bool last_valid = false;
    crane::fieldbus::PublishLinkMonitor link;
    int64_t last_status_ns = crane::nowSteadyNs();
    auto on_frame = [&](const crane::FramePacket& packet) {
        if (watcher.changed()) {
            crane::AppConfig reloaded;
            std::string reload_error;
            if (crane::loadTelemetryConfig(cli, crane::runtime::Circuit::Hook, reloaded, reload_error)) {
                engine.updateConfig(reloaded.hook);
                std::cout << "[INFO] hook config reloaded, target marker " << reloaded.hook.marker_id << '\n';
            } else {
                std::cerr << "[WARN] config reload rejected: " << reload_error << '\n';
            }
        }

        const crane::HookPoseSample sample = engine.process(packet);
        std::string publish_error;
        const bool published = crane::fieldbus::publishHookSample(sink, hook_base, sample, publish_error);
        if (!published) {
            telemetry.recordPublishFailure();
        }
        const uint64_t failed_frames = link.failuresSinceDown();
        switch (link.update(published)) {
        case crane::fieldbus::PublishLinkMonitor::Change::Up:
            std::cout << "[MODBUS] publishing to register server";
            if (failed_frames > 0U) {
                std::cout << " again after " << failed_frames << " failed frames";
            }
            std::cout << '\n';
            break;
        case crane::fieldbus::PublishLinkMonitor::Change::Down:
            std::cerr << "[WARN] register server link down: " << publish_error << '\n';
            break;
        case crane::fieldbus::PublishLinkMonitor::Change::None:
            break;
        }
        telemetry.recordFrame(sample.valid);

        if (sample.valid != last_valid) {
            std::cout << "[HOOK] " << (sample.valid ? "marker " + std::to_string(sample.marker_id) + " found"
                                                    : std::string("marker lost"))
                      << '\n';
            last_valid = sample.valid;
        }

        const int64_t now_ns = crane::nowSteadyNs();
        if (now_ns - last_status_ns >= 1000000000LL) {
            const auto snap = telemetry.snapshot();
            std::cout << std::fixed << std::setprecision(3) << "[HOOK] fps=" << snap.frames_per_sec
                      << " frames=" << snap.frames << " valid=" << snap.valid_samples
                      << " capture_failures=" << snap.capture_failures
                      << " publish_failures=" << snap.publish_failures << " d=" << sample.distance_m
                      << " dx=" << sample.deviation_x_px << " dy=" << sample.deviation_y_px
                      << " id=" << sample.marker_id << " ok=" << (sample.valid ? 1 : 0) << '\n';
            last_status_ns = now_ns;
        }
    };

    crane::PoseLoopOptions options;
    options.sample_rate_hz = config.runtime.sample_rate_hz;
    options.max_capture_retries = config.runtime.max_capture_retries;
    options.max_frames = cli.max_frames;

    const crane::PoseLoopExit exit = crane::runPoseLoop(*camera, options, on_frame, g_running, telemetry, error);
    camera->close();

    if (exit == crane::PoseLoopExit::CameraLost) {
        std::cerr << "[ERROR] camera lost: " << error << '\n';
        return kExitCameraLost;
    }
    std::cout << "[INFO] hook pose stopped\n";
    return kExitOk;
}
