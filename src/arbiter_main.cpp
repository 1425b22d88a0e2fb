#include "core/config.hpp"
#include "ipc/control_plane.hpp"
#include "ipc/runtime_paths.hpp"
#include "runtime/camera_arbitrator.hpp"
#include "runtime/liveness_record.hpp"
#include "runtime/process_control.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {
std::atomic<bool> g_running{true};

void onStopSignal(int) {
    g_running.store(false);
}

}

int main(int argc, char** argv) {
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);

    const std::string config_path = (argc > 1) ? argv[1] : "data/calibration_config.json";

    crane::AppConfig config;
    std::string error;
    if (!crane::loadConfig(config_path, config, error)) {
        std::cerr << "[ERROR] config load failed: " << error << '\n';
        return 1;
    }
    if (!crane::runtime::ensureDirectory(config.runtime.runtime_dir, error)) {
        std::cerr << "[ERROR] " << error << '\n';
        return 1;
    }

    const auto paths = crane::ipc::makeRuntimePaths(config.runtime);
    crane::runtime::RecordProcessControl control(config.runtime.runtime_dir, config.runtime.bridge_launch_command,
                                                 config.runtime.hook_launch_command, config.runtime.stop_timeout_ms);
    crane::runtime::CameraArbitrator arbitrator(control);

    // Outlives the server: closing connections on stop releases their sessions.
    crane::ipc::ArbiterSessions sessions(arbitrator);
    crane::ipc::ControlSocketServer server;
    if (!server.start(
            paths.control_socket,
            [&sessions](uint64_t connection, const std::string& line) { return sessions.handle(connection, line); },
            [&sessions](uint64_t connection) { sessions.disconnect(connection); }, error)) {
        std::cerr << "[ERROR] control socket failed: " << error << '\n';
        return 1;
    }
    std::cout << "[ARBITER] listening on " << paths.control_socket << ", records " << paths.bridge_record << ", "
              << paths.hook_record << '\n';

    if (!arbitrator.ensureTelemetryRunning(error)) {
        std::cerr << "[WARN] " << error << '\n';
    }

    int ticks = 0;
    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        if (++ticks % 10 != 0) {
            continue;
        }
        if (arbitrator.retryDeferred(error) == crane::runtime::ReleaseOutcome::Failed) {
            std::cerr << "[WARN] " << error << '\n';
        }
        if (!arbitrator.ensureTelemetryRunning(error)) {
            std::cerr << "[WARN] " << error << '\n';
        }
    }

    server.stop();
    std::cout << "[ARBITER] stopped\n";
    return 0;
}
