#include "core/config.hpp"
#include "fieldbus/modbus_client.hpp"
#include "fieldbus/pose_publisher.hpp"
#include "ipc/control_plane.hpp"
#include "ipc/runtime_paths.hpp"
#include "runtime/liveness_record.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_holding{true};

void onStopSignal(int) {
    g_holding.store(false);
}

void printUsage() {
    std::cerr << "usage: crane_ctl <command> [circuit] [config_path]\n"
                 "  status | release <circuit>                                      arbiter requests\n"
                 "  acquire <circuit>         take the camera for calibration until Ctrl-C\n"
                 "  records                                                         liveness records\n"
                 "  registers                                                       read pose registers\n";
}

int printRegisters(const crane::AppConfig& cfg) {
    crane::fieldbus::ModbusClient client(static_cast<uint8_t>(cfg.fieldbus.unit_id));
    std::string err;
    if (!client.connect(cfg.fieldbus.host, static_cast<uint16_t>(cfg.fieldbus.port), cfg.fieldbus.connect_timeout_ms,
                        err)) {
        std::cerr << "register server unreachable: " << err << "\n";
        return 1;
    }
    crane::fieldbus::PoseSnapshot snap;
    if (!crane::fieldbus::readPoseSnapshot(client, static_cast<uint16_t>(cfg.fieldbus.bridge_base_register),
                                           static_cast<uint16_t>(cfg.fieldbus.hook_base_register), snap, err)) {
        std::cerr << "register read failed: " << err << "\n";
        return 1;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);
    oss << "bridge x_m=" << snap.bridge.x_m << " y_m=" << snap.bridge.y_m << " marker=" << snap.bridge.marker_id
        << " valid=" << (snap.bridge.valid ? 1 : 0) << "\n";
    oss << "hook distance_m=" << snap.hook.distance_m << " dev_x_px=" << snap.hook.deviation_x_px
        << " dev_y_px=" << snap.hook.deviation_y_px << " marker=" << snap.hook.marker_id
        << " valid=" << (snap.hook.valid ? 1 : 0) << "\n";
    std::cout << oss.str();
    return 0;
}

void printRecord(const std::string& name, const std::string& path) {
    crane::runtime::LivenessRecord rec;
    std::string err;
    if (!crane::runtime::readLivenessRecord(path, rec, err)) {
        std::cout << name << " not running (" << err << ")\n";
        return;
    }
    std::cout << name << " supervisor_pid=" << rec.supervisor_pid
              << " alive=" << crane::runtime::isProcessAlive(rec.supervisor_pid) << " child_pid=" << rec.child_pid
              << " alive=" << crane::runtime::isProcessAlive(rec.child_pid) << " restarts=" << rec.restarts
              << " updated_unix_ms=" << rec.updated_unix_ms << "\n";
}

// Acquires the circuit on a connection kept open until SIGINT/SIGTERM, then
// releases it. If this process dies the arbiter releases it on disconnect.
int holdCircuit(const std::string& socket_path, crane::runtime::Circuit circuit) {
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);

    crane::ipc::ControlConnection connection;
    std::string err;
    if (!connection.connect(socket_path, err)) {
        std::cerr << "control request failed: " << err << "\n";
        return 1;
    }
    crane::ipc::ArbiterRequest req;
    req.circuit = circuit;
    std::string reply;
    for (crane::ipc::ArbiterVerb verb : {crane::ipc::ArbiterVerb::Acquire, crane::ipc::ArbiterVerb::Opened}) {
        req.verb = verb;
        if (!connection.request(crane::ipc::formatArbiterRequest(req), reply, err)) {
            std::cerr << "control request failed: " << err << "\n";
            return 1;
        }
        std::cout << reply;
        if (reply.rfind("OK", 0) != 0) {
            return 1;
        }
    }

    std::cout << "[INFO] holding " << crane::runtime::circuitName(circuit) << " camera, Ctrl-C to release\n";
    while (g_holding.load()) {
        if (connection.peerClosed()) {
            std::cerr << "[WARN] arbiter closed the connection\n";
            return 1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    req.verb = crane::ipc::ArbiterVerb::Release;
    if (!connection.request(crane::ipc::formatArbiterRequest(req), reply, err)) {
        std::cerr << "control request failed: " << err << "\n";
        return 1;
    }
    std::cout << reply;
    return reply.rfind("OK", 0) == 0 ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];
    const bool takes_circuit = command == "acquire" || command == "opened" || command == "release";
    const int config_arg = takes_circuit ? 3 : 2;
    const std::string config_path = (argc > config_arg) ? argv[config_arg] : "data/calibration_config.json";

    crane::AppConfig cfg;
    std::string err;
    if (!crane::loadConfig(config_path, cfg, err)) {
        std::cerr << "config load failed: " << err << "\n";
        return 1;
    }

    if (command == "registers") {
        return printRegisters(cfg);
    }

    const auto paths = crane::ipc::makeRuntimePaths(cfg.runtime);
    if (command == "records") {
        printRecord("bridge", paths.bridge_record);
        printRecord("hook", paths.hook_record);
        return 0;
    }

    crane::ipc::ArbiterRequest request;
    std::string line = command;
    if (takes_circuit && argc > 2) {
        line += std::string(" ") + argv[2];
    }
    if (!crane::ipc::parseArbiterRequest(line, request, err)) {
        std::cerr << err << "\n";
        printUsage();
        return 1;
    }
    if (request.verb == crane::ipc::ArbiterVerb::Acquire) {
        return holdCircuit(paths.control_socket, request.circuit);
    }
    std::string response;
    if (!crane::ipc::sendControlRequest(paths.control_socket, crane::ipc::formatArbiterRequest(request), response,
                                        err)) {
        std::cerr << "control request failed: " << err << "\n";
        return 1;
    }
    std::cout << response;
    return response.rfind("OK", 0) == 0 ? 0 : 1;
}
