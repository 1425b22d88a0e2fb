#include "runtime/process_control.hpp"

#include <chrono>
#include <iostream>
#include <thread>
#include <utility>

#include "core/time_utils.hpp"
#include "runtime/liveness_record.hpp"

namespace crane::runtime {

const char* circuitName(Circuit circuit) {
    return circuit == Circuit::Bridge ? "bridge" : "hook";
}

bool parseCircuit(const std::string& text, Circuit& out) {
    if (text == "bridge") {
        out = Circuit::Bridge;
    } else if (text == "hook") {
        out = Circuit::Hook;
    } else {
        return false;
    }
    return true;
}

RecordProcessControl::RecordProcessControl(std::string runtime_dir, std::string bridge_command,
                                           std::string hook_command, int stop_timeout_ms)
    : runtime_dir_(std::move(runtime_dir)),
      bridge_command_(std::move(bridge_command)),
      hook_command_(std::move(hook_command)),
      stop_timeout_ms_(stop_timeout_ms) {}

std::string RecordProcessControl::recordPath(Circuit circuit) const {
    return livenessRecordPath(runtime_dir_, circuitName(circuit));
}

bool RecordProcessControl::stop(Circuit circuit, std::string& error) {
    const std::string path = recordPath(circuit);
    int& spawned = spawned_pids_[slot(circuit)];

    // A supervisor we launched may not have written its record yet; it
    // terminates its own child on SIGTERM.
    if (spawned > 0 && isProcessAlive(spawned)) {
        LivenessRecord current;
        std::string read_error;
        const bool reported = readLivenessRecord(path, current, read_error) && current.supervisor_pid == spawned;
        if (!reported) {
            if (!terminateProcess(spawned, stop_timeout_ms_, error)) {
                error = std::string(circuitName(circuit)) + " starting supervisor: " + error;
                return false;
            }
            std::cout << "[ARBITER] " << circuitName(circuit) << " supervisor " << spawned
                      << " stopped before it reported\n";
        }
    }
    spawned = -1;

    if (!livenessRecordExists(path)) {
        return true;
    }
    LivenessRecord record;
    if (!readLivenessRecord(path, record, error)) {
        return false;
    }

    // Supervisor first so it cannot relaunch the child behind our back.
    if (!terminateProcess(record.supervisor_pid, stop_timeout_ms_, error)) {
        error = std::string(circuitName(circuit)) + " supervisor: " + error;
        return false;
    }
    if (!terminateProcess(record.child_pid, stop_timeout_ms_, error)) {
        error = std::string(circuitName(circuit)) + " telemetry: " + error;
        return false;
    }
    removeLivenessRecord(path);
    std::cout << "[ARBITER] " << circuitName(circuit) << " telemetry stopped (supervisor " << record.supervisor_pid
              << ", child " << record.child_pid << ")\n";
    return true;
}

bool RecordProcessControl::waitForRecord(Circuit circuit, int supervisor_pid, std::string& error) const {
    const std::string path = recordPath(circuit);
    const int64_t deadline = nowSteadyNs() + static_cast<int64_t>(stop_timeout_ms_) * 1000000LL;
    while (true) {
        LivenessRecord record;
        std::string read_error;
        if (readLivenessRecord(path, record, read_error) && record.supervisor_pid == supervisor_pid) {
            return true;
        }
        if (!isProcessAlive(supervisor_pid)) {
            error = std::string(circuitName(circuit)) + " supervisor " + std::to_string(supervisor_pid) +
                    " exited before writing " + path;
            return false;
        }
        if (nowSteadyNs() >= deadline) {
            error = std::string(circuitName(circuit)) + " supervisor " + std::to_string(supervisor_pid) +
                    " wrote no record within " + std::to_string(stop_timeout_ms_) + " ms";
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

bool RecordProcessControl::launch(Circuit circuit, std::string& error) {
    if (isRunning(circuit)) {
        return true;
    }
    const std::string& command = circuit == Circuit::Bridge ? bridge_command_ : hook_command_;
    const auto argv = splitCommandLine(command);
    if (argv.empty()) {
        error = std::string("no launch command configured for ") + circuitName(circuit);
        return false;
    }
    int pid = -1;
    if (!spawnDetached(argv, pid, error)) {
        return false;
    }
    spawned_pids_[slot(circuit)] = pid;
    if (!waitForRecord(circuit, pid, error)) {
        return false;
    }
    std::cout << "[ARBITER] " << circuitName(circuit) << " supervisor launched, pid " << pid << "\n";
    return true;
}

bool RecordProcessControl::isRunning(Circuit circuit) const {
    const int spawned = spawned_pids_[slot(circuit)];
    if (spawned > 0 && isProcessAlive(spawned)) {
        return true;
    }
    LivenessRecord record;
    std::string error;
    return readLivenessRecord(recordPath(circuit), record, error) && isProcessAlive(record.supervisor_pid);
}

}  // namespace crane::runtime
