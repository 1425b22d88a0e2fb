#include "runtime/camera_arbitrator.hpp"

#include <iostream>
#include <sstream>

namespace crane::runtime {

const char* ownershipStateName(OwnershipState state) {
    switch (state) {
        case OwnershipState::TelemetryOwns: return "telemetry";
        case OwnershipState::Released: return "released";
        case OwnershipState::CalibrationOwns: return "calibration";
    }
    return "unknown";
}

const char* releaseOutcomeName(ReleaseOutcome outcome) {
    switch (outcome) {
        case ReleaseOutcome::Relaunched: return "relaunched";
        case ReleaseOutcome::Deferred: return "deferred";
        case ReleaseOutcome::Failed: return "failed";
    }
    return "unknown";
}

CameraArbitrator::CameraArbitrator(TelemetryProcessControl& control) : control_(control) {}

bool CameraArbitrator::acquire(Circuit circuit, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitSlot& slot = slots_[index(circuit)];
    if (slot.state == OwnershipState::TelemetryOwns) {
        if (!control_.stop(circuit, error)) {
            return false;
        }
        slot.state = OwnershipState::Released;
        std::cout << "[ARBITER] " << circuitName(circuit) << " camera released by telemetry\n";
    }
    slot.session_active = true;
    slot.relaunch_pending = false;
    error.clear();
    return true;
}

bool CameraArbitrator::markCalibrationOpened(Circuit circuit, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitSlot& slot = slots_[index(circuit)];
    if (slot.state == OwnershipState::CalibrationOwns) {
        return true;
    }
    if (slot.state != OwnershipState::Released || !slot.session_active) {
        error = std::string(circuitName(circuit)) + " camera was not acquired (state " +
                ownershipStateName(slot.state) + ")";
        return false;
    }
    slot.state = OwnershipState::CalibrationOwns;
    std::cout << "[ARBITER] " << circuitName(circuit) << " camera owned by calibration\n";
    return true;
}

ReleaseOutcome CameraArbitrator::release(Circuit circuit, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitSlot& slot = slots_[index(circuit)];
    if (slot.state == OwnershipState::TelemetryOwns && !slot.session_active) {
        return ReleaseOutcome::Relaunched;
    }
    slot.state = OwnershipState::Released;
    slot.session_active = false;
    slot.relaunch_pending = true;
    return relaunchPendingLocked(error);
}

ReleaseOutcome CameraArbitrator::retryDeferred(std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    return relaunchPendingLocked(error);
}

bool CameraArbitrator::anySessionActiveLocked() const {
    for (const CircuitSlot& slot : slots_) {
        if (slot.session_active || slot.state == OwnershipState::CalibrationOwns) {
            return true;
        }
    }
    return false;
}

ReleaseOutcome CameraArbitrator::relaunchPendingLocked(std::string& error) {
    if (anySessionActiveLocked()) {
        for (Circuit c : kAllCircuits) {
            if (slots_[index(c)].relaunch_pending) {
                std::cout << "[ARBITER] " << circuitName(c) << " relaunch deferred, other circuit in calibration\n";
            }
        }
        return ReleaseOutcome::Deferred;
    }

    ReleaseOutcome outcome = ReleaseOutcome::Relaunched;
    for (Circuit c : kAllCircuits) {
        CircuitSlot& slot = slots_[index(c)];
        if (!slot.relaunch_pending) {
            continue;
        }
        std::string launch_error;
        if (!control_.launch(c, launch_error)) {
            error = std::string(circuitName(c)) + " relaunch failed: " + launch_error;
            std::cerr << "[ARBITER] " << error << "\n";
            outcome = ReleaseOutcome::Failed;
            continue;
        }
        slot.relaunch_pending = false;
        slot.state = OwnershipState::TelemetryOwns;
        std::cout << "[ARBITER] " << circuitName(c) << " camera returned to telemetry\n";
    }
    return outcome;
}

bool CameraArbitrator::ensureTelemetryRunning(std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool ok = true;
    for (Circuit c : kAllCircuits) {
        const CircuitSlot& slot = slots_[index(c)];
        if (slot.state != OwnershipState::TelemetryOwns || slot.session_active || control_.isRunning(c)) {
            continue;
        }
        std::string launch_error;
        if (!control_.launch(c, launch_error)) {
            error = std::string(circuitName(c)) + " launch failed: " + launch_error;
            ok = false;
        }
    }
    return ok;
}

OwnershipState CameraArbitrator::state(Circuit circuit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_[index(circuit)].state;
}

bool CameraArbitrator::sessionActive(Circuit circuit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_[index(circuit)].session_active;
}

bool CameraArbitrator::relaunchPending(Circuit circuit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_[index(circuit)].relaunch_pending;
}

std::string CameraArbitrator::statusText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;
    for (Circuit c : kAllCircuits) {
        const CircuitSlot& slot = slots_[index(c)];
        oss << circuitName(c) << " owner=" << ownershipStateName(slot.state)
            << " session=" << (slot.session_active ? 1 : 0)
            << " relaunch_pending=" << (slot.relaunch_pending ? 1 : 0)
            << " telemetry_running=" << (control_.isRunning(c) ? 1 : 0) << "\n";
    }
    return oss.str();
}

}  // namespace crane::runtime
