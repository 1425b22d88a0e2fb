#pragma once

#include <array>
#include <mutex>
#include <string>

#include "runtime/process_control.hpp"

namespace crane::runtime {

enum class OwnershipState {
    TelemetryOwns,
    Released,
    CalibrationOwns,
};

const char* ownershipStateName(OwnershipState state);

enum class ReleaseOutcome {
    Relaunched,  // telemetry is back in charge of every released circuit
    Deferred,    // another circuit is still in calibration, relaunch waits
    Failed,
};

const char* releaseOutcomeName(ReleaseOutcome outcome);

// Decides who may open each circuit's camera. Telemetry is stopped (and the
// stop confirmed) before calibration gets the camera; released circuits are
// relaunched only once no circuit has a calibration session in progress.
class CameraArbitrator {
public:
    explicit CameraArbitrator(TelemetryProcessControl& control);

    // TelemetryOwns -> Released. Idempotent; cancels a deferred relaunch.
    bool acquire(Circuit circuit, std::string& error);
    // Released -> CalibrationOwns, after the interactive side opened the camera.
    bool markCalibrationOpened(Circuit circuit, std::string& error);
    // Ends the session and relaunches telemetry when the other circuit allows it.
    ReleaseOutcome release(Circuit circuit, std::string& error);

    // Relaunches deferred circuits if no session blocks them.
    ReleaseOutcome retryDeferred(std::string& error);
    // Relaunches telemetry that died while it owned its camera.
    bool ensureTelemetryRunning(std::string& error);

    OwnershipState state(Circuit circuit) const;
    bool sessionActive(Circuit circuit) const;
    bool relaunchPending(Circuit circuit) const;
    std::string statusText() const;

private:
    struct CircuitSlot {
        OwnershipState state{OwnershipState::TelemetryOwns};
        bool session_active{false};
        bool relaunch_pending{false};
    };

    static std::size_t index(Circuit circuit) { return circuit == Circuit::Bridge ? 0U : 1U; }
    bool anySessionActiveLocked() const;
    ReleaseOutcome relaunchPendingLocked(std::string& error);

    TelemetryProcessControl& control_;
    mutable std::mutex mutex_;
    std::array<CircuitSlot, 2> slots_{};
};

}  // namespace crane::runtime
