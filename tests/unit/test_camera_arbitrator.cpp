#include "runtime/calibration_session.hpp"
#include "runtime/camera_arbitrator.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using crane::runtime::Circuit;
using crane::runtime::OwnershipState;
using crane::runtime::ReleaseOutcome;

class FakeControl : public crane::runtime::TelemetryProcessControl {
public:
    bool stop(Circuit circuit, std::string& error) override {
        log.push_back(std::string("stop:") + crane::runtime::circuitName(circuit));
        if (fail_stop) {
            error = "stop refused";
            return false;
        }
        running[index(circuit)] = false;
        return true;
    }
    bool launch(Circuit circuit, std::string&) override {
        log.push_back(std::string("launch:") + crane::runtime::circuitName(circuit));
        running[index(circuit)] = true;
        return true;
    }
    bool isRunning(Circuit circuit) const override { return running[index(circuit)]; }

    static std::size_t index(Circuit c) { return c == Circuit::Bridge ? 0U : 1U; }

    bool running[2]{true, true};
    bool fail_stop{false};
    std::vector<std::string> log;
};

class StillSource : public crane::FrameSource {
public:
    crane::CaptureStatus read(crane::FramePacket& out, std::string&) override {
        out.gray = cv::Mat::zeros(4, 4, CV_8UC1);
        return crane::CaptureStatus::Ok;
    }
    void close() override { open_ = false; }
    bool isOpen() const override { return open_; }
    std::string description() const override { return "still"; }

private:
    bool open_{true};
};

}  // namespace

int main() {
    std::string err;

    // Single circuit: stop, calibrate, release, relaunch.
    {
        FakeControl control;
        crane::runtime::CameraArbitrator arb(control);
        if (!arb.acquire(Circuit::Hook, err) || arb.state(Circuit::Hook) != OwnershipState::Released ||
            control.isRunning(Circuit::Hook)) {
            std::cerr << "acquire should stop hook telemetry\n";
            return 1;
        }
        if (!arb.acquire(Circuit::Hook, err) || control.log.size() != 1U) {
            std::cerr << "second acquire should not stop again\n";
            return 1;
        }
        if (!arb.markCalibrationOpened(Circuit::Hook, err) ||
            arb.state(Circuit::Hook) != OwnershipState::CalibrationOwns) {
            std::cerr << "opened should hand the camera to calibration\n";
            return 1;
        }
        if (arb.release(Circuit::Hook, err) != ReleaseOutcome::Relaunched ||
            arb.state(Circuit::Hook) != OwnershipState::TelemetryOwns || !control.isRunning(Circuit::Hook)) {
            std::cerr << "release should relaunch hook telemetry\n";
            return 1;
        }
        if (arb.state(Circuit::Bridge) != OwnershipState::TelemetryOwns || !control.isRunning(Circuit::Bridge)) {
            std::cerr << "bridge should be untouched\n";
            return 1;
        }
        if (arb.markCalibrationOpened(Circuit::Bridge, err)) {
            std::cerr << "opening without acquire should fail\n";
            return 1;
        }
    }

    // Both circuits: the first release waits for the second.
    {
        FakeControl control;
        crane::runtime::CameraArbitrator arb(control);
        arb.acquire(Circuit::Bridge, err);
        arb.acquire(Circuit::Hook, err);
        arb.markCalibrationOpened(Circuit::Bridge, err);
        arb.markCalibrationOpened(Circuit::Hook, err);

        if (arb.release(Circuit::Bridge, err) != ReleaseOutcome::Deferred || control.isRunning(Circuit::Bridge) ||
            !arb.relaunchPending(Circuit::Bridge)) {
            std::cerr << "bridge relaunch should wait for the hook session\n";
            return 1;
        }
        if (arb.retryDeferred(err) != ReleaseOutcome::Deferred) {
            std::cerr << "retry should still defer while hook is in calibration\n";
            return 1;
        }
        if (arb.release(Circuit::Hook, err) != ReleaseOutcome::Relaunched || !control.isRunning(Circuit::Bridge) ||
            !control.isRunning(Circuit::Hook)) {
            std::cerr << "last release should relaunch both circuits\n";
            return 1;
        }
        if (arb.relaunchPending(Circuit::Bridge) || arb.relaunchPending(Circuit::Hook)) {
            std::cerr << "no relaunch should remain pending\n";
            return 1;
        }
    }

    // Re-acquiring a deferred circuit cancels its relaunch.
    {
        FakeControl control;
        crane::runtime::CameraArbitrator arb(control);
        arb.acquire(Circuit::Bridge, err);
        arb.acquire(Circuit::Hook, err);
        arb.release(Circuit::Bridge, err);
        arb.acquire(Circuit::Bridge, err);
        if (arb.relaunchPending(Circuit::Bridge) || !arb.sessionActive(Circuit::Bridge)) {
            std::cerr << "re-acquire should cancel the pending relaunch\n";
            return 1;
        }
    }

    // A refused stop leaves telemetry in charge.
    {
        FakeControl control;
        control.fail_stop = true;
        crane::runtime::CameraArbitrator arb(control);
        if (arb.acquire(Circuit::Bridge, err) || arb.state(Circuit::Bridge) != OwnershipState::TelemetryOwns ||
            err.find("stop refused") == std::string::npos) {
            std::cerr << "failed stop should keep telemetry ownership\n";
            return 1;
        }
    }

    // Telemetry that died on its own is relaunched, calibration circuits are not.
    {
        FakeControl control;
        crane::runtime::CameraArbitrator arb(control);
        arb.acquire(Circuit::Hook, err);
        control.running[0] = false;
        if (!arb.ensureTelemetryRunning(err) || !control.isRunning(Circuit::Bridge) ||
            control.isRunning(Circuit::Hook)) {
            std::cerr << "ensureTelemetryRunning should relaunch only bridge\n";
            return 1;
        }
        if (arb.statusText().find("hook owner=released session=1") == std::string::npos) {
            std::cerr << "status text mismatch:\n" << arb.statusText();
            return 1;
        }
    }

    // Session teardown releases the camera.
    {
        FakeControl control;
        crane::runtime::CameraArbitrator arb(control);
        int opened = 0;
        {
            crane::runtime::CalibrationSession session(
                arb, Circuit::Bridge, [&opened](Circuit, std::string&) -> std::unique_ptr<crane::FrameSource> {
                    ++opened;
                    return std::make_unique<StillSource>();
                });
            crane::FramePacket frame;
            if (!session.tick(frame, err) || !session.isOpen() || frame.gray.empty()) {
                std::cerr << "session tick should open and read: " << err << "\n";
                return 1;
            }
            session.tick(frame, err);
            if (opened != 1 || arb.state(Circuit::Bridge) != OwnershipState::CalibrationOwns) {
                std::cerr << "session should open the camera once\n";
                return 1;
            }
        }
        if (arb.state(Circuit::Bridge) != OwnershipState::TelemetryOwns || !control.isRunning(Circuit::Bridge)) {
            std::cerr << "destroyed session should return the camera to telemetry\n";
            return 1;
        }
    }

    return 0;
}
