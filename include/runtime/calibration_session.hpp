#pragma once

#include <functional>
#include <memory>
#include <string>

#include "camera/frame_source.hpp"
#include "core/types.hpp"
#include "runtime/camera_arbitrator.hpp"

namespace crane::runtime {

using CameraOpener = std::function<std::unique_ptr<FrameSource>(Circuit circuit, std::string& error)>;

// Interactive calibration access to one circuit's camera. The first tick
// takes the camera away from telemetry; close() or destruction (the channel
// going away) hands it back.
class CalibrationSession {
public:
    CalibrationSession(CameraArbitrator& arbitrator, Circuit circuit, CameraOpener opener);
    ~CalibrationSession();

    CalibrationSession(const CalibrationSession&) = delete;
    CalibrationSession& operator=(const CalibrationSession&) = delete;

    // Acquires and opens on first use, then reads one frame. A failed open
    // keeps the circuit acquired so the next tick retries.
    bool tick(FramePacket& out, std::string& error);
    void close();

    bool isOpen() const { return camera_ != nullptr; }
    Circuit circuit() const { return circuit_; }
    ReleaseOutcome lastReleaseOutcome() const { return last_release_; }

private:
    CameraArbitrator& arbitrator_;
    Circuit circuit_;
    CameraOpener opener_;
    std::unique_ptr<FrameSource> camera_;
    bool acquired_{false};
    ReleaseOutcome last_release_{ReleaseOutcome::Relaunched};
};

}  // namespace crane::runtime
