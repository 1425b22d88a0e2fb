#include "runtime/calibration_session.hpp"

#include <iostream>
#include <utility>

namespace crane::runtime {

CalibrationSession::CalibrationSession(CameraArbitrator& arbitrator, Circuit circuit, CameraOpener opener)
    : arbitrator_(arbitrator), circuit_(circuit), opener_(std::move(opener)) {}

CalibrationSession::~CalibrationSession() {
    close();
}

bool CalibrationSession::tick(FramePacket& out, std::string& error) {
    if (!acquired_) {
        if (!arbitrator_.acquire(circuit_, error)) {
            return false;
        }
        acquired_ = true;
    }
    if (camera_ == nullptr) {
        if (!opener_) {
            error = "no camera opener";
            return false;
        }
        camera_ = opener_(circuit_, error);
        if (camera_ == nullptr) {
            return false;
        }
        if (!arbitrator_.markCalibrationOpened(circuit_, error)) {
            camera_->close();
            camera_.reset();
            return false;
        }
    }
    return camera_->read(out, error) == CaptureStatus::Ok;
}

void CalibrationSession::close() {
    if (camera_ != nullptr) {
        camera_->close();
        camera_.reset();
    }
    if (!acquired_) {
        return;
    }
    acquired_ = false;
    std::string error;
    last_release_ = arbitrator_.release(circuit_, error);
    if (last_release_ == ReleaseOutcome::Failed) {
        std::cerr << "[ARBITER] " << circuitName(circuit_) << " release failed: " << error << "\n";
    }
}

}  // namespace crane::runtime
