#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "camera/camera_calibration.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "pose/confirmation_ledger.hpp"
#include "pose/marker_detector.hpp"

namespace crane {

// Everything the bridge circuit carries from one frame to the next.
struct BridgeTrackingState {
    ConfirmationLedger ledger;
    BridgePoseSample last;
};

// ROI clamped to the frame; a zero width or height extends to the edge.
cv::Rect clampRoi(const RoiRect& roi, const cv::Size& frame_size);

// One bridge sample from full-frame observations. Among the confirmed
// markers the one nearest the image center wins. Without one the previous
// sample's values are returned with valid=false.
BridgePoseSample computeBridgePose(const BridgeConfig& cfg, const CameraIntrinsics& intrinsics,
                                   const std::vector<MarkerObservation>& observations, const cv::Size& frame_size,
                                   BridgeTrackingState& state);

class BridgePoseEngine {
public:
    BridgePoseEngine(BridgeConfig cfg, CameraIntrinsics intrinsics, MarkerDetector& detector);

    BridgePoseSample process(const FramePacket& frame);

    // Hot reload. The ledger survives.
    void updateConfig(const BridgeConfig& cfg);

    const BridgeConfig& config() const { return cfg_; }
    const BridgeTrackingState& state() const { return state_; }
    std::size_t lastObservationCount() const { return last_observation_count_; }

private:
    BridgeConfig cfg_;
    CameraIntrinsics intrinsics_;
    MarkerDetector& detector_;
    BridgeTrackingState state_;
    std::size_t last_observation_count_{0};
};

}  // namespace crane
