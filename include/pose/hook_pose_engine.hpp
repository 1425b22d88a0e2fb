#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "camera/camera_calibration.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "pose/marker_detector.hpp"

namespace crane {

// Slant distance to the target marker and pixel deviation of its center from
// the frame center. When the target is absent the previous values are
// returned with valid=false.
HookPoseSample computeHookPose(const HookConfig& cfg, const CameraIntrinsics& intrinsics,
                               const std::vector<MarkerObservation>& observations, const cv::Size& frame_size,
                               const HookPoseSample& previous);

class HookPoseEngine {
public:
    HookPoseEngine(HookConfig cfg, CameraIntrinsics intrinsics, MarkerDetector& detector);

    HookPoseSample process(const FramePacket& frame);
    void updateConfig(const HookConfig& cfg) { cfg_ = cfg; }

    const HookConfig& config() const { return cfg_; }
    const HookPoseSample& last() const { return last_; }

private:
    HookConfig cfg_;
    CameraIntrinsics intrinsics_;
    MarkerDetector& detector_;
    HookPoseSample last_;
};

}  // namespace crane
