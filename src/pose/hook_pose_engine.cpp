#include "pose/hook_pose_engine.hpp"

#include <cmath>
#include <utility>

#include <opencv2/calib3d.hpp>

namespace crane {

namespace {

// Normalized image coordinates of a pixel, distortion removed when the
// coefficients allow it.
cv::Point2d normalizedPoint(const CameraIntrinsics& intrinsics, const cv::Point2f& px) {
    const std::vector<cv::Point2f> src{px};
    std::vector<cv::Point2f> dst;
    try {
        cv::undistortPoints(src, dst, intrinsics.K, intrinsics.D);
        if (dst.size() == 1U) {
            return cv::Point2d(dst[0].x, dst[0].y);
        }
    } catch (const cv::Exception&) {
        // Unsupported coefficient count, fall through to the pinhole model.
    }
    return cv::Point2d((px.x - intrinsics.cx()) / intrinsics.fx(), (px.y - intrinsics.cy()) / intrinsics.fy());
}

}  // namespace

HookPoseSample computeHookPose(const HookConfig& cfg, const CameraIntrinsics& intrinsics,
                               const std::vector<MarkerObservation>& observations, const cv::Size& frame_size,
                               const HookPoseSample& previous) {
    const MarkerObservation* target = nullptr;
    double target_side = 0.0;
    for (const MarkerObservation& obs : observations) {
        if (obs.id != cfg.marker_id) {
            continue;
        }
        const double side = markerSidePx(obs);
        if (side > target_side) {
            target = &obs;
            target_side = side;
        }
    }

    const double z = pinholeDistance(intrinsics.fx(), static_cast<double>(cfg.marker_size_mm) / 1000.0, target_side);
    if (target == nullptr || !(z > 0.0)) {
        HookPoseSample out = previous;
        out.marker_id = cfg.marker_id;
        out.valid = false;
        return out;
    }

    const cv::Point2f center = markerCenter(*target);
    const cv::Point2d n = normalizedPoint(intrinsics, center);

    HookPoseSample out;
    out.distance_m = static_cast<float>(z * std::sqrt(1.0 + n.x * n.x + n.y * n.y));
    out.deviation_x_px = center.x - static_cast<float>(frame_size.width) / 2.0F;
    out.deviation_y_px = center.y - static_cast<float>(frame_size.height) / 2.0F;
    out.marker_id = target->id;
    out.valid = true;
    return out;
}

HookPoseEngine::HookPoseEngine(HookConfig cfg, CameraIntrinsics intrinsics, MarkerDetector& detector)
    : cfg_(std::move(cfg)), intrinsics_(std::move(intrinsics)), detector_(detector) {}

HookPoseSample HookPoseEngine::process(const FramePacket& frame) {
    const std::vector<MarkerObservation> observations = detector_.detect(frame.gray, frame.timestamp_ns);
    last_ = computeHookPose(cfg_, intrinsics_, observations, frame.gray.size(), last_);
    return last_;
}

}  // namespace crane
