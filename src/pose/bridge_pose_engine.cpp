#include "pose/bridge_pose_engine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace crane {

cv::Rect clampRoi(const RoiRect& roi, const cv::Size& frame_size) {
    const int x = std::clamp(roi.x, 0, std::max(0, frame_size.width));
    const int y = std::clamp(roi.y, 0, std::max(0, frame_size.height));
    const int max_w = frame_size.width - x;
    const int max_h = frame_size.height - y;
    const int w = roi.w > 0 ? std::min(roi.w, max_w) : max_w;
    const int h = roi.h > 0 ? std::min(roi.h, max_h) : max_h;
    return cv::Rect(x, y, std::max(0, w), std::max(0, h));
}

BridgePoseSample computeBridgePose(const BridgeConfig& cfg, const CameraIntrinsics& intrinsics,
                                   const std::vector<MarkerObservation>& observations, const cv::Size& frame_size,
                                   BridgeTrackingState& state) {
    std::vector<int> known_ids;
    known_ids.reserve(observations.size());
    for (const MarkerObservation& obs : observations) {
        if (cfg.marker_positions_m.count(obs.id) > 0U) {
            known_ids.push_back(obs.id);
        }
    }
    const std::vector<int> usable = state.ledger.update(known_ids);

    const double fx = intrinsics.fx();
    const double size_m = static_cast<double>(cfg.marker_size_mm) / 1000.0;
    const double center_x = static_cast<double>(frame_size.width) / 2.0;

    const MarkerObservation* best = nullptr;
    double best_offset = std::numeric_limits<double>::infinity();
    double best_z = 0.0;
    for (const MarkerObservation& obs : observations) {
        if (!std::binary_search(usable.begin(), usable.end(), obs.id)) {
            continue;
        }
        const double z = pinholeDistance(fx, size_m, markerSidePx(obs));
        if (!(z > 0.0)) {
            continue;
        }
        const double offset = static_cast<double>(markerCenter(obs).x) - center_x;
        if (std::abs(offset) < std::abs(best_offset)) {
            best = &obs;
            best_offset = offset;
            best_z = z;
        }
    }

    if (best == nullptr) {
        state.last.valid = false;
        return state.last;
    }

    const double rel_x = best_offset / fx * best_z;
    const double marker_x = cfg.marker_positions_m.at(best->id);
    double x = cfg.movement_direction == MovementDirection::Increasing ? marker_x - rel_x : marker_x + rel_x;
    x = std::max(0.0, x);

    state.last.x_m = static_cast<float>(x);
    state.last.y_m = static_cast<float>(best_z);
    state.last.marker_id = best->id;
    state.last.valid = true;
    return state.last;
}

BridgePoseEngine::BridgePoseEngine(BridgeConfig cfg, CameraIntrinsics intrinsics, MarkerDetector& detector)
    : cfg_(std::move(cfg)), intrinsics_(std::move(intrinsics)), detector_(detector) {
    state_.ledger.setThreshold(cfg_.confirm_threshold);
}

void BridgePoseEngine::updateConfig(const BridgeConfig& cfg) {
    cfg_ = cfg;
    state_.ledger.setThreshold(cfg_.confirm_threshold);
}

BridgePoseSample BridgePoseEngine::process(const FramePacket& frame) {
    const cv::Size frame_size = frame.gray.size();
    const cv::Rect roi = clampRoi(cfg_.roi, frame_size);

    std::vector<MarkerObservation> observations;
    if (roi.area() > 0) {
        observations = detector_.detect(frame.gray(roi), frame.timestamp_ns);
        const cv::Point2f origin(static_cast<float>(roi.x), static_cast<float>(roi.y));
        for (MarkerObservation& obs : observations) {
            for (cv::Point2f& p : obs.corners) {
                p += origin;
            }
        }
    }
    last_observation_count_ = observations.size();
    return computeBridgePose(cfg_, intrinsics_, observations, frame_size, state_);
}

}  // namespace crane
