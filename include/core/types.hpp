#pragma once

#include <array>
#include <cstdint>

#include <opencv2/core.hpp>

namespace crane {

struct FramePacket {
    int64_t timestamp_ns{0};
    cv::Mat raw_bgr;
    cv::Mat gray;
};

// One detected marker in one frame. Corners are in full-frame pixel
// coordinates, clockwise from the top-left corner of the printed pattern.
struct MarkerObservation {
    int id{-1};
    std::array<cv::Point2f, 4> corners{};
    int64_t timestamp_ns{0};
};

struct BridgePoseSample {
    float x_m{0.0F};
    float y_m{0.0F};
    int marker_id{-1};
    bool valid{false};
};

struct HookPoseSample {
    float distance_m{0.0F};
    float deviation_x_px{0.0F};
    float deviation_y_px{0.0F};
    int marker_id{-1};
    bool valid{false};
};

}  // namespace crane
