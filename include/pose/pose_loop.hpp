#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

#include "camera/frame_source.hpp"
#include "core/telemetry.hpp"
#include "core/types.hpp"

namespace crane {

constexpr double kMinSampleRateHz = 0.5;

// Consecutive transient capture failures; more than max_retries in a row
// means the camera is lost.
class CaptureRetryCounter {
public:
    explicit CaptureRetryCounter(int max_retries) : max_retries_(max_retries) {}

    // Returns true once the failure streak exceeds the retry budget.
    bool recordFailure() { return ++consecutive_ > max_retries_; }
    void recordSuccess() { consecutive_ = 0; }
    int consecutive() const { return consecutive_; }

private:
    int max_retries_;
    int consecutive_{0};
};

struct PoseLoopOptions {
    double sample_rate_hz{8.0};
    int max_capture_retries{10};
    uint64_t max_frames{0};  // 0 = until stopped
};

enum class PoseLoopExit {
    Stopped,     // running flag cleared or max_frames reached
    CameraLost,
};

using FrameHandler = std::function<void(const FramePacket&)>;

// Sequential capture -> handler loop paced to sample_rate_hz. Frames without
// markers are the handler's business; only the camera can end the loop early.
PoseLoopExit runPoseLoop(FrameSource& source, const PoseLoopOptions& options, const FrameHandler& on_frame,
                         const std::atomic<bool>& running, Telemetry& telemetry, std::string& error);

}  // namespace crane
