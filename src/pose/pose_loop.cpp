#include "pose/pose_loop.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

#include "core/time_utils.hpp"

namespace crane {

namespace {

// Sleeps until deadline_ns in short slices so a stop request is honoured.
void sleepUntil(int64_t deadline_ns, const std::atomic<bool>& running) {
    constexpr int64_t kSliceNs = 50000000LL;
    while (running.load()) {
        const int64_t left = deadline_ns - nowSteadyNs();
        if (left <= 0) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::nanoseconds(std::min(left, kSliceNs)));
    }
}

}  // namespace

PoseLoopExit runPoseLoop(FrameSource& source, const PoseLoopOptions& options, const FrameHandler& on_frame,
                         const std::atomic<bool>& running, Telemetry& telemetry, std::string& error) {
    const double rate = std::max(kMinSampleRateHz, options.sample_rate_hz);
    const int64_t period_ns = static_cast<int64_t>(1e9 / rate);

    CaptureRetryCounter retries(options.max_capture_retries);
    uint64_t frames = 0;
    int frames_in_window = 0;
    int64_t window_start_ns = nowSteadyNs();
    int64_t next_tick_ns = window_start_ns;

    while (running.load()) {
        if (options.max_frames > 0U && frames >= options.max_frames) {
            break;
        }
        next_tick_ns += period_ns;

        FramePacket packet;
        std::string capture_error;
        const CaptureStatus status = source.read(packet, capture_error);
        if (status == CaptureStatus::Lost) {
            error = capture_error;
            return PoseLoopExit::CameraLost;
        }
        if (status == CaptureStatus::Transient) {
            telemetry.recordCaptureFailure();
            if (retries.recordFailure()) {
                error = "camera lost after " + std::to_string(retries.consecutive()) +
                        " consecutive capture failures: " + capture_error;
                return PoseLoopExit::CameraLost;
            }
            std::cerr << "[WARN] capture failed (" << retries.consecutive() << "/" << options.max_capture_retries
                      << "): " << capture_error << "\n";
        } else {
            retries.recordSuccess();
            on_frame(packet);
            ++frames;
            ++frames_in_window;
        }

        const int64_t now_ns = nowSteadyNs();
        if (now_ns - window_start_ns >= 1000000000LL) {
            telemetry.setFramesPerSec(frames_in_window);
            frames_in_window = 0;
            window_start_ns = now_ns;
        }
        if (next_tick_ns < now_ns) {
            // Overran the period, do not try to catch up.
            next_tick_ns = now_ns;
        }
        sleepUntil(next_tick_ns, running);
    }
    error.clear();
    return PoseLoopExit::Stopped;
}

}  // namespace crane
