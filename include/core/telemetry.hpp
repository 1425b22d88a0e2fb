#pragma once

#include <atomic>
#include <cstdint>

namespace crane {

struct TelemetrySnapshot {
    uint64_t frames{0};
    uint64_t valid_samples{0};
    uint64_t capture_failures{0};
    uint64_t publish_failures{0};
    int frames_per_sec{0};
};

// Per-process counters read by the once-per-second status line.
class Telemetry {
public:
    void recordFrame(bool valid_sample);
    void recordCaptureFailure();
    void recordPublishFailure();
    void setFramesPerSec(int value);

    TelemetrySnapshot snapshot() const;

private:
    std::atomic<uint64_t> frames_{0};
    std::atomic<uint64_t> valid_samples_{0};
    std::atomic<uint64_t> capture_failures_{0};
    std::atomic<uint64_t> publish_failures_{0};
    std::atomic<int> frames_per_sec_{0};
};

}  // namespace crane
