#include "core/telemetry.hpp"

namespace crane {

void Telemetry::recordFrame(bool valid_sample) {
    frames_.fetch_add(1U);
    if (valid_sample) {
        valid_samples_.fetch_add(1U);
    }
}

void Telemetry::recordCaptureFailure() { capture_failures_.fetch_add(1U); }
void Telemetry::recordPublishFailure() { publish_failures_.fetch_add(1U); }
void Telemetry::setFramesPerSec(int value) { frames_per_sec_.store(value); }

TelemetrySnapshot Telemetry::snapshot() const {
    return TelemetrySnapshot{
        frames_.load(),
        valid_samples_.load(),
        capture_failures_.load(),
        publish_failures_.load(),
        frames_per_sec_.load()};
}

}  // namespace crane
