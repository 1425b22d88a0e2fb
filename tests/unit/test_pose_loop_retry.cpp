#include "pose/pose_loop.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <string>
#include <utility>

namespace {

// Scripted source: 'o' ok, 't' transient, 'l' lost; repeats the last entry.
class ScriptSource : public crane::FrameSource {
public:
    explicit ScriptSource(std::string script) : script_(std::move(script)) {}

    crane::CaptureStatus read(crane::FramePacket& out, std::string& error) override {
        const char c = script_[std::min(pos_, script_.size() - 1U)];
        ++pos_;
        if (c == 'l') {
            error = "gone";
            return crane::CaptureStatus::Lost;
        }
        if (c == 't') {
            error = "late frame";
            return crane::CaptureStatus::Transient;
        }
        out.gray = cv::Mat::zeros(8, 8, CV_8UC1);
        return crane::CaptureStatus::Ok;
    }
    void close() override {}
    bool isOpen() const override { return true; }
    std::string description() const override { return "script"; }

private:
    std::string script_;
    std::size_t pos_{0};
};

}  // namespace

int main() {
    crane::CaptureRetryCounter counter(3);
    if (counter.recordFailure() || counter.recordFailure() || counter.recordFailure()) {
        std::cerr << "three failures should stay within a budget of three\n";
        return 1;
    }
    if (!counter.recordFailure() || counter.consecutive() != 4) {
        std::cerr << "the fourth consecutive failure should exhaust the budget\n";
        return 1;
    }
    counter.recordSuccess();
    if (counter.consecutive() != 0 || counter.recordFailure()) {
        std::cerr << "success should reset the streak\n";
        return 1;
    }

    std::atomic<bool> running{true};
    crane::PoseLoopOptions options;
    options.sample_rate_hz = 200.0;
    options.max_capture_retries = 2;

    // Interleaved failures never exhaust the budget.
    {
        ScriptSource source("ttotto");
        crane::Telemetry telemetry;
        options.max_frames = 3;
        int frames = 0;
        std::string err;
        const crane::PoseLoopExit exit = crane::runPoseLoop(
            source, options, [&frames](const crane::FramePacket&) { ++frames; }, running, telemetry, err);
        if (exit != crane::PoseLoopExit::Stopped || frames != 3 || telemetry.snapshot().capture_failures != 4U) {
            std::cerr << "interleaved failures should not end the loop\n";
            return 1;
        }
    }

    // Three in a row with a budget of two is a lost camera.
    {
        ScriptSource source("ottt");
        crane::Telemetry telemetry;
        options.max_frames = 0;
        int frames = 0;
        std::string err;
        const crane::PoseLoopExit exit = crane::runPoseLoop(
            source, options, [&frames](const crane::FramePacket&) { ++frames; }, running, telemetry, err);
        if (exit != crane::PoseLoopExit::CameraLost || frames != 1 || err.find("3 consecutive") == std::string::npos) {
            std::cerr << "repeated failures should report a lost camera: " << err << "\n";
            return 1;
        }
    }

    // Lost is immediate.
    {
        ScriptSource source("ol");
        crane::Telemetry telemetry;
        std::string err;
        const crane::PoseLoopExit exit =
            crane::runPoseLoop(source, options, [](const crane::FramePacket&) {}, running, telemetry, err);
        if (exit != crane::PoseLoopExit::CameraLost || err != "gone") {
            std::cerr << "a lost device should end the loop at once\n";
            return 1;
        }
    }

    // A cleared running flag stops the loop.
    {
        ScriptSource source("o");
        crane::Telemetry telemetry;
        std::atomic<bool> stopped{false};
        std::string err;
        const crane::PoseLoopExit exit =
            crane::runPoseLoop(source, options, [](const crane::FramePacket&) {}, stopped, telemetry, err);
        if (exit != crane::PoseLoopExit::Stopped) {
            std::cerr << "cleared running flag should stop the loop\n";
            return 1;
        }
    }

    return 0;
}
