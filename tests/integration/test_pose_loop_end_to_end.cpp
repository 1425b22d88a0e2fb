#include "camera/frame_source.hpp"
#include "core/telemetry.hpp"
#include "fieldbus/modbus_client.hpp"
#include "fieldbus/modbus_server.hpp"
#include "fieldbus/pose_publisher.hpp"
#include "fieldbus/register_codec.hpp"
#include "pose/bridge_pose_engine.hpp"
#include "pose/pose_loop.hpp"

#include <atomic>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr int kScriptedFrames = 16;

// Delivers a fixed number of blank frames, then only transient failures.
class ScriptedCamera : public crane::FrameSource {
public:
    crane::CaptureStatus read(crane::FramePacket& out, std::string& error) override {
        if (delivered_ >= kScriptedFrames) {
            error = "no frame";
            return crane::CaptureStatus::Transient;
        }
        out.timestamp_ns = static_cast<int64_t>(delivered_);
        out.gray = cv::Mat::zeros(480, 640, CV_8UC1);
        ++delivered_;
        return crane::CaptureStatus::Ok;
    }
    void close() override {}
    bool isOpen() const override { return true; }
    std::string description() const override { return "scripted"; }

private:
    int delivered_{0};
};

// Marker 3 drifts left through the image as the bridge travels forward,
// then leaves the field of view.
class DriftingMarkerDetector : public crane::MarkerDetector {
public:
    std::vector<crane::MarkerObservation> detect(const cv::Mat&, int64_t timestamp_ns) override {
        const int frame = static_cast<int>(timestamp_ns);
        const float xs[] = {420.0F, 420.0F, 420.0F, 370.0F, 320.0F, 270.0F};
        if (frame >= 6) {
            return {};
        }
        const float cx = xs[frame];
        crane::MarkerObservation obs;
        obs.id = 3;
        obs.timestamp_ns = timestamp_ns;
        obs.corners = {cv::Point2f(cx - 25.0F, 215.0F), cv::Point2f(cx + 25.0F, 215.0F),
                       cv::Point2f(cx + 25.0F, 265.0F), cv::Point2f(cx - 25.0F, 265.0F)};
        return {obs};
    }
};

}  // namespace

int main() {
#ifdef __linux__
    crane::BridgeConfig cfg;
    cfg.marker_size_mm = 100;
    cfg.confirm_threshold = 2;
    cfg.marker_positions_m = {{1, 0.0}, {2, 2.0}, {3, 4.0}};

    crane::CameraIntrinsics intr;
    intr.K = (cv::Mat_<double>(3, 3) << 500.0, 0.0, 320.0, 0.0, 500.0, 240.0, 0.0, 0.0, 1.0);
    intr.D = cv::Mat::zeros(1, 5, CV_64F);

    const uint16_t bridge_base = crane::fieldbus::kDefaultBridgeBase;
    const uint16_t hook_base = crane::fieldbus::kDefaultHookBase;
    crane::fieldbus::RegisterBank bank(crane::fieldbus::registerSpaceSize(
        crane::fieldbus::bridgeRange(bridge_base), crane::fieldbus::hookRange(hook_base)));
    crane::fieldbus::ModbusServer server(bank, 1);
    std::string err;
    if (!server.start("127.0.0.1", 0, err)) {
        std::cerr << "server.start failed: " << err << "\n";
        return 1;
    }
    crane::fieldbus::ModbusClient plc(1);
    if (!plc.connect("127.0.0.1", server.port(), 1000, err)) {
        std::cerr << "plc connect failed: " << err << "\n";
        return 1;
    }

    ScriptedCamera camera;
    DriftingMarkerDetector detector;
    crane::BridgePoseEngine engine(cfg, intr, detector);
    crane::fieldbus::BankRegisterSink sink(bank);
    crane::Telemetry telemetry;
    std::vector<crane::BridgePoseSample> seen;
    bool publish_ok = true;

    crane::PoseLoopOptions options;
    options.sample_rate_hz = 500.0;
    options.max_capture_retries = 3;
    std::atomic<bool> running{true};

    const crane::PoseLoopExit exit = crane::runPoseLoop(
        camera, options,
        [&](const crane::FramePacket& frame) {
            const crane::BridgePoseSample sample = engine.process(frame);
            std::string publish_error;
            if (!crane::fieldbus::publishBridgeSample(sink, bridge_base, sample, publish_error)) {
                publish_ok = false;
            }
            telemetry.recordFrame(sample.valid);
            crane::fieldbus::PoseSnapshot snap;
            if (!crane::fieldbus::readPoseSnapshot(plc, bridge_base, hook_base, snap, publish_error)) {
                publish_ok = false;
                return;
            }
            seen.push_back(snap.bridge);
        },
        running, telemetry, err);

    if (exit != crane::PoseLoopExit::CameraLost) {
        std::cerr << "loop should end with a lost camera after the script runs out\n";
        return 1;
    }
    if (!publish_ok || seen.size() != static_cast<std::size_t>(kScriptedFrames)) {
        std::cerr << "every frame should be published and readable, got " << seen.size() << "\n";
        return 1;
    }

    // Confirmation needs evidence above 2: the first two sightings are unusable.
    if (seen[0].valid || seen[1].valid) {
        std::cerr << "unconfirmed marker should not produce a valid sample\n";
        return 1;
    }
    for (int i = 2; i < 6; ++i) {
        if (!seen[static_cast<std::size_t>(i)].valid || seen[static_cast<std::size_t>(i)].marker_id != 3) {
            std::cerr << "frame " << i << " should be valid on marker 3\n";
            return 1;
        }
    }
    for (int i = 3; i < 6; ++i) {
        if (!(seen[static_cast<std::size_t>(i)].x_m > seen[static_cast<std::size_t>(i - 1)].x_m)) {
            std::cerr << "position should increase as the marker moves left in the image\n";
            return 1;
        }
    }
    if (std::abs(seen[4].x_m - 4.0F) > 1e-4F || std::abs(seen[4].y_m - 1.0F) > 1e-4F) {
        std::cerr << "centered marker should report its table position\n";
        return 1;
    }

    // Ten frames without markers: invalid, last values held.
    for (int i = 6; i < kScriptedFrames; ++i) {
        const crane::BridgePoseSample& s = seen[static_cast<std::size_t>(i)];
        if (s.valid || s.x_m != seen[5].x_m || s.marker_id != 3) {
            std::cerr << "frame " << i << " should hold the last position with valid=0\n";
            return 1;
        }
    }

    const crane::TelemetrySnapshot stats = telemetry.snapshot();
    if (stats.frames != static_cast<uint64_t>(kScriptedFrames) || stats.valid_samples != 4U ||
        stats.capture_failures != 4U) {
        std::cerr << "telemetry counters mismatch\n";
        return 1;
    }

    server.stop();
    return 0;
#else
    return 0;
#endif
}
