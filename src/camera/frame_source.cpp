#include "camera/frame_source.hpp"

#include <vector>

#include <opencv2/imgproc.hpp>

#include "core/time_utils.hpp"

#ifdef __linux__
#include <unistd.h>
#endif

namespace crane {

namespace {

bool deviceNodeExists(const std::string& node) {
#ifdef __linux__
    return ::access(node.c_str(), F_OK) == 0;
#else
    (void)node;
    return true;
#endif
}

// Device node backing an index or path target, empty for pipelines.
std::string deviceNodeFor(const CaptureTarget& target) {
    if (target.api_preference == cv::CAP_GSTREAMER) {
        return {};
    }
    if (target.use_index) {
        return "/dev/video" + std::to_string(target.index);
    }
    if (target.location.rfind("/dev/", 0) == 0) {
        return target.location;
    }
    return {};
}

}  // namespace

const char* captureStatusName(CaptureStatus status) {
    switch (status) {
        case CaptureStatus::Ok: return "ok";
        case CaptureStatus::Transient: return "transient";
        case CaptureStatus::Lost: return "lost";
    }
    return "unknown";
}

std::string buildCsiPipeline(int sensor_id, int width, int height, int fps) {
    return "nvarguscamerasrc sensor-id=" + std::to_string(sensor_id) +
           " ! video/x-raw(memory:NVMM), width=" + std::to_string(width) +
           ", height=" + std::to_string(height) +
           ", framerate=" + std::to_string(fps) + "/1"
           " ! nvvidconv ! video/x-raw, format=BGRx"
           " ! videoconvert ! video/x-raw, format=BGR"
           " ! appsink drop=1";
}

CaptureTarget resolveCaptureTarget(const CameraConfig& config) {
    CaptureTarget t;
    if (!config.gstreamer_pipeline.empty()) {
        // A raw pipeline wins over every structured field.
        t.api_preference = cv::CAP_GSTREAMER;
        t.use_index = false;
        t.location = config.gstreamer_pipeline;
        t.apply_structured_params = false;
        return t;
    }

    switch (config.backend) {
        case CameraBackend::VendorSdk:
            t.api_preference = cv::CAP_GSTREAMER;
            t.use_index = false;
            t.location = buildCsiPipeline(config.device_index, config.width, config.height, config.fps);
            t.apply_structured_params = false;
            break;
        case CameraBackend::DirectDevice:
            t.api_preference = cv::CAP_V4L2;
            break;
        case CameraBackend::Pipeline:
        case CameraBackend::GenericCapture:
            t.api_preference = cv::CAP_ANY;
            break;
    }

    if (t.apply_structured_params) {
        if (!config.device_path.empty()) {
            t.use_index = false;
            t.location = config.device_path;
        } else {
            t.use_index = true;
            t.index = config.device_index;
        }
    }
    return t;
}

std::string describeCaptureTarget(const CaptureTarget& target) {
    std::string api = "any";
    if (target.api_preference == cv::CAP_V4L2) {
        api = "v4l2";
    } else if (target.api_preference == cv::CAP_GSTREAMER) {
        api = "gstreamer";
    }
    if (target.use_index) {
        return api + ":index=" + std::to_string(target.index);
    }
    return api + ":" + target.location;
}

VideoCaptureSource::~VideoCaptureSource() {
    close();
}

bool VideoCaptureSource::open(const CameraConfig& config, std::string& error) {
    close();
    config_ = config;

    const CaptureTarget target = resolveCaptureTarget(config_);
    device_node_ = deviceNodeFor(target);
    if (!device_node_.empty() && !deviceNodeExists(device_node_)) {
        error = "camera device not found: " + device_node_;
        device_node_.clear();
        return false;
    }

    const std::vector<int> params{
        cv::CAP_PROP_OPEN_TIMEOUT_MSEC, config_.open_timeout_ms,
        cv::CAP_PROP_READ_TIMEOUT_MSEC, config_.read_timeout_ms,
    };

    bool opened = false;
    try {
        if (target.use_index) {
            opened = cap_.open(target.index, target.api_preference, params);
        } else {
            opened = cap_.open(target.location, target.api_preference, params);
        }
    } catch (const cv::Exception& e) {
        error = "camera open raised: " + std::string(e.what());
        cap_.release();
        return false;
    }
    if (!opened || !cap_.isOpened()) {
        error = "failed to open camera " + describeCaptureTarget(target);
        cap_.release();
        return false;
    }

    if (target.apply_structured_params) {
        cap_.set(cv::CAP_PROP_FRAME_WIDTH, static_cast<double>(config_.width));
        cap_.set(cv::CAP_PROP_FRAME_HEIGHT, static_cast<double>(config_.height));
        cap_.set(cv::CAP_PROP_FPS, static_cast<double>(config_.fps));
    }

    // A device owned by another process opens but never streams.
    if (!probeFirstFrame(error)) {
        error = "camera " + describeCaptureTarget(target) + " opened but delivered no frame: " + error;
        cap_.release();
        return false;
    }

    description_ = describeCaptureTarget(target);
    error.clear();
    return true;
}

bool VideoCaptureSource::probeFirstFrame(std::string& error) {
    const int64_t deadline_ns = nowSteadyNs() + static_cast<int64_t>(config_.open_timeout_ms) * 1000000LL;
    do {
        try {
            if (cap_.grab()) {
                return true;
            }
        } catch (const cv::Exception& e) {
            error = e.what();
            return false;
        }
    } while (nowSteadyNs() < deadline_ns);
    error = "timed out after " + std::to_string(config_.open_timeout_ms) + " ms";
    return false;
}

void VideoCaptureSource::close() {
    if (cap_.isOpened()) {
        cap_.release();
    }
    description_.clear();
    device_node_.clear();
}

bool VideoCaptureSource::isOpen() const {
    return cap_.isOpened();
}

CaptureStatus VideoCaptureSource::read(FramePacket& out, std::string& error) {
    if (!cap_.isOpened()) {
        error = "camera is not open";
        return CaptureStatus::Lost;
    }

    cv::Mat frame;
    bool ok = false;
    try {
        ok = cap_.read(frame);
    } catch (const cv::Exception& e) {
        error = "capture raised: " + std::string(e.what());
        return CaptureStatus::Transient;
    }

    if (!ok || frame.empty()) {
        if (!device_node_.empty() && !deviceNodeExists(device_node_)) {
            error = "camera device disappeared: " + device_node_;
            return CaptureStatus::Lost;
        }
        error = "failed to capture frame";
        return CaptureStatus::Transient;
    }

    out.timestamp_ns = nowSteadyNs();
    out.raw_bgr = frame;
    if (frame.channels() == 1) {
        out.gray = frame;
    } else {
        cv::cvtColor(frame, out.gray, frame.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    }
    error.clear();
    return CaptureStatus::Ok;
}

std::unique_ptr<FrameSource> openFrameSource(const CameraConfig& config, std::string& error) {
    auto source = std::make_unique<VideoCaptureSource>();
    if (!source->open(config, error)) {
        return nullptr;
    }
    return source;
}

}  // namespace crane
