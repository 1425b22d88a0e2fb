#pragma once

#include <memory>
#include <string>

#include <opencv2/videoio.hpp>

#include "core/config.hpp"
#include "core/types.hpp"

namespace crane {

enum class CaptureStatus {
    Ok,
    Transient,  // frame missing or late, retry in place
    Lost,       // device gone, the process has to reopen or exit
};

const char* captureStatusName(CaptureStatus status);

// Resolved cv::VideoCapture arguments for one CameraConfig.
struct CaptureTarget {
    int api_preference{cv::CAP_ANY};
    bool use_index{true};
    int index{0};
    std::string location{};  // pipeline string or device path when !use_index
    bool apply_structured_params{true};
};

CaptureTarget resolveCaptureTarget(const CameraConfig& config);
std::string buildCsiPipeline(int sensor_id, int width, int height, int fps);
std::string describeCaptureTarget(const CaptureTarget& target);

class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual CaptureStatus read(FramePacket& out, std::string& error) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    virtual std::string description() const = 0;
};

class VideoCaptureSource : public FrameSource {
public:
    VideoCaptureSource() = default;
    ~VideoCaptureSource() override;

    bool open(const CameraConfig& config, std::string& error);

    CaptureStatus read(FramePacket& out, std::string& error) override;
    void close() override;
    bool isOpen() const override;
    std::string description() const override { return description_; }

private:
    bool probeFirstFrame(std::string& error);

    cv::VideoCapture cap_;
    CameraConfig config_{};
    std::string description_;
    std::string device_node_;
};

// Returns nullptr (with error filled) when the camera is unavailable:
// absent hardware, a busy device or an open that exceeds open_timeout_ms.
std::unique_ptr<FrameSource> openFrameSource(const CameraConfig& config, std::string& error);

}  // namespace crane
