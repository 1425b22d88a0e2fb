#pragma once

#include <string>

#include <opencv2/core.hpp>

namespace crane {

struct CameraIntrinsics {
    cv::Mat K;  // 3x3 CV_64F
    cv::Mat D;  // 1xN CV_64F

    double fx() const { return K.at<double>(0, 0); }
    double fy() const { return K.at<double>(1, 1); }
    double cx() const { return K.at<double>(0, 2); }
    double cy() const { return K.at<double>(1, 2); }
};

class CameraCalibration {
public:
    CameraCalibration();

    bool loadFromFile(const std::string& file_path, std::string& error);
    bool isValid() const;

    const CameraIntrinsics& intrinsics() const { return data_; }

    // Factory calibration of the deployed 5X5 marker cameras.
    static CameraIntrinsics factoryDefault();

private:
    CameraIntrinsics data_;
};

}  // namespace crane
