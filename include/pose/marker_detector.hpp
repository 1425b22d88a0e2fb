#pragma once

#include <cstdint>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/objdetect/aruco_detector.hpp>

#include "core/types.hpp"

namespace crane {

// Opaque marker detection step: grayscale image in, observations out.
class MarkerDetector {
public:
    virtual ~MarkerDetector() = default;
    virtual std::vector<MarkerObservation> detect(const cv::Mat& gray, int64_t timestamp_ns) = 0;
};

// ArUco DICT_5X5_50, the dictionary printed on the crane rail and hook.
class ArucoMarkerDetector : public MarkerDetector {
public:
    ArucoMarkerDetector();
    std::vector<MarkerObservation> detect(const cv::Mat& gray, int64_t timestamp_ns) override;

private:
    cv::aruco::ArucoDetector detector_;
};

cv::Point2f markerCenter(const MarkerObservation& obs);
// Mean of the four side lengths.
double markerSidePx(const MarkerObservation& obs);
// Distance along the optical axis of a square of side size_m seen as side_px.
double pinholeDistance(double focal_px, double size_m, double side_px);

}  // namespace crane
