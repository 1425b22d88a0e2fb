#include "pose/marker_detector.hpp"

#include <iostream>

namespace crane {

namespace {

cv::aruco::DetectorParameters makeParameters() {
    cv::aruco::DetectorParameters params;
    params.cornerRefinementMethod = cv::aruco::CORNER_REFINE_SUBPIX;
    return params;
}

}  // namespace

ArucoMarkerDetector::ArucoMarkerDetector()
    : detector_(cv::aruco::getPredefinedDictionary(cv::aruco::DICT_5X5_50), makeParameters()) {}

std::vector<MarkerObservation> ArucoMarkerDetector::detect(const cv::Mat& gray, int64_t timestamp_ns) {
    std::vector<MarkerObservation> out;
    if (gray.empty()) {
        return out;
    }

    std::vector<std::vector<cv::Point2f>> corners;
    std::vector<int> ids;
    try {
        detector_.detectMarkers(gray, corners, ids);
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] marker detection failed: " << e.what() << "\n";
        return out;
    }

    out.reserve(ids.size());
    for (std::size_t i = 0; i < ids.size() && i < corners.size(); ++i) {
        if (corners[i].size() != 4U) {
            continue;
        }
        MarkerObservation obs;
        obs.id = ids[i];
        obs.timestamp_ns = timestamp_ns;
        for (std::size_t c = 0; c < 4U; ++c) {
            obs.corners[c] = corners[i][c];
        }
        out.push_back(obs);
    }
    return out;
}

cv::Point2f markerCenter(const MarkerObservation& obs) {
    cv::Point2f sum(0.0F, 0.0F);
    for (const cv::Point2f& p : obs.corners) {
        sum += p;
    }
    return sum * 0.25F;
}

double markerSidePx(const MarkerObservation& obs) {
    double total = 0.0;
    for (std::size_t i = 0; i < 4U; ++i) {
        total += cv::norm(obs.corners[(i + 1U) % 4U] - obs.corners[i]);
    }
    return total / 4.0;
}

double pinholeDistance(double focal_px, double size_m, double side_px) {
    if (side_px <= 0.0 || focal_px <= 0.0 || size_m <= 0.0) {
        return 0.0;
    }
    return focal_px * size_m / side_px;
}

}  // namespace crane
