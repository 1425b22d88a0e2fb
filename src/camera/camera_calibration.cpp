#include "camera/camera_calibration.hpp"

#include <opencv2/core/persistence.hpp>

namespace crane {

namespace {

bool parseMatrixFromNode(const cv::FileNode& node, cv::Mat& out) {
    if (node.empty()) {
        return false;
    }

    // !!opencv-matrix form
    if (node.isMap()) {
        node >> out;
        if (out.empty()) {
            return false;
        }
        out.convertTo(out, CV_64F);
        return true;
    }

    if (node.type() != cv::FileNode::SEQ || node.size() == 0) {
        return false;
    }

    const cv::FileNode first = node[0];
    if (first.type() == cv::FileNode::SEQ) {
        const int rows = static_cast<int>(node.size());
        const int cols = static_cast<int>(first.size());
        if (cols <= 0) {
            return false;
        }
        out = cv::Mat(rows, cols, CV_64F);
        for (int r = 0; r < rows; ++r) {
            const cv::FileNode row = node[r];
            if (row.type() != cv::FileNode::SEQ || static_cast<int>(row.size()) != cols) {
                return false;
            }
            for (int c = 0; c < cols; ++c) {
                row[c] >> out.at<double>(r, c);
            }
        }
        return true;
    }

    // Flat list, either 9 values of a row-major 3x3 or a distortion row.
    const int n = static_cast<int>(node.size());
    out = cv::Mat(1, n, CV_64F);
    for (int i = 0; i < n; ++i) {
        node[i] >> out.at<double>(0, i);
    }
    if (n == 9) {
        out = out.reshape(1, 3);
    }
    return true;
}

}  // namespace

CameraCalibration::CameraCalibration() : data_(factoryDefault()) {}

CameraIntrinsics CameraCalibration::factoryDefault() {
    CameraIntrinsics d;
    d.K = (cv::Mat_<double>(3, 3) <<
        661.62411664, 0.0, 345.05463892,
        0.0, 663.37101748, 215.94757467,
        0.0, 0.0, 1.0);
    d.D = (cv::Mat_<double>(1, 5) <<
        -5.77943360e-02, 1.25239405e00, 2.25441807e-03, 4.35415442e-03, -3.44130987e00);
    return d;
}

bool CameraCalibration::loadFromFile(const std::string& file_path, std::string& error) {
    CameraIntrinsics loaded;
    bool parsed = false;
    try {
        const cv::FileStorage fs(file_path, cv::FileStorage::READ);
        if (fs.isOpened()) {
            const bool got_k = parseMatrixFromNode(fs["K"], loaded.K) ||
                               parseMatrixFromNode(fs["camera_matrix"], loaded.K);
            const bool got_d = parseMatrixFromNode(fs["D"], loaded.D) ||
                               parseMatrixFromNode(fs["dist_coeff"], loaded.D);
            parsed = got_k && got_d;
        }
    } catch (const cv::Exception& e) {
        error = std::string("calibration file parse failed: ") + e.what();
        return false;
    }

    if (parsed && loaded.D.rows > 1 && loaded.D.cols == 1) {
        loaded.D = loaded.D.t();
    }

    const bool shape_ok = parsed && loaded.K.rows == 3 && loaded.K.cols == 3 && loaded.D.total() >= 4;
    if (!shape_ok || loaded.K.at<double>(0, 0) <= 0.0 || loaded.K.at<double>(1, 1) <= 0.0) {
        error = "calibration file is missing valid camera_matrix/dist_coeff (or K/D): " + file_path;
        return false;
    }

    data_ = loaded;
    error.clear();
    return true;
}

bool CameraCalibration::isValid() const {
    if (data_.K.empty() || data_.D.empty()) {
        return false;
    }
    if (data_.K.rows != 3 || data_.K.cols != 3) {
        return false;
    }
    return data_.D.total() >= 4 && data_.fx() > 0.0 && data_.fy() > 0.0;
}

}  // namespace crane
