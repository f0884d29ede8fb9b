#include "preprocessor.hpp"
#include "../../common/error.hpp"
#include <cmath>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace cattlediag {

Preprocessor::Preprocessor(const PreprocessingParams& params)
    : params_(params) {
    CHECK_ARG(params_.crop_size > 0, "Crop size must be positive");
    CHECK_ARG(params_.resize_short_side >= params_.crop_size,
              "Resize short side must not be smaller than the crop size");
}

cv::Mat Preprocessor::decode_rgb(const std::string& bytes) {
    if (bytes.empty()) {
        return cv::Mat();
    }
    std::vector<uchar> buffer(bytes.begin(), bytes.end());
    cv::Mat bgr = cv::imdecode(buffer, cv::IMREAD_COLOR);
    if (bgr.empty()) {
        return bgr;
    }
    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
    return rgb;
}

cv::Mat Preprocessor::resize_and_crop(const cv::Mat& rgb) const {
    CHECK_ARG(!rgb.empty() && rgb.type() == CV_8UC3, "Expected a non-empty 8-bit RGB image");

    // Short side to the target, long side keeps the aspect ratio
    int width = rgb.cols;
    int height = rgb.rows;
    int new_width = params_.resize_short_side;
    int new_height = params_.resize_short_side;
    if (width < height) {
        new_height = static_cast<int>(
            static_cast<double>(params_.resize_short_side) * height / width);
    } else {
        new_width = static_cast<int>(
            static_cast<double>(params_.resize_short_side) * width / height);
    }

    cv::Mat resized;
    cv::resize(rgb, resized, cv::Size(new_width, new_height), 0, 0, cv::INTER_LINEAR);

    int crop = params_.crop_size;
    int top = static_cast<int>(std::round((new_height - crop) / 2.0));
    int left = static_cast<int>(std::round((new_width - crop) / 2.0));
    return resized(cv::Rect(left, top, crop, crop)).clone();
}

std::vector<float> Preprocessor::to_planar(const cv::Mat& cropped) const {
    CHECK_ARG(cropped.type() == CV_8UC3, "Expected an 8-bit RGB image");

    const size_t plane = static_cast<size_t>(cropped.rows) * cropped.cols;
    std::vector<float> planar(3 * plane);

    for (int y = 0; y < cropped.rows; ++y) {
        const auto* row = cropped.ptr<cv::Vec3b>(y);
        for (int x = 0; x < cropped.cols; ++x) {
            size_t offset = static_cast<size_t>(y) * cropped.cols + x;
            for (int c = 0; c < 3; ++c) {
                float value = row[x][c] / 255.0f;
                planar[c * plane + offset] = (value - params_.mean[c]) / params_.std[c];
            }
        }
    }
    return planar;
}

std::vector<float> Preprocessor::process(const cv::Mat& rgb) const {
    return to_planar(resize_and_crop(rgb));
}

} // namespace cattlediag
