#include "overlay_renderer.hpp"
#include "../../common/error.hpp"
#include "../../common/logging.hpp"
#include "../../common/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace cattlediag {

namespace fs = std::filesystem;

OverlayRenderer::OverlayRenderer(std::string output_dir, std::string mount_prefix, float alpha)
    : output_dir_(std::move(output_dir))
    , mount_prefix_(std::move(mount_prefix))
    , alpha_(alpha) {
    CHECK_ARG(alpha_ >= 0.0f && alpha_ <= 1.0f, "Overlay alpha must be in [0, 1]");
    while (common::StringUtils::ends_with(mount_prefix_, "/")) {
        mount_prefix_.pop_back();
    }
}

cv::Mat OverlayRenderer::render(const cv::Mat& rgb, const cv::Mat& heat) const {
    CHECK_ARG(!rgb.empty() && rgb.type() == CV_8UC3, "Expected a non-empty 8-bit RGB image");
    CHECK_ARG(!heat.empty() && heat.channels() == 1, "Expected a single-channel heat map");

    cv::Mat heat_f;
    heat.convertTo(heat_f, CV_32F);
    if (heat_f.size() != rgb.size()) {
        cv::resize(heat_f, heat_f, rgb.size(), 0, 0, cv::INTER_LINEAR);
    }

    cv::Mat out(rgb.size(), CV_8UC3);
    for (int y = 0; y < rgb.rows; ++y) {
        const auto* src = rgb.ptr<cv::Vec3b>(y);
        const auto* h = heat_f.ptr<float>(y);
        auto* dst = out.ptr<cv::Vec3b>(y);
        for (int x = 0; x < rgb.cols; ++x) {
            // Overlay pixel is (heat, 0, 0) with opacity alpha * heat, both quantized to 8 bits
            int heat8 = cv::saturate_cast<uchar>(std::min(std::max(h[x], 0.0f), 1.0f) * 255.0f);
            int alpha8 = static_cast<int>(heat8 * alpha_);
            float a = alpha8 / 255.0f;
            dst[x][0] = cv::saturate_cast<uchar>(heat8 * a + src[x][0] * (1.0f - a));
            dst[x][1] = cv::saturate_cast<uchar>(src[x][1] * (1.0f - a));
            dst[x][2] = cv::saturate_cast<uchar>(src[x][2] * (1.0f - a));
        }
    }
    return out;
}

std::string OverlayRenderer::write(const cv::Mat& rgb, const cv::Mat& heat) const {
    cv::Mat composed = render(rgb, heat);

    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec) {
        throw common::IOException("Cannot create Grad-CAM directory " + output_dir_ + ": " + ec.message());
    }

    std::string name = "gradcam_" + common::RandomUtils::random_hex(32) + ".png";
    std::string path = (fs::path(output_dir_) / name).string();

    cv::Mat bgr;
    cv::cvtColor(composed, bgr, cv::COLOR_RGB2BGR);
    if (!cv::imwrite(path, bgr)) {
        throw common::IOException("Failed to write Grad-CAM overlay " + path);
    }

    LOG_DEBUG("Wrote Grad-CAM overlay " + path);
    return mount_prefix_ + "/" + name;
}

} // namespace cattlediag
