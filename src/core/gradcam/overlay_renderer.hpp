#pragma once

#include <string>
#include <opencv2/core.hpp>

namespace cattlediag {

/**
 * Renders a saliency map as a red, semi-transparent overlay on the source
 * image and persists it as a PNG under the Grad-CAM output directory.
 */
class OverlayRenderer {
public:
    OverlayRenderer(std::string output_dir, std::string mount_prefix, float alpha = 0.6f);

    /**
     * Composite the heat map over the image.
     * @param rgb 8-bit RGB image
     * @param heat CV_32FC1 in [0,1]; resized to the image if needed
     * @return 8-bit RGB image the size of `rgb`
     */
    cv::Mat render(const cv::Mat& rgb, const cv::Mat& heat) const;

    /**
     * Render and write gradcam_<32 hex>.png.
     * @return Locator of the written file, e.g. /gradcams/gradcam_<hex>.png
     * @throws IOException when the file cannot be written
     */
    std::string write(const cv::Mat& rgb, const cv::Mat& heat) const;

    const std::string& output_dir() const { return output_dir_; }

private:
    std::string output_dir_;
    std::string mount_prefix_;
    float alpha_;
};

} // namespace cattlediag
