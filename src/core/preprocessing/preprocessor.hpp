#pragma once

#include <array>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace cattlediag {

// Preprocessing parameters (ImageNet defaults)
struct PreprocessingParams {
    // Geometry
    int resize_short_side = 256;
    int crop_size = 224;

    // Per-channel normalization, RGB order
    std::array<float, 3> mean = {0.485f, 0.456f, 0.406f};
    std::array<float, 3> std = {0.229f, 0.224f, 0.225f};
};

class Preprocessor {
public:
    explicit Preprocessor(const PreprocessingParams& params = PreprocessingParams());

    /**
     * Decode encoded image bytes (PNG, JPEG, ...) into an 8-bit RGB image.
     * @return Empty Mat when the bytes are not a decodable image
     */
    static cv::Mat decode_rgb(const std::string& bytes);

    // Short side to resize_short_side, then a centered crop_size square
    cv::Mat resize_and_crop(const cv::Mat& rgb) const;

    // Scale to [0,1], normalize, and lay out as planar CHW floats
    std::vector<float> to_planar(const cv::Mat& cropped) const;

    // resize_and_crop() followed by to_planar()
    std::vector<float> process(const cv::Mat& rgb) const;

    const PreprocessingParams& params() const { return params_; }

private:
    PreprocessingParams params_;
};

} // namespace cattlediag
