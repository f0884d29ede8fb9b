#include <gtest/gtest.h>
#include "core/preprocessing/preprocessor.hpp"
#include "common/error.hpp"
#include <opencv2/imgcodecs.hpp>

using namespace cattlediag;

namespace {

std::string encode_png(const cv::Mat& bgr) {
    std::vector<uchar> buffer;
    cv::imencode(".png", bgr, buffer);
    return std::string(buffer.begin(), buffer.end());
}

} // namespace

TEST(PreprocessorTest, DecodeSwapsToRgb) {
    cv::Mat bgr(4, 4, CV_8UC3, cv::Scalar(255, 0, 0));    // pure blue in BGR
    cv::Mat rgb = Preprocessor::decode_rgb(encode_png(bgr));

    ASSERT_FALSE(rgb.empty());
    EXPECT_EQ(rgb.type(), CV_8UC3);
    EXPECT_EQ(rgb.at<cv::Vec3b>(0, 0), cv::Vec3b(0, 0, 255));
}

TEST(PreprocessorTest, DecodeRejectsGarbage) {
    EXPECT_TRUE(Preprocessor::decode_rgb("").empty());
    EXPECT_TRUE(Preprocessor::decode_rgb("definitely not an image").empty());
}

TEST(PreprocessorTest, CropGeometry) {
    Preprocessor preprocessor;

    for (const auto& size : {cv::Size(100, 100), cv::Size(640, 480), cv::Size(300, 900)}) {
        cv::Mat rgb(size, CV_8UC3, cv::Scalar(10, 20, 30));
        cv::Mat cropped = preprocessor.resize_and_crop(rgb);
        EXPECT_EQ(cropped.cols, 224);
        EXPECT_EQ(cropped.rows, 224);
    }
}

TEST(PreprocessorTest, PlanarNormalization) {
    Preprocessor preprocessor;
    cv::Mat rgb(300, 300, CV_8UC3, cv::Scalar(255, 0, 128));

    auto planar = preprocessor.process(rgb);
    const size_t plane = 224 * 224;
    ASSERT_EQ(planar.size(), 3 * plane);

    const auto& params = preprocessor.params();
    EXPECT_NEAR(planar[0], (1.0f - params.mean[0]) / params.std[0], 1e-4);
    EXPECT_NEAR(planar[plane], (0.0f - params.mean[1]) / params.std[1], 1e-4);
    EXPECT_NEAR(planar[2 * plane + plane - 1], (128 / 255.0f - params.mean[2]) / params.std[2], 1e-4);
}

TEST(PreprocessorTest, InvalidParams) {
    PreprocessingParams params;
    params.crop_size = 300;
    params.resize_short_side = 256;
    EXPECT_THROW(Preprocessor preprocessor(params), common::ArgumentException);
}
