#pragma once

#include "checkpoint_resolver.hpp"
#include "model_runtime.hpp"
#include "../preprocessing/preprocessor.hpp"
#include <torch/torch.h>

namespace cattlediag {

/**
 * LibTorch classifier with Grad-CAM.
 *
 * Parameters never require gradients; a saliency request makes only the
 * input differentiable and captures the last convolution through a
 * FeatureTap that lives for the duration of one run().
 */
class TorchRuntime : public ModelRuntime {
public:
    TorchRuntime(ResolvedClassifier classifier,
                 const PreprocessingParams& params,
                 torch::Device device);

    std::string model_version() const override { return classifier_.model_version; }
    bool supports_saliency() const override { return !saliency_layer_.empty(); }

    RuntimeOutput run(const cv::Mat& rgb, bool with_saliency) override;

    const std::string& saliency_layer() const { return saliency_layer_; }

private:
    torch::Tensor to_input(const cv::Mat& rgb) const;
    torch::Tensor forward(const torch::Tensor& input, FeatureTap* tap);

    // Weighted activation map upsampled to (height, width) and scaled to [0,1]
    static cv::Mat saliency_map(const torch::Tensor& activation,
                                const torch::Tensor& gradient,
                                int height, int width);

    ResolvedClassifier classifier_;
    Preprocessor preprocessor_;
    torch::Device device_;
    std::string saliency_layer_;
};

// Pick the configured device, falling back to CPU when CUDA is absent
torch::Device select_device(const std::string& requested);

} // namespace cattlediag
