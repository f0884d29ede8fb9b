#include "torch_runtime.hpp"
#include "../../common/error.hpp"
#include "../../common/logging.hpp"

namespace cattlediag {

namespace F = torch::nn::functional;

torch::Device select_device(const std::string& requested) {
    if (requested == "cuda") {
        if (torch::cuda::is_available()) {
            return torch::kCUDA;
        }
        LOG_WARNING("CUDA requested but not available, using CPU");
    }
    return torch::kCPU;
}

TorchRuntime::TorchRuntime(ResolvedClassifier classifier,
                           const PreprocessingParams& params,
                           torch::Device device)
    : classifier_(std::move(classifier))
    , preprocessor_(params)
    , device_(device) {
    CHECK_ARG(classifier_.model || classifier_.scripted, "Classifier has no model to run");

    if (classifier_.model) {
        saliency_layer_ = find_last_conv(*classifier_.model);
    }
    if (saliency_layer_.empty()) {
        LOG_WARNING("No convolutional layer found, Grad-CAM disabled for " + classifier_.model_version);
    } else {
        LOG_INFO("Grad-CAM target layer: " + saliency_layer_);
    }
}

torch::Tensor TorchRuntime::to_input(const cv::Mat& rgb) const {
    auto planar = preprocessor_.process(rgb);
    const int64_t crop = preprocessor_.params().crop_size;
    return torch::from_blob(planar.data(), {1, 3, crop, crop}, torch::kFloat32)
        .clone()
        .to(device_);
}

torch::Tensor TorchRuntime::forward(const torch::Tensor& input, FeatureTap* tap) {
    if (classifier_.scripted) {
        std::vector<torch::jit::IValue> inputs{input};
        return classifier_.scripted->forward(inputs).toTensor();
    }
    return classifier_.model->forward(input, tap);
}

RuntimeOutput TorchRuntime::run(const cv::Mat& rgb, bool with_saliency) {
    CHECK_ARG(!rgb.empty() && rgb.type() == CV_8UC3, "Expected a non-empty 8-bit RGB image");

    RuntimeOutput output;
    auto input = to_input(rgb);

    if (!with_saliency || saliency_layer_.empty()) {
        torch::NoGradGuard no_grad;
        auto probs = torch::softmax(forward(input, nullptr), 1).to(torch::kCPU).contiguous();
        output.probabilities.assign(probs.data_ptr<float>(), probs.data_ptr<float>() + probs.size(1));
        return output;
    }

    input.requires_grad_(true);
    FeatureTap tap{saliency_layer_, torch::Tensor()};
    auto logits = forward(input, &tap);

    auto probs = torch::softmax(logits.detach(), 1).to(torch::kCPU).contiguous();
    output.probabilities.assign(probs.data_ptr<float>(), probs.data_ptr<float>() + probs.size(1));

    auto top = probs.argmax(1).item<int64_t>();
    logits[0][top].backward();

    if (tap.activation.defined() && tap.activation.grad().defined()) {
        output.saliency = saliency_map(tap.activation.detach(), tap.activation.grad(), rgb.rows, rgb.cols);
    } else {
        LOG_WARNING("Grad-CAM capture missed layer " + saliency_layer_);
    }
    return output;
}

cv::Mat TorchRuntime::saliency_map(const torch::Tensor& activation,
                                   const torch::Tensor& gradient,
                                   int height, int width) {
    torch::NoGradGuard no_grad;

    auto weights = gradient.mean({2, 3}, true);
    auto cam = torch::relu((weights * activation).sum(1, true));
    cam = F::interpolate(cam, F::InterpolateFuncOptions()
                                  .size(std::vector<int64_t>{height, width})
                                  .mode(torch::kBilinear)
                                  .align_corners(false));
    cam = cam.squeeze().to(torch::kCPU).to(torch::kFloat32);

    cam = cam - cam.min();
    auto peak = cam.max().item<float>();
    if (peak != 0.0f) {
        cam = cam / peak;
    }
    cam = cam.contiguous();

    return cv::Mat(height, width, CV_32FC1, cam.data_ptr<float>()).clone();
}

} // namespace cattlediag
