#pragma once

#include "state_binding.hpp"
#include <string>
#include <torch/torch.h>

namespace cattlediag {

/**
 * Captures one convolution's output during a single forward pass. The
 * captured tensor retains its gradient so a later backward() fills grad().
 * A tap lives on the caller's stack; the model itself is never modified.
 */
struct FeatureTap {
    std::string layer;              // Qualified module name, e.g. "layer4.1.conv2"
    torch::Tensor activation;
};

// torchvision BasicBlock with its parameter names
class BasicBlockImpl : public torch::nn::Module {
public:
    BasicBlockImpl(const std::string& name, int64_t in_planes, int64_t planes, int64_t stride);

    torch::Tensor forward(torch::Tensor x, FeatureTap* tap = nullptr);

private:
    void capture(const std::string& conv, torch::Tensor& out, FeatureTap* tap) const;

    std::string name_;
    torch::nn::Conv2d conv1{nullptr};
    torch::nn::BatchNorm2d bn1{nullptr};
    torch::nn::Conv2d conv2{nullptr};
    torch::nn::BatchNorm2d bn2{nullptr};
    torch::nn::Sequential downsample{nullptr};
};
TORCH_MODULE(BasicBlock);

/**
 * ResNet-18 classifier whose parameter and buffer names match torchvision's
 * resnet18, so checkpoints saved from it bind without renaming.
 */
class ResNet18Impl : public torch::nn::Module {
public:
    explicit ResNet18Impl(int64_t num_classes);

    torch::Tensor forward(torch::Tensor x, FeatureTap* tap = nullptr);

    int64_t num_classes() const { return num_classes_; }

private:
    torch::nn::ModuleList make_layer(const std::string& name, int64_t planes, int64_t stride);

    int64_t num_classes_;
    int64_t in_planes_ = 64;

    torch::nn::Conv2d conv1{nullptr};
    torch::nn::BatchNorm2d bn1{nullptr};
    torch::nn::ModuleList layer1{nullptr};
    torch::nn::ModuleList layer2{nullptr};
    torch::nn::ModuleList layer3{nullptr};
    torch::nn::ModuleList layer4{nullptr};
    torch::nn::Linear fc{nullptr};
};
TORCH_MODULE(ResNet18);

// Name of the last Conv2d in registration order, scanning from the output; empty if none
std::string find_last_conv(torch::nn::Module& model);

// Parameters followed by buffers, with their shapes
ShapeTable shape_table(torch::nn::Module& model);

} // namespace cattlediag
