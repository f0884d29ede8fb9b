#include "resnet.hpp"

namespace cattlediag {

namespace nn = torch::nn;

namespace {

nn::Conv2d conv3x3(int64_t in_planes, int64_t out_planes, int64_t stride) {
    return nn::Conv2d(nn::Conv2dOptions(in_planes, out_planes, 3)
                          .stride(stride).padding(1).bias(false));
}

nn::Conv2d conv1x1(int64_t in_planes, int64_t out_planes, int64_t stride) {
    return nn::Conv2d(nn::Conv2dOptions(in_planes, out_planes, 1)
                          .stride(stride).bias(false));
}

} // namespace

BasicBlockImpl::BasicBlockImpl(const std::string& name, int64_t in_planes, int64_t planes, int64_t stride)
    : name_(name) {
    conv1 = register_module("conv1", conv3x3(in_planes, planes, stride));
    bn1 = register_module("bn1", nn::BatchNorm2d(planes));
    conv2 = register_module("conv2", conv3x3(planes, planes, 1));
    bn2 = register_module("bn2", nn::BatchNorm2d(planes));

    if (stride != 1 || in_planes != planes) {
        downsample = register_module("downsample", nn::Sequential(
            conv1x1(in_planes, planes, stride),
            nn::BatchNorm2d(planes)));
    }
}

torch::Tensor BasicBlockImpl::forward(torch::Tensor x, FeatureTap* tap) {
    auto identity = x;

    auto out = conv1->forward(x);
    capture("conv1", out, tap);
    out = torch::relu(bn1->forward(out));

    out = conv2->forward(out);
    capture("conv2", out, tap);
    out = bn2->forward(out);

    if (downsample) {
        identity = downsample->forward(x);
    }
    return torch::relu(out + identity);
}

void BasicBlockImpl::capture(const std::string& conv, torch::Tensor& out, FeatureTap* tap) const {
    if (tap == nullptr || tap->layer != name_ + "." + conv) {
        return;
    }
    if (out.requires_grad()) {
        out.retain_grad();
    }
    tap->activation = out;
}

ResNet18Impl::ResNet18Impl(int64_t num_classes)
    : num_classes_(num_classes) {
    TORCH_CHECK(num_classes > 0, "num_classes must be positive");

    conv1 = register_module("conv1", nn::Conv2d(
        nn::Conv2dOptions(3, 64, 7).stride(2).padding(3).bias(false)));
    bn1 = register_module("bn1", nn::BatchNorm2d(64));

    layer1 = register_module("layer1", make_layer("layer1", 64, 1));
    layer2 = register_module("layer2", make_layer("layer2", 128, 2));
    layer3 = register_module("layer3", make_layer("layer3", 256, 2));
    layer4 = register_module("layer4", make_layer("layer4", 512, 2));

    fc = register_module("fc", nn::Linear(512, num_classes));
}

nn::ModuleList ResNet18Impl::make_layer(const std::string& name, int64_t planes, int64_t stride) {
    nn::ModuleList blocks;
    blocks->push_back(BasicBlock(name + ".0", in_planes_, planes, stride));
    in_planes_ = planes;
    blocks->push_back(BasicBlock(name + ".1", in_planes_, planes, 1));
    return blocks;
}

torch::Tensor ResNet18Impl::forward(torch::Tensor x, FeatureTap* tap) {
    x = conv1->forward(x);
    if (tap != nullptr && tap->layer == "conv1") {
        if (x.requires_grad()) {
            x.retain_grad();
        }
        tap->activation = x;
    }
    x = torch::relu(bn1->forward(x));
    x = torch::max_pool2d(x, 3, 2, 1);

    for (auto* layer : {&layer1, &layer2, &layer3, &layer4}) {
        for (const auto& block : **layer) {
            x = block->as<BasicBlockImpl>()->forward(x, tap);
        }
    }

    x = torch::adaptive_avg_pool2d(x, {1, 1});
    x = torch::flatten(x, 1);
    return fc->forward(x);
}

std::string find_last_conv(nn::Module& model) {
    auto modules = model.named_modules();
    for (auto it = modules.end(); it != modules.begin();) {
        --it;
        if (it->value()->as<nn::Conv2dImpl>() != nullptr) {
            return it->key();
        }
    }
    return "";
}

ShapeTable shape_table(nn::Module& model) {
    ShapeTable table;
    for (const auto& item : model.named_parameters()) {
        table.emplace_back(item.key(), item.value().sizes().vec());
    }
    for (const auto& item : model.named_buffers()) {
        table.emplace_back(item.key(), item.value().sizes().vec());
    }
    return table;
}

} // namespace cattlediag
