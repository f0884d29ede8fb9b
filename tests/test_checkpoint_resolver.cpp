#include <gtest/gtest.h>
#include "core/model/checkpoint_resolver.hpp"
#include "core/model/torch_runtime.hpp"
#include "common/error.hpp"
#include <torch/serialize.h>
#include <filesystem>
#include <fstream>
#include <map>

using namespace cattlediag;

namespace {

c10::Dict<std::string, at::Tensor> state_of(ResNet18& model, const std::string& prefix = "") {
    c10::Dict<std::string, at::Tensor> state;
    for (const auto& parameter : model->named_parameters()) {
        state.insert(prefix + parameter.key(), parameter.value().detach().clone());
    }
    for (const auto& buffer : model->named_buffers()) {
        state.insert(prefix + buffer.key(), buffer.value().detach().clone());
    }
    return state;
}

void save_pickle(const c10::IValue& value, const std::string& path) {
    auto bytes = torch::jit::pickle_save(value);
    std::ofstream out(path, std::ios::binary);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

// Module tree keyed by dotted attribute path
struct ModuleNode {
    std::vector<std::pair<std::string, at::Tensor>> parameters;
    std::vector<std::pair<std::string, at::Tensor>> buffers;
    std::map<std::string, ModuleNode> children;
};

void insert_path(ModuleNode& root, const std::string& name, const at::Tensor& tensor, bool is_buffer) {
    ModuleNode* node = &root;
    std::string rest = name;
    for (auto dot = rest.find('.'); dot != std::string::npos; dot = rest.find('.')) {
        node = &node->children[rest.substr(0, dot)];
        rest = rest.substr(dot + 1);
    }
    (is_buffer ? node->buffers : node->parameters).emplace_back(rest, tensor);
}

torch::jit::Module build_module(const std::string& type_name, const ModuleNode& node) {
    torch::jit::Module module(c10::QualifiedName("__torch__." + type_name));
    for (const auto& [name, tensor] : node.parameters) {
        module.register_parameter(name, tensor, false);
    }
    for (const auto& [name, tensor] : node.buffers) {
        module.register_buffer(name, tensor);
    }
    for (const auto& [name, child] : node.children) {
        module.register_module(name, build_module(type_name + "_" + name, child));
    }
    return module;
}

// A TorchScript archive whose parameters and buffers carry the skeleton's names
torch::jit::Module scripted_copy(ResNet18& model) {
    ModuleNode root;
    for (const auto& parameter : model->named_parameters()) {
        insert_path(root, parameter.key(), parameter.value().detach().clone(), false);
    }
    for (const auto& buffer : model->named_buffers()) {
        insert_path(root, buffer.key(), buffer.value().detach().clone(), true);
    }
    return build_module("ScriptedResNet", root);
}

// A TorchScript classifier that does not fit the skeleton
torch::jit::Module tiny_head() {
    torch::jit::Module module(c10::QualifiedName("__torch__.TinyHead"));
    module.register_parameter("weight", torch::randn({3, 3}), false);
    module.define(R"(
def forward(self, x):
    return torch.matmul(x.mean([2, 3]), self.weight.t())
)");
    return module;
}

class CheckpointResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        torch::manual_seed(7);
        dir_ = testing::TempDir() + "checkpoints_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::string path(const std::string& name) const {
        return dir_ + "/" + name;
    }

    // Bound weights equal the saved ones
    static void expect_same_fc(const ResNet18& bound, const ResNet18& source) {
        auto bound_params = bound->named_parameters();
        auto source_params = source->named_parameters();
        EXPECT_TRUE(torch::equal(bound_params["fc.weight"], source_params["fc.weight"]));
        EXPECT_TRUE(torch::equal(bound_params["fc.bias"], source_params["fc.bias"]));
    }

    std::string dir_;
};

} // namespace

TEST_F(CheckpointResolverTest, FlatStateDictBindsExactly) {
    ResNet18 source(3);
    save_pickle(state_of(source), path("flat.pth"));

    CheckpointResolver resolver(3, false);
    auto resolved = resolver.resolve(path("flat.pth"));

    EXPECT_EQ(resolved.mode, BindMode::EXACT);
    EXPECT_EQ(resolved.model_version, "state_dict:flat.pth");
    EXPECT_FALSE(resolved.scripted.has_value());
    expect_same_fc(resolved.model, source);
    for (const auto& parameter : resolved.model->parameters()) {
        EXPECT_FALSE(parameter.requires_grad());
    }
}

TEST_F(CheckpointResolverTest, NestedStateDict) {
    ResNet18 source(3);
    c10::impl::GenericDict wrapper(c10::StringType::get(), c10::AnyType::get());
    wrapper.insert("epoch", 12);
    wrapper.insert("model_state_dict", state_of(source));
    save_pickle(wrapper, path("nested.pth"));

    CheckpointResolver resolver(3, false);
    auto payload = resolver.read(path("nested.pth"));
    ASSERT_TRUE(std::holds_alternative<NestedStateDict>(payload.shape));
    EXPECT_EQ(std::get<NestedStateDict>(payload.shape).key, "model_state_dict");

    auto resolved = resolver.bind(payload, "nested.pth");
    EXPECT_EQ(resolved.mode, BindMode::EXACT);
    expect_same_fc(resolved.model, source);
}

TEST_F(CheckpointResolverTest, ModulePrefixNeedsRemapping) {
    ResNet18 source(3);
    save_pickle(state_of(source, "module."), path("wrapped.pth"));

    CheckpointResolver resolver(3, false);
    auto resolved = resolver.resolve(path("wrapped.pth"));

    EXPECT_EQ(resolved.mode, BindMode::REMAPPED);
    EXPECT_EQ(resolved.model_version, "state_dict_remapped:wrapped.pth");
    expect_same_fc(resolved.model, source);
}

TEST_F(CheckpointResolverTest, MissingHeadBindsRelaxed) {
    ResNet18 source(3);
    auto state = state_of(source);
    state.erase("fc.weight");
    state.erase("fc.bias");
    save_pickle(state, path("headless.pth"));

    CheckpointResolver resolver(3, false);
    auto resolved = resolver.resolve(path("headless.pth"));
    EXPECT_EQ(resolved.mode, BindMode::RELAXED);
    EXPECT_EQ(resolved.model_version, "state_dict_relaxed:headless.pth");
}

TEST_F(CheckpointResolverTest, WrongClassCountFails) {
    ResNet18 source(5);
    save_pickle(state_of(source), path("five.pth"));

    CheckpointResolver resolver(3, false);
    EXPECT_THROW(resolver.resolve(path("five.pth")), common::ModelLoadException);
}

TEST_F(CheckpointResolverTest, RemapIsIdempotent) {
    ResNet18 source(3);
    StateEntries entries;
    for (const auto& item : state_of(source, "module.")) {
        entries.emplace_back(item.key(), item.value());
    }

    CheckpointResolver resolver(3, false);
    auto once = resolver.remapper().apply(entries);
    auto twice = resolver.remapper().apply(once);

    ASSERT_EQ(once.size(), twice.size());
    for (size_t i = 0; i < once.size(); ++i) {
        EXPECT_EQ(once[i].first, twice[i].first);
    }
}

TEST_F(CheckpointResolverTest, MissingFileThrows) {
    CheckpointResolver resolver(3, false);
    EXPECT_THROW(resolver.resolve(path("absent.pth")), common::ModelLoadException);
}

TEST_F(CheckpointResolverTest, ScriptedArchiveNeedsUnsafeLoad) {
    tiny_head().save(path("tiny.pt"));

    CheckpointResolver strict(3, false);
    EXPECT_THROW(strict.read(path("tiny.pt")), common::CheckpointException);

    CheckpointResolver permissive(3, true);
    auto payload = permissive.read(path("tiny.pt"));
    EXPECT_TRUE(payload.loaded_unsafely);
    EXPECT_TRUE(std::holds_alternative<LiveModel>(payload.shape));
    EXPECT_TRUE(payload.state.empty());
    ASSERT_TRUE(payload.module.has_value());
}

TEST_F(CheckpointResolverTest, UnfittingModuleRunsAsScripted) {
    tiny_head().save(path("tiny.pt"));

    CheckpointResolver resolver(3, true);
    auto resolved = resolver.resolve(path("tiny.pt"));
    EXPECT_EQ(resolved.model_version, "module:tiny.pt");
    EXPECT_FALSE(resolved.model);
    ASSERT_TRUE(resolved.scripted.has_value());

    TorchRuntime runtime(std::move(resolved), PreprocessingParams(), torch::kCPU);
    EXPECT_FALSE(runtime.supports_saliency());

    auto output = runtime.run(cv::Mat(64, 80, CV_8UC3, cv::Scalar(10, 200, 90)), true);
    EXPECT_EQ(output.probabilities.size(), 3u);
    EXPECT_TRUE(output.saliency.empty());
    EXPECT_EQ(runtime.model_version(), "module:tiny.pt");
}

TEST_F(CheckpointResolverTest, MatchingModuleBindsExactly) {
    ResNet18 source(3);
    scripted_copy(source).save(path("resnet.pt"));

    CheckpointResolver resolver(3, true);
    auto resolved = resolver.resolve(path("resnet.pt"));

    EXPECT_EQ(resolved.mode, BindMode::EXACT);
    EXPECT_EQ(resolved.model_version, "module:resnet.pt");
    EXPECT_FALSE(resolved.scripted.has_value());
    expect_same_fc(resolved.model, source);

    TorchRuntime runtime(std::move(resolved), PreprocessingParams(), torch::kCPU);
    EXPECT_TRUE(runtime.supports_saliency());
}

TEST_F(CheckpointResolverTest, GarbageIsRejectedWithoutUnsafeLoad) {
    {
        std::ofstream out(path("garbage.pth"), std::ios::binary);
        out << "not a pickle at all";
    }
    CheckpointResolver resolver(3, false);
    EXPECT_THROW(resolver.read(path("garbage.pth")), common::CheckpointException);

    CheckpointResolver permissive(3, true);
    EXPECT_THROW(permissive.read(path("garbage.pth")), common::CheckpointException);
}
