#include "model_runtime.hpp"
#include "../../common/logging.hpp"

#ifdef CATTLEDIAG_WITH_TORCH
#include "checkpoint_resolver.hpp"
#include "torch_runtime.hpp"
#endif

namespace cattlediag {

bool numeric_runtime_available() {
#ifdef CATTLEDIAG_WITH_TORCH
    return true;
#else
    return false;
#endif
}

#ifdef CATTLEDIAG_WITH_TORCH

RuntimeLoader default_runtime_loader() {
    return [](const ModelConfig& config, const PreprocessingParams& preprocessing,
              const ClassMap& class_map) -> std::unique_ptr<ModelRuntime> {
        auto device = select_device(config.device);
        LOG_INFO("Loading checkpoint " + config.checkpoint_path + " for " +
                 std::to_string(class_map.size()) + " classes on " + device.str());

        CheckpointResolver resolver(static_cast<int64_t>(class_map.size()),
                                    config.allow_unsafe_load, device);
        auto classifier = resolver.resolve(config.checkpoint_path);

        return std::make_unique<TorchRuntime>(std::move(classifier), preprocessing, device);
    };
}

#else

RuntimeLoader default_runtime_loader() {
    return [](const ModelConfig&, const PreprocessingParams&, const ClassMap&) -> std::unique_ptr<ModelRuntime> {
        return nullptr;
    };
}

#endif

} // namespace cattlediag
