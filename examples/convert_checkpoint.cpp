#include "../src/common/logging.hpp"
#include "../src/core/classmap/class_map.hpp"
#include "../src/core/config/config_manager.hpp"
#include "../src/core/model/checkpoint_resolver.hpp"
#include <fstream>
#include <iostream>
#include <string>
#include <torch/script.h>

using namespace cattlediag;

// Rewrites any accepted checkpoint as a plain name -> tensor pickle that
// binds to the ResNet-18 skeleton under EXACT strictness.
int main(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " <input checkpoint> <output checkpoint>" << std::endl;
        return 2;
    }

    try {
        ConfigManager config;
        config.apply_environment();
        common::Logger::instance().initialize(config.log_config());

        ClassMapLoader class_maps(config.model().class_map_path);
        auto num_classes = static_cast<int64_t>(class_maps.load().size());

        CheckpointResolver resolver(num_classes, config.model().allow_unsafe_load);
        auto resolved = resolver.resolve(argv[1]);
        if (!resolved.model) {
            std::cerr << "Checkpoint is a scripted module that does not match the skeleton" << std::endl;
            return 1;
        }

        c10::Dict<std::string, at::Tensor> state;
        for (const auto& item : resolved.model->named_parameters()) {
            state.insert(item.key(), item.value().detach().cpu());
        }
        for (const auto& item : resolved.model->named_buffers()) {
            state.insert(item.key(), item.value().detach().cpu());
        }

        auto bytes = torch::jit::pickle_save(c10::IValue(state));
        std::ofstream out(argv[2], std::ios::binary);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            std::cerr << "Cannot write " << argv[2] << std::endl;
            return 1;
        }
        std::cout << "Wrote " << state.size() << " tensors (" << to_string(resolved.mode)
                  << " bind) to " << argv[2] << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
