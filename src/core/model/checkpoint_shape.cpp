#include "checkpoint_shape.hpp"
#include <algorithm>

namespace cattlediag {

const std::vector<std::string>& nested_state_keys() {
    static const std::vector<std::string> keys = {"state_dict", "model_state_dict"};
    return keys;
}

CheckpointShape classify_checkpoint(bool is_module, const std::vector<std::string>& mapping_keys) {
    if (is_module) {
        return LiveModel{};
    }
    for (const auto& key : nested_state_keys()) {
        if (std::find(mapping_keys.begin(), mapping_keys.end(), key) != mapping_keys.end()) {
            return NestedStateDict{key};
        }
    }
    return FlatStateDict{};
}

std::string to_string(const CheckpointShape& shape) {
    if (std::holds_alternative<LiveModel>(shape)) {
        return "live_model";
    }
    if (const auto* nested = std::get_if<NestedStateDict>(&shape)) {
        return "nested_state_dict[" + nested->key + "]";
    }
    return "flat_state_dict";
}

} // namespace cattlediag
