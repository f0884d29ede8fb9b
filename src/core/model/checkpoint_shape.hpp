#pragma once

#include <string>
#include <variant>
#include <vector>

namespace cattlediag {

// A deserialized module with its own forward()
struct LiveModel {};

// A training checkpoint holding the state mapping under `key`
struct NestedStateDict {
    std::string key;
};

// The checkpoint itself is the name -> tensor mapping
struct FlatStateDict {};

using CheckpointShape = std::variant<LiveModel, NestedStateDict, FlatStateDict>;

// Keys tried, in order, for a nested state mapping
const std::vector<std::string>& nested_state_keys();

/**
 * Decide the shape of a loaded checkpoint once, at load time.
 * @param is_module True when the payload is a live module
 * @param mapping_keys Top-level keys of a dictionary payload whose values are mappings
 */
CheckpointShape classify_checkpoint(bool is_module, const std::vector<std::string>& mapping_keys);

std::string to_string(const CheckpointShape& shape);

} // namespace cattlediag
