#pragma once

#include "checkpoint_shape.hpp"
#include "key_remapper.hpp"
#include "resnet.hpp"
#include "state_binding.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <torch/script.h>
#include <torch/torch.h>

namespace cattlediag {

// Ordered name -> tensor mapping
using StateEntries = std::vector<std::pair<std::string, torch::Tensor>>;

// A checkpoint as read from disk, before binding
struct CheckpointPayload {
    CheckpointShape shape;
    StateEntries state;                             // Empty for a live module
    std::optional<torch::jit::Module> module;       // Set for a live module
    bool loaded_unsafely = false;
};

// A classifier ready to run
struct ResolvedClassifier {
    ResNet18 model{nullptr};                        // Bound skeleton, null when scripted
    std::optional<torch::jit::Module> scripted;     // Live module that could not be bound
    BindMode mode = BindMode::EXACT;
    std::string model_version;
};

/**
 * Turns a checkpoint file into a runnable classifier.
 *
 * The direct path reads a data-only pickle (tensors and containers). When
 * that fails and unsafe loading is allowed, the file is retried as a
 * TorchScript archive, which executes serialized code. State mappings bind
 * to a ResNet-18 skeleton sized to the class map under EXACT, then RELAXED,
 * then REMAPPED strictness; the first that succeeds wins.
 */
class CheckpointResolver {
public:
    CheckpointResolver(int64_t num_classes, bool allow_unsafe_load,
                       torch::Device device = torch::kCPU);

    /**
     * Read and bind a checkpoint.
     * @throws ModelLoadException if the file is missing or no strategy binds
     */
    ResolvedClassifier resolve(const std::string& path) const;

    /**
     * Read a checkpoint and classify its shape.
     * @throws ModelLoadException if the file is missing
     * @throws CheckpointException if the payload cannot be deserialized
     */
    CheckpointPayload read(const std::string& path) const;

    // Bind an already-read payload; `file_name` labels the model version
    ResolvedClassifier bind(const CheckpointPayload& payload, const std::string& file_name) const;

    // Flatten a payload into a state mapping; a live module yields its parameters and buffers
    static StateEntries flatten(const CheckpointPayload& payload);

    const KeyRemapper& remapper() const { return remapper_; }

private:
    static StateEntries state_from_dict(const c10::impl::GenericDict& dict);
    static ShapeTable shapes_of(const StateEntries& entries);

    // Copy planned entries into the skeleton without recording gradients
    static void copy_into(ResNet18& model, const StateEntries& entries, const BindingPlan& plan);

    int64_t num_classes_;
    bool allow_unsafe_load_;
    torch::Device device_;
    KeyRemapper remapper_;
};

} // namespace cattlediag
