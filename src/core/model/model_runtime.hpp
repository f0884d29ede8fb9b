#pragma once

#include "../classmap/class_map.hpp"
#include "../config/config_manager.hpp"
#include "../preprocessing/preprocessor.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace cattlediag {

// Output of one forward pass
struct RuntimeOutput {
    std::vector<float> probabilities;       // Softmax, one per class index
    std::optional<cv::Mat> saliency;        // CV_32FC1 in [0,1], sized like the input image
};

/**
 * A ready-to-run classifier. Implementations must be safe to call from
 * several request threads at once and must not mutate shared model state.
 */
class ModelRuntime {
public:
    virtual ~ModelRuntime() = default;

    // e.g. "state_dict_remapped:best_model.pth"
    virtual std::string model_version() const = 0;

    // False when the model has no convolutional layer to explain
    virtual bool supports_saliency() const = 0;

    /**
     * Classify an 8-bit, 3-channel RGB image.
     * @param with_saliency Also compute a Grad-CAM map for the top class
     */
    virtual RuntimeOutput run(const cv::Mat& rgb, bool with_saliency) = 0;
};

enum class RuntimeStatus {
    NOT_LOADED,
    READY,
    UNAVAILABLE,    // Service built without a numeric runtime
    FAILED          // Checkpoint missing or no binding strategy succeeded
};

std::string to_string(RuntimeStatus status);

// Builds a runtime; returns nullptr when no numeric runtime is compiled in
using RuntimeLoader = std::function<std::unique_ptr<ModelRuntime>(
    const ModelConfig& config, const PreprocessingParams& preprocessing, const ClassMap& class_map)>;

// Loader backed by the compiled-in numeric runtime, if any
RuntimeLoader default_runtime_loader();

// True when the build carries a numeric runtime
bool numeric_runtime_available();

/**
 * Owns the classifier for the life of the service. The first get() loads it
 * under a lock; every later call returns the cached instance or the cached
 * failure until reset().
 */
class ModelProvider {
public:
    ModelProvider(ModelConfig config,
                  PreprocessingParams preprocessing,
                  ClassMapLoader& class_maps,
                  RuntimeLoader loader = default_runtime_loader());

    // nullptr when the runtime is unavailable or failed to load
    std::shared_ptr<ModelRuntime> get();

    RuntimeStatus status() const;
    std::string last_error() const;

    // Version of the loaded model, or the stub version
    std::string model_version() const;

    void reset();

private:
    ModelConfig config_;
    PreprocessingParams preprocessing_;
    ClassMapLoader& class_maps_;
    RuntimeLoader loader_;

    mutable std::mutex mutex_;
    std::shared_ptr<ModelRuntime> runtime_;
    RuntimeStatus status_ = RuntimeStatus::NOT_LOADED;
    std::string last_error_;
};

} // namespace cattlediag
