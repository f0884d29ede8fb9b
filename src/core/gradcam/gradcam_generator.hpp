#pragma once

#include "overlay_renderer.hpp"
#include "../classmap/class_map.hpp"
#include "../inference/inference_types.hpp"
#include "../model/model_runtime.hpp"
#include <opencv2/core.hpp>

namespace cattlediag {

// Which canned result a degraded call returns
enum class StubKind {
    RUNTIME_UNAVAILABLE,    // Built without a numeric runtime
    LOAD_FAILED             // Checkpoint load or inference raised
};

/**
 * Classifies one image and explains the top class with a Grad-CAM overlay.
 * Never throws for model problems: those yield a labeled stub result with a
 * null locator.
 */
class GradcamGenerator {
public:
    GradcamGenerator(ModelProvider& provider, ClassMapLoader& class_maps, OverlayRenderer renderer);

    /**
     * @param rgb Decoded 8-bit RGB image
     * @param with_gradcam Render and persist the overlay when the model supports it
     */
    InferenceResult infer(const cv::Mat& rgb, bool with_gradcam = true);

    // Canned result for a degraded call
    static InferenceResult stub_result(StubKind kind, const std::string& model_version);

private:
    PredictionSet label(const std::vector<float>& probabilities);

    ModelProvider& provider_;
    ClassMapLoader& class_maps_;
    OverlayRenderer renderer_;
};

} // namespace cattlediag
