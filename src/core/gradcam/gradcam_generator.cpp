#include "gradcam_generator.hpp"
#include "../../common/error.hpp"
#include "../../common/logging.hpp"
#include "../../common/utils.hpp"
#include <opencv2/core.hpp>

namespace cattlediag {

GradcamGenerator::GradcamGenerator(ModelProvider& provider, ClassMapLoader& class_maps, OverlayRenderer renderer)
    : provider_(provider)
    , class_maps_(class_maps)
    , renderer_(std::move(renderer)) {
}

InferenceResult GradcamGenerator::stub_result(StubKind kind, const std::string& model_version) {
    InferenceResult result;
    if (kind == StubKind::RUNTIME_UNAVAILABLE) {
        result.predictions = {{"foot-and-mouth", 0.5f}, {"lumpy", 0.3f}, {"healthy", 0.2f}};
        result.explanation_text = "Stub (numeric runtime not available).";
    } else {
        result.predictions = {{"foot-and-mouth", 0.82f}, {"lumpy", 0.10f}, {"healthy", 0.08f}};
        result.explanation_text = "Stub: model load failed on server, returning fallback.";
    }
    result.top = top_prediction(result.predictions);
    result.confidence = result.top.score;
    result.severity = severity_for_confidence(result.confidence);
    result.model_version = model_version;
    return result;
}

InferenceResult GradcamGenerator::infer(const cv::Mat& rgb, bool with_gradcam) {
    CHECK_ARG(!rgb.empty(), "Cannot classify an empty image");

    auto runtime = provider_.get();
    if (!runtime) {
        auto kind = provider_.status() == RuntimeStatus::UNAVAILABLE
            ? StubKind::RUNTIME_UNAVAILABLE
            : StubKind::LOAD_FAILED;
        return stub_result(kind, provider_.model_version());
    }

    common::TimeUtils::Timer timer;
    RuntimeOutput output;
    try {
        output = runtime->run(rgb, with_gradcam && runtime->supports_saliency());
    } catch (const std::exception& e) {
        LOG_ERROR("Inference failed, returning fallback: " + std::string(e.what()));
        return stub_result(StubKind::LOAD_FAILED, provider_.model_version());
    }

    InferenceResult result;
    result.predictions = label(output.probabilities);
    result.top = top_prediction(result.predictions);
    result.confidence = result.top.score;
    result.severity = severity_for_confidence(result.confidence);
    result.explanation_text = "Model result (local).";
    result.model_version = runtime->model_version();

    if (output.saliency) {
        try {
            result.gradcam_locator = renderer_.write(rgb, *output.saliency);
        } catch (const common::Exception& e) {
            LOG_ERROR("Failed to save Grad-CAM overlay: " + std::string(e.what()));
        } catch (const cv::Exception& e) {
            LOG_ERROR("Failed to render Grad-CAM overlay: " + std::string(e.what()));
        }
    }

    LOG_DEBUG("Inference took " + std::to_string(timer.elapsed_ms()) + " ms, top=" +
              result.top.disease);
    return result;
}

PredictionSet GradcamGenerator::label(const std::vector<float>& probabilities) {
    const auto& class_map = class_maps_.load();
    PredictionSet predictions;
    predictions.reserve(probabilities.size());
    for (size_t i = 0; i < probabilities.size(); ++i) {
        predictions.push_back({class_map.label_for(i), probabilities[i]});
    }
    return predictions;
}

} // namespace cattlediag
