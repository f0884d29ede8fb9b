#include "diagnosis_service.hpp"
#include "../../common/error.hpp"
#include "../../common/logging.hpp"
#include "../../common/utils.hpp"
#include "../preprocessing/preprocessor.hpp"

namespace cattlediag {

using common::ErrorCode;
using common::RequestException;

nlohmann::json to_json(const Prediction& prediction) {
    return {{"disease", prediction.disease}, {"score", prediction.score}};
}

nlohmann::json to_json(const PredictionSet& predictions) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& prediction : predictions) {
        array.push_back(to_json(prediction));
    }
    return array;
}

nlohmann::json DiagnosisResponse::to_json() const {
    nlohmann::json json;
    json["case_id"] = case_id;
    json["symptom_text"] = symptom_text;

    json["predictions"] = cattlediag::to_json(inference.predictions);
    json["top"] = cattlediag::to_json(inference.top);
    json["confidence"] = inference.confidence;
    json["severity"] = to_string(inference.severity);
    json["gradcam_url"] = inference.gradcam_locator ? nlohmann::json(*inference.gradcam_locator)
                                                    : nlohmann::json(nullptr);
    json["explanation_text"] = inference.explanation_text;
    json["model_version"] = inference.model_version;

    json["predictions_processed"] = cattlediag::to_json(processed.predictions_processed);
    json["top_processed"] = cattlediag::to_json(processed.top);
    json["confidence_processed"] = processed.confidence;
    json["severity_processed"] = to_string(processed.severity);
    json["uncertain"] = processed.uncertain;
    json["recommendation"] = processed.recommendation;
    return json;
}

DiagnosisService::DiagnosisService(const ConfigManager& config, RuntimeLoader loader)
    : max_upload_bytes_(config.server().max_upload_bytes) {
    const auto& gradcam = config.gradcam();

    PreprocessingParams preprocessing;
    preprocessing.resize_short_side = gradcam.resize_short_side;
    preprocessing.crop_size = gradcam.crop_size;

    class_maps_ = std::make_unique<ClassMapLoader>(config.model().class_map_path);
    provider_ = std::make_unique<ModelProvider>(config.model(), preprocessing, *class_maps_, std::move(loader));
    generator_ = std::make_unique<GradcamGenerator>(
        *provider_, *class_maps_,
        OverlayRenderer(gradcam.output_dir, gradcam.mount_prefix, gradcam.overlay_alpha));

    auto treatments = std::make_shared<const TreatmentCatalog>(
        TreatmentCatalog::load(config.postprocess().treatment_map_path));
    postprocessor_ = std::make_unique<Postprocessor>(config.postprocess(), treatments);
}

cv::Mat DiagnosisService::decode_upload(const std::string& bytes, const std::string& content_type) const {
    if (bytes.size() > max_upload_bytes_) {
        throw RequestException(400, ErrorCode::PAYLOAD_TOO_LARGE,
                               "Image too large (max " + std::to_string(max_upload_bytes_ / (1024 * 1024)) + "MB)");
    }
    if (!common::StringUtils::starts_with(common::StringUtils::to_lower(content_type), "image/")) {
        throw RequestException(400, ErrorCode::UNSUPPORTED_MEDIA, "Uploaded file is not an image");
    }

    cv::Mat rgb = Preprocessor::decode_rgb(bytes);
    if (rgb.empty()) {
        throw RequestException(400, ErrorCode::IMAGE_DECODE_ERROR, "Could not decode image");
    }
    return rgb;
}

InferenceResult DiagnosisService::text_only_result() {
    const auto& class_map = class_maps_->load();

    InferenceResult result;
    float share = class_map.size() ? 1.0f / static_cast<float>(class_map.size()) : 0.0f;
    for (const auto& label : class_map.labels()) {
        result.predictions.push_back({label, share});
    }
    result.top = top_prediction(result.predictions);
    result.confidence = result.top.score;
    result.severity = severity_for_confidence(result.confidence);
    result.explanation_text = "Text-only assessment (no image supplied).";
    result.model_version = provider_->model_version();
    return result;
}

DiagnosisResponse DiagnosisService::diagnose(const DiagnosisRequest& request) {
    common::TimeUtils::Timer timer;

    DiagnosisResponse response;
    response.case_id = request.case_id;
    response.symptom_text = request.symptom_text;

    if (request.image_bytes) {
        cv::Mat rgb = decode_upload(*request.image_bytes, request.image_content_type);
        response.inference = generator_->infer(rgb);
    } else {
        response.inference = text_only_result();
    }

    response.processed = postprocessor_->process(response.inference.predictions,
                                                 request.symptom_text,
                                                 request.subject,
                                                 response.inference.explanation_text,
                                                 request.severity_override);

    // An external severity applies to both views; the advisory rides on the explanation too
    if (request.severity_override) {
        response.inference.severity = *request.severity_override;
    }
    response.inference.explanation_text += response.processed.recommendation_suffix;

    LOG_INFO("Diagnosis case=" + (request.case_id.empty() ? std::string("-") : request.case_id) +
             " top=" + response.processed.top.disease +
             " model=" + response.inference.model_version +
             " took " + std::to_string(static_cast<int>(timer.elapsed_ms())) + " ms");
    return response;
}

} // namespace cattlediag
