#pragma once

#include "inference_types.hpp"
#include "../classmap/class_map.hpp"
#include "../config/config_manager.hpp"
#include "../gradcam/gradcam_generator.hpp"
#include "../model/model_runtime.hpp"
#include "../postprocessing/postprocessor.hpp"
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cattlediag {

/**
 * One diagnosis call, as received from the HTTP surface or a CLI tool
 */
struct DiagnosisRequest {
    std::string case_id;
    std::string symptom_text;
    SubjectAttributes subject;
    std::optional<Severity> severity_override;

    // Encoded upload; absent for a text-only assessment
    std::optional<std::string> image_bytes;
    std::string image_content_type;
};

/**
 * Wire form of a diagnosis
 */
struct DiagnosisResponse {
    std::string case_id;
    std::string symptom_text;
    InferenceResult inference;
    ProcessedResult processed;

    nlohmann::json to_json() const;
};

nlohmann::json to_json(const Prediction& prediction);
nlohmann::json to_json(const PredictionSet& predictions);

/**
 * Validates a request, runs inference (or the text-only path) and
 * post-processing, and assembles the response.
 */
class DiagnosisService {
public:
    explicit DiagnosisService(const ConfigManager& config,
                              RuntimeLoader loader = default_runtime_loader());

    /**
     * @throws RequestException (400) for an oversize, non-image or undecodable upload
     */
    DiagnosisResponse diagnose(const DiagnosisRequest& request);

    // Check upload size and MIME type, then decode to RGB
    cv::Mat decode_upload(const std::string& bytes, const std::string& content_type) const;

    // Uniform scores over the class map, for requests without an image
    InferenceResult text_only_result();

    ModelProvider& model_provider() { return *provider_; }
    ClassMapLoader& class_maps() { return *class_maps_; }
    const Postprocessor& postprocessor() const { return *postprocessor_; }

private:
    size_t max_upload_bytes_;
    std::unique_ptr<ClassMapLoader> class_maps_;
    std::unique_ptr<ModelProvider> provider_;
    std::unique_ptr<GradcamGenerator> generator_;
    std::unique_ptr<Postprocessor> postprocessor_;
};

} // namespace cattlediag
