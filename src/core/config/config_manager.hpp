#pragma once

#include "../../common/logging.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cattlediag {

// Model and checkpoint configuration
struct ModelConfig {
    std::string checkpoint_path = "models/best_model.pth";
    std::string class_map_path = "models/class_map.json";
    bool allow_unsafe_load = false;          // Permit TorchScript fallback for opaque checkpoints
    std::string device = "cpu";              // "cpu" or "cuda"
    std::string stub_model_version = "stub";
};

// Grad-CAM rendering configuration
struct GradcamConfig {
    std::string output_dir = "gradcams";     // Where overlay PNGs are written
    std::string mount_prefix = "/gradcams";  // URL prefix the output directory is served under
    int resize_short_side = 256;
    int crop_size = 224;
    float overlay_alpha = 0.6f;
};

// Prediction post-processing configuration
struct PostprocessConfig {
    float temperature = 1.0f;                // <1.0 sharpens, >1.0 smooths
    float keyword_boost = 0.18f;
    float uncertainty_threshold = 0.5f;
    std::string treatment_map_path = "metadata/treatment_map.json";
    float light_weight_threshold_kg = 40.0f;
    float light_weight_lumpy_factor = 0.9f;
};

// Artifact resolution configuration
struct ArtifactConfig {
    std::string project_root = ".";
    std::string inference_subdir = "ml-inference";
    std::string gradcam_subdir = "gradcams";
    std::string fallback_dir = "gradcams";
    std::string sample_gradcam_path;         // Last-resort local image
    std::string public_base;                 // e.g. http://inference:8001
    std::string inference_url;               // e.g. http://inference:8001/predict
    int http_timeout_sec = 20;
};

// HTTP service configuration
struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8001;
    std::string secret = "dev-secret-please-change";
    std::string secret_header = "X-Inference-Secret";
    size_t max_upload_bytes = 10 * 1024 * 1024;
    size_t num_threads = 4;
    std::string log_level = "INFO";
    std::string log_dir = "logs";
    bool log_to_file = false;
};

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager() = default;

    // Load/save configurations
    void load_from_file(const std::string& path);
    void save_to_file(const std::string& path) const;

    // Environment variables override file values
    void apply_environment();

    // Access configurations
    const ModelConfig& model() const { return model_config_; }
    const GradcamConfig& gradcam() const { return gradcam_config_; }
    const PostprocessConfig& postprocess() const { return postprocess_config_; }
    const ArtifactConfig& artifacts() const { return artifact_config_; }
    const ServerConfig& server() const { return server_config_; }

    // Logger settings derived from the server section
    common::LogConfig log_config() const;

    // Runtime parameter updates, e.g. update_param("temperature", "1.5")
    void update_param(const std::string& param, const std::string& value);

    // Reset configurations
    void reset_to_defaults();

    // Validation
    bool validate_configurations() const;
    std::string get_validation_errors() const;

private:
    ModelConfig model_config_;
    GradcamConfig gradcam_config_;
    PostprocessConfig postprocess_config_;
    ArtifactConfig artifact_config_;
    ServerConfig server_config_;

    // Validation state
    mutable std::vector<std::string> validation_errors_;

    // Internal helper methods
    void load_json_config(const nlohmann::json& json);
    nlohmann::json save_json_config() const;
    bool validate_model_config() const;
    bool validate_gradcam_config() const;
    bool validate_postprocess_config() const;
    bool validate_server_config() const;

    // Parameter conversion helpers
    template<typename T>
    T convert_param_value(const std::string& value) const;
};

} // namespace cattlediag
