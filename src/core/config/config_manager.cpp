#include "config_manager.hpp"
#include "../../common/error.hpp"
#include "../../common/logging.hpp"
#include "../../common/utils.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace cattlediag {

using common::ConfigException;
using common::StringUtils;

namespace {

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

} // namespace

template<typename T>
T ConfigManager::convert_param_value(const std::string& value) const {
    std::istringstream iss(StringUtils::trim(value));
    T result;

    if (!(iss >> result) || !iss.eof()) {
        throw ConfigException("Failed to convert value: " + value);
    }

    return result;
}

template<>
bool ConfigManager::convert_param_value<bool>(const std::string& value) const {
    std::string lowered = StringUtils::to_lower(StringUtils::trim(value));
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    throw ConfigException("Failed to convert value: " + value);
}

ConfigManager::ConfigManager() {
    reset_to_defaults();
}

void ConfigManager::load_from_file(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw ConfigException("Failed to open config file: " + path);
        }

        nlohmann::json json;
        file >> json;

        load_json_config(json);

        if (!validate_configurations()) {
            throw ConfigException("Invalid configuration: " + get_validation_errors());
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigException("JSON parsing error: " + std::string(e.what()));
    }
}

void ConfigManager::save_to_file(const std::string& path) const {
    try {
        nlohmann::json json = save_json_config();

        std::ofstream file(path);
        if (!file.is_open()) {
            throw ConfigException("Failed to create config file: " + path);
        }

        file << json.dump(4);  // Pretty print with 4-space indent
    } catch (const nlohmann::json::exception& e) {
        throw ConfigException("JSON serialization error: " + std::string(e.what()));
    }
}

void ConfigManager::apply_environment() {
    struct EnvBinding {
        const char* variable;
        const char* param;
    };
    static const EnvBinding bindings[] = {
        {"MODEL_PATH", "checkpoint_path"},
        {"CLASS_MAP_PATH", "class_map_path"},
        {"INFERENCE_DEVICE", "device"},
        {"GRADCAM_OUT_DIR", "gradcam_output_dir"},
        {"ML_TEMP", "temperature"},
        {"ML_KEYWORD_BOOST", "keyword_boost"},
        {"ML_UNCERTAINTY_THRESHOLD", "uncertainty_threshold"},
        {"TREATMENT_MAP_PATH", "treatment_map_path"},
        {"INFERENCE_SECRET", "secret"},
        {"INFERENCE_PORT", "port"},
        {"INFERENCE_PUBLIC_BASE", "public_base"},
        {"INFERENCE_URL", "inference_url"},
        {"SAMPLE_GRADCAM_PATH", "sample_gradcam_path"},
        {"PROJECT_ROOT", "project_root"},
        {"LOG_LEVEL", "log_level"},
    };

    for (const auto& binding : bindings) {
        if (const char* value = env_value(binding.variable)) {
            update_param(binding.param, value);
        }
    }

    // Only the literal "1" enables the unsafe fallback
    if (const char* unsafe = env_value("INFERENCE_ALLOW_UNSAFE_LOAD")) {
        model_config_.allow_unsafe_load = std::string(unsafe) == "1";
    }
}

void ConfigManager::update_param(const std::string& param, const std::string& value) {
    try {
        if (param == "checkpoint_path") {
            model_config_.checkpoint_path = value;
        } else if (param == "class_map_path") {
            model_config_.class_map_path = value;
        } else if (param == "allow_unsafe_load") {
            model_config_.allow_unsafe_load = convert_param_value<bool>(value);
        } else if (param == "device") {
            model_config_.device = value;
        } else if (param == "gradcam_output_dir") {
            gradcam_config_.output_dir = value;
        } else if (param == "overlay_alpha") {
            gradcam_config_.overlay_alpha = convert_param_value<float>(value);
        } else if (param == "temperature") {
            postprocess_config_.temperature = convert_param_value<float>(value);
        } else if (param == "keyword_boost") {
            postprocess_config_.keyword_boost = convert_param_value<float>(value);
        } else if (param == "uncertainty_threshold") {
            postprocess_config_.uncertainty_threshold = convert_param_value<float>(value);
        } else if (param == "treatment_map_path") {
            postprocess_config_.treatment_map_path = value;
        } else if (param == "project_root") {
            artifact_config_.project_root = value;
        } else if (param == "sample_gradcam_path") {
            artifact_config_.sample_gradcam_path = value;
        } else if (param == "public_base") {
            artifact_config_.public_base = value;
        } else if (param == "inference_url") {
            artifact_config_.inference_url = value;
        } else if (param == "http_timeout_sec") {
            artifact_config_.http_timeout_sec = convert_param_value<int>(value);
        } else if (param == "secret") {
            server_config_.secret = value;
        } else if (param == "port") {
            server_config_.port = convert_param_value<int>(value);
        } else if (param == "max_upload_bytes") {
            server_config_.max_upload_bytes = convert_param_value<size_t>(value);
        } else if (param == "num_threads") {
            server_config_.num_threads = convert_param_value<size_t>(value);
        } else if (param == "log_level") {
            server_config_.log_level = value;
        } else {
            throw ConfigException("Unknown parameter: " + param);
        }

        if (!validate_configurations()) {
            throw ConfigException("Invalid configuration: " + get_validation_errors());
        }
    } catch (const ConfigException& e) {
        throw ConfigException("Failed to update parameter " + param + ": " + e.what());
    }
}

void ConfigManager::reset_to_defaults() {
    model_config_ = ModelConfig();
    gradcam_config_ = GradcamConfig();
    postprocess_config_ = PostprocessConfig();
    artifact_config_ = ArtifactConfig();
    server_config_ = ServerConfig();
    validation_errors_.clear();
}

bool ConfigManager::validate_configurations() const {
    validation_errors_.clear();
    // Run every validator so all errors are collected
    bool model_ok = validate_model_config();
    bool gradcam_ok = validate_gradcam_config();
    bool postprocess_ok = validate_postprocess_config();
    bool server_ok = validate_server_config();
    return model_ok && gradcam_ok && postprocess_ok && server_ok;
}

std::string ConfigManager::get_validation_errors() const {
    std::stringstream ss;
    for (const auto& error : validation_errors_) {
        ss << error << "\n";
    }
    return ss.str();
}

void ConfigManager::load_json_config(const nlohmann::json& json) {
    if (json.contains("model")) {
        const auto& m = json["model"];
        model_config_.checkpoint_path = m.value("checkpoint_path", model_config_.checkpoint_path);
        model_config_.class_map_path = m.value("class_map_path", model_config_.class_map_path);
        model_config_.allow_unsafe_load = m.value("allow_unsafe_load", model_config_.allow_unsafe_load);
        model_config_.device = m.value("device", model_config_.device);
        model_config_.stub_model_version = m.value("stub_model_version", model_config_.stub_model_version);
    }

    if (json.contains("gradcam")) {
        const auto& g = json["gradcam"];
        gradcam_config_.output_dir = g.value("output_dir", gradcam_config_.output_dir);
        gradcam_config_.mount_prefix = g.value("mount_prefix", gradcam_config_.mount_prefix);
        gradcam_config_.resize_short_side = g.value("resize_short_side", gradcam_config_.resize_short_side);
        gradcam_config_.crop_size = g.value("crop_size", gradcam_config_.crop_size);
        gradcam_config_.overlay_alpha = g.value("overlay_alpha", gradcam_config_.overlay_alpha);
    }

    if (json.contains("postprocess")) {
        const auto& p = json["postprocess"];
        postprocess_config_.temperature = p.value("temperature", postprocess_config_.temperature);
        postprocess_config_.keyword_boost = p.value("keyword_boost", postprocess_config_.keyword_boost);
        postprocess_config_.uncertainty_threshold =
            p.value("uncertainty_threshold", postprocess_config_.uncertainty_threshold);
        postprocess_config_.treatment_map_path =
            p.value("treatment_map_path", postprocess_config_.treatment_map_path);
        postprocess_config_.light_weight_threshold_kg =
            p.value("light_weight_threshold_kg", postprocess_config_.light_weight_threshold_kg);
        postprocess_config_.light_weight_lumpy_factor =
            p.value("light_weight_lumpy_factor", postprocess_config_.light_weight_lumpy_factor);
    }

    if (json.contains("artifacts")) {
        const auto& a = json["artifacts"];
        artifact_config_.project_root = a.value("project_root", artifact_config_.project_root);
        artifact_config_.inference_subdir = a.value("inference_subdir", artifact_config_.inference_subdir);
        artifact_config_.gradcam_subdir = a.value("gradcam_subdir", artifact_config_.gradcam_subdir);
        artifact_config_.fallback_dir = a.value("fallback_dir", artifact_config_.fallback_dir);
        artifact_config_.sample_gradcam_path =
            a.value("sample_gradcam_path", artifact_config_.sample_gradcam_path);
        artifact_config_.public_base = a.value("public_base", artifact_config_.public_base);
        artifact_config_.inference_url = a.value("inference_url", artifact_config_.inference_url);
        artifact_config_.http_timeout_sec = a.value("http_timeout_sec", artifact_config_.http_timeout_sec);
    }

    if (json.contains("server")) {
        const auto& s = json["server"];
        server_config_.host = s.value("host", server_config_.host);
        server_config_.port = s.value("port", server_config_.port);
        server_config_.secret = s.value("secret", server_config_.secret);
        server_config_.secret_header = s.value("secret_header", server_config_.secret_header);
        server_config_.max_upload_bytes = s.value("max_upload_bytes", server_config_.max_upload_bytes);
        server_config_.num_threads = s.value("num_threads", server_config_.num_threads);
        server_config_.log_level = s.value("log_level", server_config_.log_level);
        server_config_.log_dir = s.value("log_dir", server_config_.log_dir);
        server_config_.log_to_file = s.value("log_to_file", server_config_.log_to_file);
    }
}

nlohmann::json ConfigManager::save_json_config() const {
    nlohmann::json json;

    json["model"] = {
        {"checkpoint_path", model_config_.checkpoint_path},
        {"class_map_path", model_config_.class_map_path},
        {"allow_unsafe_load", model_config_.allow_unsafe_load},
        {"device", model_config_.device},
        {"stub_model_version", model_config_.stub_model_version}
    };

    json["gradcam"] = {
        {"output_dir", gradcam_config_.output_dir},
        {"mount_prefix", gradcam_config_.mount_prefix},
        {"resize_short_side", gradcam_config_.resize_short_side},
        {"crop_size", gradcam_config_.crop_size},
        {"overlay_alpha", gradcam_config_.overlay_alpha}
    };

    json["postprocess"] = {
        {"temperature", postprocess_config_.temperature},
        {"keyword_boost", postprocess_config_.keyword_boost},
        {"uncertainty_threshold", postprocess_config_.uncertainty_threshold},
        {"treatment_map_path", postprocess_config_.treatment_map_path},
        {"light_weight_threshold_kg", postprocess_config_.light_weight_threshold_kg},
        {"light_weight_lumpy_factor", postprocess_config_.light_weight_lumpy_factor}
    };

    json["artifacts"] = {
        {"project_root", artifact_config_.project_root},
        {"inference_subdir", artifact_config_.inference_subdir},
        {"gradcam_subdir", artifact_config_.gradcam_subdir},
        {"fallback_dir", artifact_config_.fallback_dir},
        {"sample_gradcam_path", artifact_config_.sample_gradcam_path},
        {"public_base", artifact_config_.public_base},
        {"inference_url", artifact_config_.inference_url},
        {"http_timeout_sec", artifact_config_.http_timeout_sec}
    };

    // The secret is deliberately not written back out
    json["server"] = {
        {"host", server_config_.host},
        {"port", server_config_.port},
        {"secret_header", server_config_.secret_header},
        {"max_upload_bytes", server_config_.max_upload_bytes},
        {"num_threads", server_config_.num_threads},
        {"log_level", server_config_.log_level},
        {"log_dir", server_config_.log_dir},
        {"log_to_file", server_config_.log_to_file}
    };

    return json;
}

bool ConfigManager::validate_model_config() const {
    bool valid = true;

    if (model_config_.checkpoint_path.empty()) {
        validation_errors_.push_back("Checkpoint path must not be empty");
        valid = false;
    }

    if (model_config_.device != "cpu" && model_config_.device != "cuda") {
        validation_errors_.push_back("Unsupported device: " + model_config_.device);
        valid = false;
    }

    return valid;
}

bool ConfigManager::validate_gradcam_config() const {
    bool valid = true;

    if (gradcam_config_.crop_size <= 0 || gradcam_config_.resize_short_side <= 0) {
        validation_errors_.push_back("Resize and crop sizes must be greater than 0");
        valid = false;
    } else if (gradcam_config_.crop_size > gradcam_config_.resize_short_side) {
        validation_errors_.push_back("Crop size must not exceed the resized short side");
        valid = false;
    }

    if (gradcam_config_.overlay_alpha < 0.0f || gradcam_config_.overlay_alpha > 1.0f) {
        validation_errors_.push_back("Overlay alpha must be between 0 and 1");
        valid = false;
    }

    if (gradcam_config_.output_dir.empty()) {
        validation_errors_.push_back("Grad-CAM output directory must not be empty");
        valid = false;
    }

    return valid;
}

bool ConfigManager::validate_postprocess_config() const {
    bool valid = true;

    if (postprocess_config_.temperature <= 0.0f) {
        validation_errors_.push_back("Temperature must be greater than 0");
        valid = false;
    }

    if (postprocess_config_.keyword_boost < 0.0f) {
        validation_errors_.push_back("Keyword boost must be non-negative");
        valid = false;
    }

    if (postprocess_config_.uncertainty_threshold < 0.0f ||
        postprocess_config_.uncertainty_threshold > 1.0f) {
        validation_errors_.push_back("Uncertainty threshold must be between 0 and 1");
        valid = false;
    }

    if (postprocess_config_.light_weight_lumpy_factor < 0.0f) {
        validation_errors_.push_back("Light-weight discount factor must be non-negative");
        valid = false;
    }

    return valid;
}

bool ConfigManager::validate_server_config() const {
    bool valid = true;

    if (server_config_.port <= 0 || server_config_.port > 65535) {
        validation_errors_.push_back("Port must be between 1 and 65535");
        valid = false;
    }

    if (server_config_.secret.empty()) {
        validation_errors_.push_back("Inference secret must not be empty");
        valid = false;
    }

    if (server_config_.num_threads == 0) {
        validation_errors_.push_back("Number of worker threads must be greater than 0");
        valid = false;
    }

    if (server_config_.max_upload_bytes == 0) {
        validation_errors_.push_back("Maximum upload size must be greater than 0");
        valid = false;
    }

    return valid;
}

// Explicit template instantiations
template size_t ConfigManager::convert_param_value<size_t>(const std::string&) const;
template int ConfigManager::convert_param_value<int>(const std::string&) const;
template float ConfigManager::convert_param_value<float>(const std::string&) const;

common::LogConfig ConfigManager::log_config() const {
    common::LogConfig log;
    log.level = common::parse_log_level(server_config_.log_level);
    log.log_dir = server_config_.log_dir;
    log.file_output = server_config_.log_to_file;
    return log;
}

} // namespace cattlediag
