#pragma once

#include <optional>
#include <string>
#include <vector>

namespace cattlediag {

// One scored label
struct Prediction {
    std::string disease;
    float score = 0.0f;
};

using PredictionSet = std::vector<Prediction>;

enum class Severity {
    LOW,
    MEDIUM,
    HIGH
};

// "low" / "medium" / "high"
std::string to_string(Severity severity);

// Case-insensitive parse; nullopt for anything else
std::optional<Severity> parse_severity(const std::string& text);

// > 0.8 high, > 0.5 medium, otherwise low
Severity severity_for_confidence(float confidence);

// Highest-scoring entry; {"Unknown", 0} for an empty set
Prediction top_prediction(const PredictionSet& predictions);

// Result of one inference call, immutable once returned
struct InferenceResult {
    PredictionSet predictions;                      // Raw, in class-index order
    Prediction top;
    float confidence = 0.0f;
    Severity severity = Severity::LOW;
    std::optional<std::string> gradcam_locator;     // e.g. /gradcams/gradcam_<hex>.png
    std::string explanation_text;
    std::string model_version;
};

// Optional facts about the animal
struct SubjectAttributes {
    std::optional<std::string> breed;
    std::optional<float> age_years;
    std::optional<float> weight_kg;
};

} // namespace cattlediag
