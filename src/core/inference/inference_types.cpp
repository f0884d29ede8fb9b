#include "inference_types.hpp"
#include "../../common/utils.hpp"

namespace cattlediag {

std::string to_string(Severity severity) {
    switch (severity) {
        case Severity::LOW: return "low";
        case Severity::MEDIUM: return "medium";
        case Severity::HIGH: return "high";
    }
    return "low";
}

std::optional<Severity> parse_severity(const std::string& text) {
    std::string value = common::StringUtils::to_lower(common::StringUtils::trim(text));
    if (value == "low") return Severity::LOW;
    if (value == "medium") return Severity::MEDIUM;
    if (value == "high") return Severity::HIGH;
    return std::nullopt;
}

Severity severity_for_confidence(float confidence) {
    if (confidence > 0.8f) {
        return Severity::HIGH;
    }
    if (confidence > 0.5f) {
        return Severity::MEDIUM;
    }
    return Severity::LOW;
}

Prediction top_prediction(const PredictionSet& predictions) {
    if (predictions.empty()) {
        return {"Unknown", 0.0f};
    }
    const Prediction* best = &predictions.front();
    for (const auto& prediction : predictions) {
        if (prediction.score > best->score) {
            best = &prediction;
        }
    }
    return *best;
}

} // namespace cattlediag
