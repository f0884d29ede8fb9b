#include "postprocessor.hpp"
#include "../../common/error.hpp"
#include "../../common/logging.hpp"
#include "../../common/utils.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>

namespace cattlediag {

namespace {

const char* const kLumpy = "lumpy";
constexpr double kMinScore = 1e-12;

std::string format_score(float score) {
    std::ostringstream ss;
    ss << score;
    return ss.str();
}

} // namespace

Postprocessor::Postprocessor(const PostprocessConfig& config,
                             std::shared_ptr<const TreatmentCatalog> treatments)
    : config_(config)
    , treatments_(std::move(treatments)) {
    CHECK_ARG(config_.temperature > 0.0f, "Temperature must be positive");
    if (!treatments_) {
        treatments_ = std::make_shared<TreatmentCatalog>();
    }
}

const KeywordTable& Postprocessor::keyword_table() {
    static const KeywordTable table = {
        {"foot-and-mouth", {"mouth", "ulcer", "saliva", "drool", "blister", "lesion"}},
        {"lumpy", {"lump", "bump", "swelling", "nodul", "lumpy"}},
        {"healthy", {"no sign", "healthy", "normal", "none"}},
    };
    return table;
}

const std::string& Postprocessor::low_confidence_note() {
    static const std::string note =
        "\n\nNote: Model confidence is low. Consider consulting a veterinarian "
        "and uploading additional images or symptom details.";
    return note;
}

void Postprocessor::normalize(PredictionSet& predictions) {
    double total = 0.0;
    for (const auto& prediction : predictions) {
        total += prediction.score;
    }
    if (total == 0.0) {
        total = 1.0;
    }
    for (auto& prediction : predictions) {
        prediction.score = static_cast<float>(prediction.score / total);
    }
}

PredictionSet Postprocessor::apply_temperature(const PredictionSet& predictions, float temperature) {
    if (temperature == 1.0f) {
        return predictions;
    }

    std::vector<double> scaled;
    scaled.reserve(predictions.size());
    double total = 0.0;
    for (const auto& prediction : predictions) {
        double clipped = std::min(std::max(static_cast<double>(prediction.score), kMinScore), 1.0);
        double value = std::exp(std::log(clipped) / temperature);
        scaled.push_back(value);
        total += value;
    }

    PredictionSet result = predictions;
    for (size_t i = 0; i < result.size(); ++i) {
        result[i].score = static_cast<float>(total > 0.0 ? scaled[i] / total : scaled[i]);
    }
    return result;
}

PredictionSet Postprocessor::boost_keywords(const PredictionSet& predictions,
                                            const std::string& symptom_text) const {
    std::string text = common::StringUtils::to_lower(symptom_text);

    std::map<std::string, double> boosts;
    for (const auto& [disease, keywords] : keyword_table()) {
        for (const auto& keyword : keywords) {
            if (text.find(keyword) != std::string::npos) {
                boosts[disease] += config_.keyword_boost;
            }
        }
    }

    PredictionSet result = predictions;
    for (auto& prediction : result) {
        auto it = boosts.find(prediction.disease);
        if (it != boosts.end()) {
            prediction.score = static_cast<float>(prediction.score + it->second);
        }
    }
    normalize(result);
    return result;
}

PredictionSet Postprocessor::apply_subject_heuristics(const PredictionSet& predictions,
                                                      const SubjectAttributes& subject) const {
    PredictionSet result = predictions;
    if (subject.weight_kg && *subject.weight_kg < config_.light_weight_threshold_kg) {
        for (auto& prediction : result) {
            if (prediction.disease == kLumpy) {
                prediction.score *= config_.light_weight_lumpy_factor;
            }
        }
    }
    return result;
}

ProcessedResult Postprocessor::process(const PredictionSet& raw,
                                       const std::string& symptom_text,
                                       const SubjectAttributes& subject,
                                       const std::string& explanation,
                                       std::optional<Severity> severity_override) const {
    ProcessedResult result;
    result.predictions_raw = raw;

    auto scores = apply_temperature(raw, config_.temperature);
    scores = boost_keywords(scores, symptom_text);
    scores = apply_subject_heuristics(scores, subject);
    normalize(scores);
    result.predictions_processed = std::move(scores);

    result.top = top_prediction(result.predictions_processed);
    result.confidence = result.top.score;
    result.uncertain = result.confidence < config_.uncertainty_threshold;
    result.severity = severity_override ? *severity_override
                                        : severity_for_confidence(result.confidence);

    if (result.uncertain) {
        result.recommendation_suffix = low_confidence_note();
    }
    result.recommendation = build_recommendation(explanation, result.top, subject) +
                            result.recommendation_suffix;

    LOG_DEBUG("Post-processed top=" + result.top.disease + " confidence=" +
              format_score(result.confidence) + (result.uncertain ? " (uncertain)" : ""));
    return result;
}

std::string Postprocessor::build_recommendation(const std::string& explanation,
                                                const Prediction& top,
                                                const SubjectAttributes& subject) const {
    std::string text = explanation;
    if (text.empty() && top.disease != "Unknown") {
        text = "Top prediction: " + top.disease + " (score " + format_score(top.score) +
               "). Consult a veterinarian for confirmation.";
    }

    auto treatment = treatments_->lookup(top.disease);
    if (!treatment) {
        return text;
    }
    text += "\n\nSuggested treatment:\n" + *treatment;

    auto rate = TreatmentCatalog::extract_mg_per_kg(*treatment);
    if (rate && *rate > 0.0 && subject.weight_kg && *subject.weight_kg > 0.0f) {
        text += "\n\nDosage guidance (auto-computed): " +
                TreatmentCatalog::compute_dosage(*subject.weight_kg, *rate);
    }
    return text;
}

} // namespace cattlediag
