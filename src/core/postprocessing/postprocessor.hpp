#pragma once

#include "treatment_catalog.hpp"
#include "../config/config_manager.hpp"
#include "../inference/inference_types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cattlediag {

// Post-processed view of one inference result
struct ProcessedResult {
    PredictionSet predictions_raw;
    PredictionSet predictions_processed;    // Sums to 1
    Prediction top;                         // Maximum of predictions_processed
    float confidence = 0.0f;
    bool uncertain = false;
    Severity severity = Severity::LOW;
    std::string recommendation;             // Explanation + treatment + dosage + suffix
    std::string recommendation_suffix;      // Low-confidence note, or empty
};

using KeywordTable = std::vector<std::pair<std::string, std::vector<std::string>>>;

/**
 * Calibrates and explains raw classifier scores:
 * temperature scaling, symptom keyword boosting, the light-animal lumpy
 * discount, renormalization, uncertainty and severity, and treatment text.
 */
class Postprocessor {
public:
    Postprocessor(const PostprocessConfig& config,
                  std::shared_ptr<const TreatmentCatalog> treatments = nullptr);

    /**
     * @param raw Scores in class-index order
     * @param explanation Base explanation text; a default is synthesized when empty
     * @param severity_override Externally supplied severity, wins over the computed one
     */
    ProcessedResult process(const PredictionSet& raw,
                            const std::string& symptom_text,
                            const SubjectAttributes& subject,
                            const std::string& explanation = "",
                            std::optional<Severity> severity_override = std::nullopt) const;

    // exp(ln(max(s, 1e-12)) / T), renormalized; T == 1 returns the input unchanged
    static PredictionSet apply_temperature(const PredictionSet& predictions, float temperature);

    // Adds the boost per matching keyword, then renormalizes
    PredictionSet boost_keywords(const PredictionSet& predictions, const std::string& symptom_text) const;

    // Lumpy score scaled down for animals below the weight threshold
    PredictionSet apply_subject_heuristics(const PredictionSet& predictions,
                                           const SubjectAttributes& subject) const;

    // Divide by the sum; a zero sum counts as 1
    static void normalize(PredictionSet& predictions);

    static const KeywordTable& keyword_table();

    static const std::string& low_confidence_note();

    const PostprocessConfig& config() const { return config_; }

private:
    std::string build_recommendation(const std::string& explanation,
                                     const Prediction& top,
                                     const SubjectAttributes& subject) const;

    PostprocessConfig config_;
    std::shared_ptr<const TreatmentCatalog> treatments_;
};

} // namespace cattlediag
