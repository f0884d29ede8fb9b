#pragma once

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cattlediag {

/**
 * Disease label -> suggested treatment text, with dosage extraction.
 * Loaded once at startup and read-only afterwards.
 */
class TreatmentCatalog {
public:
    TreatmentCatalog() = default;
    explicit TreatmentCatalog(std::map<std::string, std::string> entries);

    /**
     * Read a JSON object of label -> text. A UTF-8 byte order mark is skipped.
     * A missing file yields an empty catalog; a corrupt one is logged and
     * also yields an empty catalog.
     */
    static TreatmentCatalog load(const std::string& path);

    // Non-string values are kept in their JSON text form
    static TreatmentCatalog from_json(const nlohmann::json& json);

    std::optional<std::string> lookup(const std::string& disease) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /**
     * Find a per-kilogram rate in free text. Recognized spellings, in order:
     * "10 mg/kg", "mg per kg 10", "mg_per_kg: 10" (case-insensitive).
     */
    static std::optional<double> extract_mg_per_kg(const std::string& text);

    // "<total> mg total (<rate> mg/kg × <weight> kg)", total rounded to whole mg
    static std::string compute_dosage(double weight_kg, double mg_per_kg);

private:
    std::map<std::string, std::string> entries_;
};

} // namespace cattlediag
