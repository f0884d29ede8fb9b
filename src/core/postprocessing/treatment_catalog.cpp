#include "treatment_catalog.hpp"
#include "../../common/logging.hpp"
#include "../../common/utils.hpp"
#include <fstream>
#include <iomanip>
#include <iterator>
#include <regex>
#include <sstream>

namespace cattlediag {

namespace {

const std::string kUtf8Bom = "\xEF\xBB\xBF";

std::string format_number(double value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

} // namespace

TreatmentCatalog::TreatmentCatalog(std::map<std::string, std::string> entries)
    : entries_(std::move(entries)) {
}

TreatmentCatalog TreatmentCatalog::load(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        LOG_INFO("No treatment map at " + path + ", treatment suggestions disabled");
        return TreatmentCatalog();
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (common::StringUtils::starts_with(text, kUtf8Bom)) {
        text.erase(0, kUtf8Bom.size());
    }

    try {
        auto catalog = from_json(nlohmann::json::parse(text));
        LOG_INFO("Loaded " + std::to_string(catalog.size()) + " treatment entries from " + path);
        return catalog;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARNING("Failed to parse treatment map " + path + ": " + e.what());
    }
    return TreatmentCatalog();
}

TreatmentCatalog TreatmentCatalog::from_json(const nlohmann::json& json) {
    std::map<std::string, std::string> entries;
    if (!json.is_object()) {
        LOG_WARNING("Treatment map is not a JSON object, ignoring it");
        return TreatmentCatalog();
    }
    for (const auto& [label, value] : json.items()) {
        entries[label] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return TreatmentCatalog(std::move(entries));
}

std::optional<std::string> TreatmentCatalog::lookup(const std::string& disease) const {
    auto it = entries_.find(disease);
    if (it == entries_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> TreatmentCatalog::extract_mg_per_kg(const std::string& text) {
    static const std::regex patterns[] = {
        std::regex(R"(([0-9]+(?:\.[0-9]+)?)\s*mg\s*/\s*kg)", std::regex::icase),
        std::regex(R"(mg[_\s/]*per[_\s]*kg[:=]?\s*([0-9]+(?:\.[0-9]+)?))", std::regex::icase),
        std::regex(R"(mg_per_kg[:=]\s*([0-9]+(?:\.[0-9]+)?))", std::regex::icase),
    };

    if (text.empty()) {
        return std::nullopt;
    }
    std::smatch match;
    for (const auto& pattern : patterns) {
        if (std::regex_search(text, match, pattern)) {
            auto value = common::StringUtils::parse_double(match[1].str());
            if (value) {
                return value;
            }
        }
    }
    return std::nullopt;
}

std::string TreatmentCatalog::compute_dosage(double weight_kg, double mg_per_kg) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(0) << (weight_kg * mg_per_kg) << " mg total ("
       << format_number(mg_per_kg) << " mg/kg \xC3\x97 " << format_number(weight_kg) << " kg)";
    return ss.str();
}

} // namespace cattlediag
