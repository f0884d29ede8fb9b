#include "diagnosis_handler.hpp"
#include "../../../common/error.hpp"
#include "../../../common/logging.hpp"
#include "../../../common/utils.hpp"

namespace cattlediag {
namespace api {
namespace rest {

using json = nlohmann::json;
using common::ErrorCode;
using common::RequestException;
using common::StringUtils;

namespace {

std::optional<float> numeric_field(const httplib::Request& req, const std::string& name) {
    auto raw = form_value(req, name);
    if (!raw || StringUtils::trim(*raw).empty()) {
        return std::nullopt;
    }
    auto value = StringUtils::parse_double(*raw);
    if (!value) {
        throw RequestException("Field '" + name + "' must be a number");
    }
    return static_cast<float>(*value);
}

bool is_png(const std::string& bytes) {
    static const std::string magic("\x89PNG\r\n\x1a\n", 8);
    return bytes.compare(0, magic.size(), magic) == 0;
}

} // namespace

std::optional<std::string> form_value(const httplib::Request& req, const std::string& name) {
    if (req.has_file(name)) {
        return req.get_file_value(name).content;
    }
    if (req.has_param(name)) {
        return req.get_param_value(name);
    }
    return std::nullopt;
}

DiagnosisRequest parse_predict_request(const httplib::Request& req) {
    DiagnosisRequest request;
    request.symptom_text = form_value(req, "symptom_text").value_or("");
    request.case_id = form_value(req, "case_id").value_or("");

    if (auto breed = form_value(req, "breed")) {
        if (!StringUtils::trim(*breed).empty()) {
            request.subject.breed = StringUtils::trim(*breed);
        }
    }
    request.subject.age_years = numeric_field(req, "age");
    request.subject.weight_kg = numeric_field(req, "weight");

    if (auto severity = form_value(req, "severity")) {
        request.severity_override = parse_severity(*severity);
        if (!request.severity_override && !StringUtils::trim(*severity).empty()) {
            LOG_DEBUG("Ignoring unknown severity '" + *severity + "'");
        }
    }

    for (const char* part : {"file", "image"}) {
        if (req.has_file(part)) {
            const auto& file = req.get_file_value(part);
            request.image_bytes = file.content;
            request.image_content_type = file.content_type;
            break;
        }
    }
    return request;
}

json health_status(DiagnosisService& service) {
    auto& provider = service.model_provider();
    auto status = provider.status();
    bool healthy = status == RuntimeStatus::READY || status == RuntimeStatus::NOT_LOADED;

    json health = {
        {"status", healthy ? "ok" : "degraded"},
        {"model_version", provider.model_version()},
        {"runtime", to_string(status)}
    };
    if (!provider.last_error().empty()) {
        health["detail"] = provider.last_error();
    }
    return health;
}

void handle_predict(DiagnosisService& service, const httplib::Request& req, httplib::Response& res) {
    auto request = parse_predict_request(req);
    auto response = service.diagnose(request);
    res.set_content(response.to_json().dump(), "application/json");
}

void handle_health(DiagnosisService& service, const httplib::Request&, httplib::Response& res) {
    res.set_content(health_status(service).dump(), "application/json");
}

void handle_resolve_artifact(const ArtifactLocator& locator, const httplib::Request& req, httplib::Response& res) {
    json body;
    try {
        body = json::parse(req.body);
    } catch (const json::exception& e) {
        throw RequestException("Invalid JSON: " + std::string(e.what()));
    }
    if (!body.is_object() || !body.contains("locator") || !body["locator"].is_string()) {
        throw RequestException("Missing locator parameter");
    }

    std::string target = body["locator"].get<std::string>();
    auto bytes = locator.resolve(target);
    if (!bytes) {
        throw RequestException(404, ErrorCode::ARTIFACT_NOT_FOUND, "Artifact not found: " + target);
    }
    res.set_content(*bytes, is_png(*bytes) ? "image/png" : "application/octet-stream");
}

} // namespace rest
} // namespace api
} // namespace cattlediag
