#pragma once

#include "../../../core/artifacts/artifact_locator.hpp"
#include "../../../core/inference/diagnosis_service.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace cattlediag {
namespace api {
namespace rest {

/**
 * Build a DiagnosisRequest from a multipart (or url-encoded) form.
 * Text fields: symptom_text, case_id, breed, age, weight, severity.
 * Image part: "file", else "image".
 * @throws RequestException (400) when age or weight is not a number
 */
DiagnosisRequest parse_predict_request(const httplib::Request& req);

// Form field value from a multipart part or a url-encoded parameter
std::optional<std::string> form_value(const httplib::Request& req, const std::string& name);

// {"status":"ok"|"degraded","model_version":...,"runtime":...}
nlohmann::json health_status(DiagnosisService& service);

// Route handlers
void handle_predict(DiagnosisService& service, const httplib::Request& req, httplib::Response& res);
void handle_health(DiagnosisService& service, const httplib::Request& req, httplib::Response& res);
void handle_resolve_artifact(const ArtifactLocator& locator, const httplib::Request& req, httplib::Response& res);

} // namespace rest
} // namespace api
} // namespace cattlediag
