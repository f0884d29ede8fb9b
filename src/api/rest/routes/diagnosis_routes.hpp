#pragma once

#include "../middleware/auth_middleware.hpp"
#include "../middleware/logging_middleware.hpp"
#include "../../../core/artifacts/artifact_locator.hpp"
#include "../../../core/inference/diagnosis_service.hpp"
#include <httplib.h>

namespace cattlediag {
namespace api {
namespace rest {

// Route configuration for the diagnosis endpoints
struct DiagnosisRouteConfig {
    std::string predict_path = "/predict";
    std::string health_path = "/health";
    std::string resolve_path = "/artifacts/resolve";
};

// Everything the routes dispatch to; must outlive the server
struct DiagnosisRouteContext {
    DiagnosisService& service;
    const ArtifactLocator& locator;
    const AuthMiddleware& auth;
    const LoggingMiddleware& logging;
};

// Register /predict, /health and /artifacts/resolve. Health skips the secret check.
void register_diagnosis_routes(
    httplib::Server& server,
    const DiagnosisRouteContext& context,
    const DiagnosisRouteConfig& config = DiagnosisRouteConfig());

} // namespace rest
} // namespace api
} // namespace cattlediag
