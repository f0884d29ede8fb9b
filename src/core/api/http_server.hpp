#pragma once

#include "../artifacts/artifact_locator.hpp"
#include "../config/config_manager.hpp"
#include "../inference/diagnosis_service.hpp"
#include "../../api/rest/middleware/auth_middleware.hpp"
#include "../../api/rest/middleware/error_middleware.hpp"
#include "../../api/rest/middleware/logging_middleware.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <string>

namespace cattlediag {

// HTTP front end: routes, middleware and the Grad-CAM static mount
class HTTPServer {
public:
    HTTPServer(std::shared_ptr<DiagnosisService> service,
               std::shared_ptr<ArtifactLocator> locator,
               const ConfigManager& config);
    ~HTTPServer();

    // Blocks until stop() is called from another thread
    void start();
    void stop();
    bool is_running() const { return running_; }

    // Bind to an ephemeral port on host; returns the port. Use with listen_after_bind().
    int bind_to_any_port(const std::string& host);
    void listen_after_bind();

    const ServerConfig& config() const { return config_; }
    httplib::Server& server() { return *server_; }

private:
    void mount_gradcams();

    std::shared_ptr<DiagnosisService> service_;
    std::shared_ptr<ArtifactLocator> locator_;
    ServerConfig config_;
    GradcamConfig gradcam_config_;
    std::atomic<bool> running_{false};

    api::rest::AuthMiddleware auth_;
    api::rest::ErrorMiddleware errors_;
    api::rest::LoggingMiddleware logging_;

    std::unique_ptr<httplib::Server> server_;
};

} // namespace cattlediag
