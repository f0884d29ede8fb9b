#include "http_server.hpp"
#include "../../api/rest/routes/diagnosis_routes.hpp"
#include "../../common/error.hpp"
#include "../../common/logging.hpp"
#include <filesystem>

namespace cattlediag {

namespace fs = std::filesystem;

namespace {

api::rest::AuthConfig auth_config(const ServerConfig& config) {
    api::rest::AuthConfig auth;
    auth.secret = config.secret;
    auth.secret_header = config.secret_header;
    return auth;
}

api::rest::LoggingConfig logging_config(const ServerConfig& config) {
    api::rest::LoggingConfig logging;
    logging.secret_header = config.secret_header;
    return logging;
}

} // namespace

HTTPServer::HTTPServer(std::shared_ptr<DiagnosisService> service,
                       std::shared_ptr<ArtifactLocator> locator,
                       const ConfigManager& config)
    : service_(std::move(service))
    , locator_(std::move(locator))
    , config_(config.server())
    , gradcam_config_(config.gradcam())
    , auth_(auth_config(config_))
    , logging_(logging_config(config_))
    , server_(std::make_unique<httplib::Server>()) {

    CHECK_ARG(service_ != nullptr, "Diagnosis service cannot be null");
    CHECK_ARG(locator_ != nullptr, "Artifact locator cannot be null");

    size_t threads = config_.num_threads;
    server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    server_->set_payload_max_length(config_.max_upload_bytes + 1024 * 1024);

    api::rest::register_diagnosis_routes(*server_, {*service_, *locator_, auth_, logging_});
    mount_gradcams();

    // Unrouted paths and handler failures
    server_->set_error_handler([this](const auto& req, auto& res) {
        if (res.body.empty()) {
            errors_.handle_error(req, res, res.status,
                                 res.status == 404 ? "Not found" : httplib::status_message(res.status));
        }
    });

    server_->set_exception_handler([this](const auto& req, auto& res, std::exception_ptr ep) {
        errors_.handle_exception(req, res, ep);
    });
}

HTTPServer::~HTTPServer() {
    stop();
}

void HTTPServer::mount_gradcams() {
    std::error_code ec;
    fs::create_directories(gradcam_config_.output_dir, ec);
    if (ec) {
        throw common::IOException("Cannot create Grad-CAM directory " + gradcam_config_.output_dir +
                                  ": " + ec.message());
    }
    if (!server_->set_mount_point(gradcam_config_.mount_prefix, gradcam_config_.output_dir)) {
        throw common::IOException("Cannot mount " + gradcam_config_.output_dir +
                                  " at " + gradcam_config_.mount_prefix);
    }
    LOG_INFO("Serving " + gradcam_config_.output_dir + " at " + gradcam_config_.mount_prefix);
}

void HTTPServer::start() {
    if (running_) {
        return;
    }

    LOG_INFO("Listening on " + config_.host + ":" + std::to_string(config_.port) +
             " (model " + service_->model_provider().model_version() + ")");

    running_ = true;
    if (!server_->listen(config_.host.c_str(), config_.port)) {
        running_ = false;
        throw common::SystemException("Failed to listen on " + config_.host + ":" +
                                      std::to_string(config_.port));
    }
    running_ = false;
}

int HTTPServer::bind_to_any_port(const std::string& host) {
    int port = server_->bind_to_any_port(host.c_str());
    if (port < 0) {
        throw common::SystemException("Failed to bind on " + host);
    }
    return port;
}

void HTTPServer::listen_after_bind() {
    running_ = true;
    server_->listen_after_bind();
    running_ = false;
}

void HTTPServer::stop() {
    if (server_ && server_->is_running()) {
        server_->stop();
    }
    running_ = false;
}

} // namespace cattlediag
