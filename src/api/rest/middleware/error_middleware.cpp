#include "error_middleware.hpp"
#include "../../../common/error.hpp"
#include "../../../common/logging.hpp"
#include <nlohmann/json.hpp>

namespace cattlediag {
namespace api {
namespace rest {

using json = nlohmann::json;

namespace {

const std::map<int, std::string>& error_types() {
    static const std::map<int, std::string> types = {
        {400, "BadRequest"},
        {401, "Unauthorized"},
        {404, "NotFound"},
        {405, "MethodNotAllowed"},
        {413, "PayloadTooLarge"},
        {500, "InternalServerError"},
        {503, "ServiceUnavailable"},
    };
    return types;
}

} // namespace

ErrorMiddleware::ErrorMiddleware(const ErrorHandlerConfig& config)
    : config_(config) {
}

std::string ErrorMiddleware::error_type(int status_code) {
    auto it = error_types().find(status_code);
    return it != error_types().end() ? it->second : "Error";
}

std::string ErrorMiddleware::format_error_response(int status_code, const std::string& message) {
    json error = {
        {"error", {
            {"code", status_code},
            {"message", message},
            {"type", error_type(status_code)}
        }}
    };
    return error.dump();
}

void ErrorMiddleware::handle_error(const httplib::Request& req,
                                   httplib::Response& res,
                                   int status_code,
                                   const std::string& message) {
    if (config_.enable_error_logging) {
        log_error(message, req, status_code);
    }

    res.status = status_code;

    ErrorHandler handler;
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        auto it = error_handlers_.find(status_code);
        if (it != error_handlers_.end()) {
            handler = it->second;
        }
    }

    if (handler) {
        handler(req, res, message);
    } else {
        res.set_content(format_error_response(status_code, message), "application/json");
    }
}

void ErrorMiddleware::handle_exception(const httplib::Request& req,
                                       httplib::Response& res,
                                       std::exception_ptr ep) {
    try {
        std::rethrow_exception(ep);
    } catch (const common::RequestException& e) {
        handle_error(req, res, e.http_status(), e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Unhandled exception on " + req.method + " " + req.path + ": " + e.what());
        handle_error(req, res, 500, config_.enable_detailed_errors ? e.what() : "Internal server error");
    } catch (...) {
        LOG_ERROR("Unhandled non-standard exception on " + req.method + " " + req.path);
        handle_error(req, res, 500, "Internal server error");
    }
}

void ErrorMiddleware::register_error_handler(int status_code, ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    error_handlers_[status_code] = std::move(handler);
}

void ErrorMiddleware::log_error(const std::string& message,
                                const httplib::Request& req,
                                int status_code) {
    std::string line = std::to_string(status_code) + " " + req.method + " " + req.path +
                       " from " + req.remote_addr + ": " + message;
    if (status_code >= 500) {
        LOG_ERROR(line);
    } else {
        LOG_WARNING(line);
    }
}

} // namespace rest
} // namespace api
} // namespace cattlediag
