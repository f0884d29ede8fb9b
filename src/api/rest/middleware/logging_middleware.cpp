#include "logging_middleware.hpp"
#include "../../../common/logging.hpp"

namespace cattlediag {
namespace api {
namespace rest {

LoggingMiddleware::LoggingMiddleware(const LoggingConfig& config)
    : config_(config) {
}

std::string LoggingMiddleware::describe_request(const httplib::Request& req) const {
    std::string line = req.method + " " + req.path + " from " + req.remote_addr;

    if (req.is_multipart_form_data()) {
        line += " [multipart:";
        for (const auto& [name, file] : req.files) {
            line += " " + name;
            if (!file.filename.empty()) {
                line += "=" + file.filename + "(" + std::to_string(file.content.size()) + "B)";
            }
        }
        line += "]";
    } else if (!req.body.empty()) {
        line += " [" + std::to_string(req.body.size()) + "B]";
    }

    line += req.has_header(config_.secret_header) ? " secret=present" : " secret=absent";
    return line;
}

void LoggingMiddleware::log_request(const httplib::Request& req) const {
    if (!config_.enable_request_logging) {
        return;
    }
    LOG_DEBUG("--> " + describe_request(req));
}

void LoggingMiddleware::log_response(const httplib::Request& req,
                                     const httplib::Response& res,
                                     const std::chrono::microseconds& duration) const {
    if (!config_.enable_response_logging) {
        return;
    }
    LOG_INFO("<-- " + std::to_string(res.status) + " " + req.method + " " + req.path +
             " " + std::to_string(duration.count() / 1000.0) + " ms");
}

} // namespace rest
} // namespace api
} // namespace cattlediag
