#pragma once

#include <httplib.h>
#include <chrono>
#include <string>

namespace cattlediag {
namespace api {
namespace rest {

// Logging configuration
struct LoggingConfig {
    bool enable_request_logging = true;     // Whether to log incoming requests
    bool enable_response_logging = true;    // Whether to log status and latency
    std::string secret_header = "X-Inference-Secret";  // Never written to the log
};

// Access log written through the process Logger
class LoggingMiddleware {
public:
    explicit LoggingMiddleware(const LoggingConfig& config = LoggingConfig());

    void log_request(const httplib::Request& req) const;
    void log_response(const httplib::Request& req,
                      const httplib::Response& res,
                      const std::chrono::microseconds& duration) const;

    // One-line summary; multipart bodies are described, never dumped
    std::string describe_request(const httplib::Request& req) const;

    const LoggingConfig& config() const { return config_; }

private:
    LoggingConfig config_;
};

} // namespace rest
} // namespace api
} // namespace cattlediag
