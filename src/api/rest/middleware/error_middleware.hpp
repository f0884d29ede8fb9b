#pragma once

#include <httplib.h>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace cattlediag {
namespace api {
namespace rest {

// Error handling configuration
struct ErrorHandlerConfig {
    bool enable_detailed_errors = false;    // Echo exception text on 500s
    bool enable_error_logging = true;       // Log every error response
};

// Turns failures into {"error":{"code","message","type"}} responses
class ErrorMiddleware {
public:
    explicit ErrorMiddleware(const ErrorHandlerConfig& config = ErrorHandlerConfig());

    void handle_error(const httplib::Request& req,
                      httplib::Response& res,
                      int status_code,
                      const std::string& message);

    // RequestException keeps its status and message; anything else is a 500
    void handle_exception(const httplib::Request& req,
                          httplib::Response& res,
                          std::exception_ptr ep);

    // Replace the default JSON body for one status
    using ErrorHandler = std::function<void(const httplib::Request&,
                                            httplib::Response&,
                                            const std::string&)>;
    void register_error_handler(int status_code, ErrorHandler handler);

    // "BadRequest", "NotFound", ... ; "Error" for unregistered codes
    static std::string error_type(int status_code);

    static std::string format_error_response(int status_code, const std::string& message);

    const ErrorHandlerConfig& config() const { return config_; }

private:
    void log_error(const std::string& message, const httplib::Request& req, int status_code);

    ErrorHandlerConfig config_;
    std::map<int, ErrorHandler> error_handlers_;
    std::mutex error_mutex_;
};

} // namespace rest
} // namespace api
} // namespace cattlediag
