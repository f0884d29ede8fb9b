#pragma once

#include <httplib.h>
#include <string>

namespace cattlediag {
namespace api {
namespace rest {

// Authentication configuration
struct AuthConfig {
    bool enable_auth = true;                          // Whether to enforce the shared secret
    std::string secret;                               // Expected header value
    std::string secret_header = "X-Inference-Secret"; // Header carrying the secret
};

// Shared-secret gate for every non-health endpoint
class AuthMiddleware {
public:
    explicit AuthMiddleware(const AuthConfig& config = AuthConfig());

    // Returns false and writes a 401 JSON error when the secret is missing or wrong
    bool authenticate(const httplib::Request& req, httplib::Response& res) const;

    // Compare two strings in time independent of where they differ
    static bool constant_time_equals(const std::string& a, const std::string& b);

    const AuthConfig& config() const { return config_; }

private:
    AuthConfig config_;
};

} // namespace rest
} // namespace api
} // namespace cattlediag
