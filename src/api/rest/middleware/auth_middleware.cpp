#include "auth_middleware.hpp"
#include "../../../common/logging.hpp"
#include <nlohmann/json.hpp>
#include <openssl/crypto.h>

namespace cattlediag {
namespace api {
namespace rest {

using json = nlohmann::json;

AuthMiddleware::AuthMiddleware(const AuthConfig& config)
    : config_(config) {
}

bool AuthMiddleware::constant_time_equals(const std::string& a, const std::string& b) {
    // Length leaks, contents do not
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool AuthMiddleware::authenticate(const httplib::Request& req, httplib::Response& res) const {
    if (!config_.enable_auth) {
        return true;
    }

    auto provided = req.get_header_value(config_.secret_header);
    if (!provided.empty() && !config_.secret.empty() &&
        constant_time_equals(provided, config_.secret)) {
        return true;
    }

    LOG_WARNING("Rejected " + req.method + " " + req.path + " from " + req.remote_addr +
                (provided.empty() ? ": missing secret" : ": wrong secret"));

    json error = {
        {"error", {
            {"code", 401},
            {"message", "Unauthorized"},
            {"type", "Unauthorized"}
        }}
    };
    res.status = 401;
    res.set_content(error.dump(), "application/json");
    return false;
}

} // namespace rest
} // namespace api
} // namespace cattlediag
