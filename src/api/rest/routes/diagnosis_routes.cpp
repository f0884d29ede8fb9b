#include "diagnosis_routes.hpp"
#include "../handlers/diagnosis_handler.hpp"
#include "../../../common/utils.hpp"

namespace cattlediag {
namespace api {
namespace rest {

namespace {

// Access logging and, when required, the shared-secret gate around a handler.
// Exceptions propagate to the server's exception handler.
template <typename Handler>
httplib::Server::Handler with_middleware(DiagnosisRouteContext context, bool require_auth, Handler handler) {
    return [context, require_auth, handler](const httplib::Request& req, httplib::Response& res) {
        common::TimeUtils::Timer timer;
        context.logging.log_request(req);

        if (require_auth && !context.auth.authenticate(req, res)) {
            context.logging.log_response(req, res, timer.elapsed_us());
            return;
        }

        handler(req, res);
        context.logging.log_response(req, res, timer.elapsed_us());
    };
}

} // namespace

void register_diagnosis_routes(httplib::Server& server,
                               const DiagnosisRouteContext& context,
                               const DiagnosisRouteConfig& config) {
    server.Post(config.predict_path, with_middleware(context, true,
        [&service = context.service](const auto& req, auto& res) {
            handle_predict(service, req, res);
        }));

    server.Get(config.health_path, with_middleware(context, false,
        [&service = context.service](const auto& req, auto& res) {
            handle_health(service, req, res);
        }));

    server.Post(config.resolve_path, with_middleware(context, true,
        [&locator = context.locator](const auto& req, auto& res) {
            handle_resolve_artifact(locator, req, res);
        }));
}

} // namespace rest
} // namespace api
} // namespace cattlediag
