#include "orca/api/routes.hpp"

#include "orca/core/time.hpp"

#include <nlohmann/json.hpp>

namespace orca::api {

using network::HttpStatus;

network::HttpResponse to_response(const Error& error) {
    switch (error.code) {
        case ErrorCode::InvalidToken:
            return network::error_response(HttpStatus::FORBIDDEN, error.message);
        case ErrorCode::InvalidParameters:
        case ErrorCode::Configuration:
            return network::error_response(HttpStatus::UNPROCESSABLE_ENTITY, error.message);
        case ErrorCode::NotFound:
            return network::error_response(HttpStatus::NOT_FOUND, error.message);
        case ErrorCode::AlreadyExists:
            return network::error_response(HttpStatus::CONFLICT, error.message);
        case ErrorCode::InvalidArgument:
        case ErrorCode::ParseError:
            return network::error_response(HttpStatus::BAD_REQUEST, error.message);
        case ErrorCode::Internal:
            break;
    }
    return network::error_response(HttpStatus::INTERNAL_SERVER_ERROR, error.message);
}

void register_health_routes(network::HttpRouter& router, ApiContext& context) {
    router.get("/health", [&context](const network::HttpContext&) {
        nlohmann::json body = {
            {"status", "ok"},
            {"time", format_timestamp(now())},
            {"events_stored", context.store.size()},
            {"automations", context.registry.size()},
            {"evaluation_workers", context.pipeline.worker_count()}
        };
        if (context.metrics) {
            body["metrics"] = context.metrics->to_json();
        }
        return network::json_response(HttpStatus::OK, body.dump());
    });
}

void register_routes(network::HttpRouter& router, ApiContext& context) {
    register_event_routes(router, context);
    register_automation_routes(router, context);
    register_health_routes(router, context);
}

} // namespace orca::api
