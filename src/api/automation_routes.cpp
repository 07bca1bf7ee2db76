#include "orca/api/routes.hpp"

#include "orca/automations/serializer.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace orca::api {

using json = nlohmann::json;
using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;

namespace {

// Malformed JSON is a 400; JSON that is not a valid automation is a 422
Result<automations::Automation, HttpResponse> automation_from_request(const network::HttpRequest& request) {
    json body = json::parse(request.body_as_string(), nullptr, false);
    if (body.is_discarded()) {
        return Err<automations::Automation>(
            network::error_response(HttpStatus::BAD_REQUEST, "Request body is not valid JSON"));
    }

    auto decoded = automations::automation_from_json(body);
    if (decoded.is_error()) {
        return Err<automations::Automation>(
            network::error_response(HttpStatus::UNPROCESSABLE_ENTITY, decoded.error().message));
    }
    return Ok(decoded.take_value());
}

HttpResponse automation_response(HttpStatus status, const automations::Automation& automation) {
    return network::json_response(status, automations::to_json(automation).dump());
}

} // namespace

void register_automation_routes(network::HttpRouter& router, ApiContext& context) {
    router.post("/automations", [&context](const HttpContext& ctx) {
        auto automation = automation_from_request(ctx.request);
        if (automation.is_error()) {
            return automation.error();
        }

        auto created = context.registry.create(automation.take_value());
        if (created.is_error()) {
            return to_response(created.error());
        }
        return automation_response(HttpStatus::CREATED, created.value());
    });

    router.get("/automations", [&context](const HttpContext&) {
        json body = json::array();
        for (const auto& automation : context.registry.list()) {
            body.push_back(automations::to_json(automation));
        }
        return network::json_response(HttpStatus::OK, body.dump());
    });

    router.get("/automations/:id", [&context](const HttpContext& ctx) {
        const auto id = ctx.get_param("id");
        auto automation = context.registry.get(id);
        if (!automation) {
            return network::error_response(HttpStatus::NOT_FOUND, "Automation " + id + " not found");
        }
        return automation_response(HttpStatus::OK, *automation);
    });

    router.put("/automations/:id", [&context](const HttpContext& ctx) {
        auto automation = automation_from_request(ctx.request);
        if (automation.is_error()) {
            return automation.error();
        }

        auto updated = context.registry.update(ctx.get_param("id"), automation.take_value());
        if (updated.is_error()) {
            return to_response(updated.error());
        }
        return automation_response(HttpStatus::OK, updated.value());
    });

    router.delete_("/automations/:id", [&context](const HttpContext& ctx) {
        auto removed = context.registry.remove(ctx.get_param("id"));
        if (removed.is_error()) {
            return to_response(removed.error());
        }
        return HttpResponse(HttpStatus::NO_CONTENT);
    });
}

} // namespace orca::api
