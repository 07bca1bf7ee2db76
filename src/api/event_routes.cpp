#include "orca/api/routes.hpp"

#include "orca/core/encoding.hpp"
#include "orca/core/time.hpp"
#include "orca/events/serializer.hpp"
#include "orca/storage/counting.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>

namespace orca::api {

using json = nlohmann::json;
using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;

namespace {

// Empty bodies read as an empty object; nullopt means the body is not JSON
std::optional<json> parse_body(const network::HttpRequest& request, bool empty_is_object) {
    const std::string body = request.body_as_string();
    if (body.empty() && empty_is_object) {
        return json::object();
    }
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

std::string base_url(const network::HttpRequest& request) {
    const std::string host = request.get_header("Host");
    return host.empty() ? std::string() : "http://" + host;
}

std::string next_page_url(const network::HttpRequest& request, const std::string& token) {
    return base_url(request) + "/events/filter/next?page-token=" + url_encode(base64_encode(token));
}

HttpResponse page_response(const network::HttpRequest& request, const storage::EventPage& page) {
    json body = {
        {"events", events::to_json(page.events)},
        {"total", page.total},
        {"next_page", nullptr}
    };
    if (page.next_page_token) {
        body["next_page"] = next_page_url(request, *page.next_page_token);
    }
    return network::json_response(HttpStatus::OK, body.dump());
}

// since defaults to one day ago, until to now
void apply_time_defaults(events::EventFilter& filter) {
    const auto at = now();
    if (!filter.since) {
        filter.since = at - std::chrono::hours(24);
    }
    if (!filter.until) {
        filter.until = at;
    }
}

Result<events::EventFilter, Error> filter_from_body(const json& body) {
    events::EventFilter filter;
    if (body.contains("filter") && !body["filter"].is_null()) {
        auto decoded = events::filter_from_json(body["filter"]);
        if (decoded.is_error()) {
            return Err<events::EventFilter>(Error::invalid_parameters(decoded.error().message));
        }
        filter = decoded.take_value();
    }
    apply_time_defaults(filter);
    return Ok(filter);
}

HttpResponse handle_post_events(ApiContext& context, const HttpContext& ctx) {
    auto body = parse_body(ctx.request, false);
    if (!body) {
        return network::error_response(HttpStatus::BAD_REQUEST, "Request body is not valid JSON");
    }

    auto decoded = events::events_from_json(*body);
    if (decoded.is_error()) {
        return network::error_response(HttpStatus::BAD_REQUEST, decoded.error().message);
    }

    const auto& batch = decoded.value();
    if (batch.empty()) {
        return HttpResponse(HttpStatus::NO_CONTENT);
    }

    auto published = context.pipeline.publish_batch(batch, "http");
    if (published.is_error()) {
        return to_response(published.error());
    }

    spdlog::debug("[API] accepted {} events, {} new", batch.size(), published.value());
    return HttpResponse(HttpStatus::NO_CONTENT);
}

HttpResponse handle_filter(ApiContext& context, const HttpContext& ctx) {
    auto body = parse_body(ctx.request, true);
    if (!body || !body->is_object()) {
        return network::error_response(HttpStatus::BAD_REQUEST, "Request body must be a JSON object");
    }

    std::size_t limit = context.default_page_size;
    if (body->contains("limit") && !(*body)["limit"].is_null()) {
        const auto& value = (*body)["limit"];
        if (!value.is_number_integer() || value.get<long long>() < 0 ||
            value.get<long long>() > static_cast<long long>(kMaxPageSize)) {
            return network::error_response(HttpStatus::UNPROCESSABLE_ENTITY,
                "limit must be an integer between 0 and " + std::to_string(kMaxPageSize));
        }
        limit = value.get<std::size_t>();
    }

    auto filter = filter_from_body(*body);
    if (filter.is_error()) {
        return to_response(filter.error());
    }

    auto page = context.store.query(filter.value(), limit);
    if (page.is_error()) {
        return to_response(page.error());
    }
    return page_response(ctx.request, page.value());
}

HttpResponse handle_filter_next(ApiContext& context, const HttpContext& ctx) {
    const std::string raw = url_decode(ctx.request.query_param("page-token"));
    if (raw.empty()) {
        return network::error_response(HttpStatus::FORBIDDEN, "Missing page token");
    }

    auto token = base64_decode(raw);
    if (!token || token->empty()) {
        return network::error_response(HttpStatus::FORBIDDEN, "Invalid page token");
    }

    auto page = context.store.query_next(*token);
    if (page.is_error()) {
        if (page.error().code == ErrorCode::InvalidToken) {
            return network::error_response(HttpStatus::FORBIDDEN, "Invalid page token");
        }
        return to_response(page.error());
    }
    return page_response(ctx.request, page.value());
}

HttpResponse handle_count_by(ApiContext& context, const HttpContext& ctx) {
    const std::string countable_name = ctx.get_param("countable");
    auto countable = storage::countable_from_string(countable_name);
    if (!countable) {
        return network::error_response(HttpStatus::UNPROCESSABLE_ENTITY,
            "countable must be one of day, time, event, resource; got '" + countable_name + "'");
    }

    auto body = parse_body(ctx.request, true);
    if (!body || !body->is_object()) {
        return network::error_response(HttpStatus::BAD_REQUEST, "Request body must be a JSON object");
    }

    auto unit = storage::TimeUnit::Day;
    if (body->contains("time_unit") && !(*body)["time_unit"].is_null()) {
        const auto& value = (*body)["time_unit"];
        auto parsed = value.is_string() ? storage::time_unit_from_string(value.get<std::string>())
                                        : std::nullopt;
        if (!parsed) {
            return network::error_response(HttpStatus::UNPROCESSABLE_ENTITY,
                "time_unit must be one of week, day, hour, minute, second");
        }
        unit = *parsed;
    }

    double interval = 1.0;
    if (body->contains("time_interval") && !(*body)["time_interval"].is_null()) {
        const auto& value = (*body)["time_interval"];
        if (!value.is_number()) {
            return network::error_response(HttpStatus::UNPROCESSABLE_ENTITY, "time_interval must be a number");
        }
        interval = value.get<double>();
    }

    auto filter = filter_from_body(*body);
    if (filter.is_error()) {
        return to_response(filter.error());
    }

    auto counts = context.store.count(filter.value(), *countable, unit, interval);
    if (counts.is_error()) {
        return to_response(counts.error());
    }
    return network::json_response(HttpStatus::OK, storage::to_json(counts.value()).dump());
}

} // namespace

void register_event_routes(network::HttpRouter& router, ApiContext& context) {
    router.post("/events", [&context](const HttpContext& ctx) {
        return handle_post_events(context, ctx);
    });
    router.post("/events/filter", [&context](const HttpContext& ctx) {
        return handle_filter(context, ctx);
    });
    router.get("/events/filter/next", [&context](const HttpContext& ctx) {
        return handle_filter_next(context, ctx);
    });
    router.post("/events/count-by/:countable", [&context](const HttpContext& ctx) {
        return handle_count_by(context, ctx);
    });
}

network::WebSocketMessageHandler event_stream_handler(service::EventPipeline& pipeline) {
    return [&pipeline](const std::string& frame) {
        json parsed = json::parse(frame, nullptr, false);
        if (parsed.is_discarded()) {
            spdlog::warn("[WebSocket] skipping frame that is not JSON ({} bytes)", frame.size());
            return;
        }

        auto event = events::event_from_json(parsed);
        if (event.is_error()) {
            spdlog::warn("[WebSocket] skipping undecodable event: {}", event.error().message);
            return;
        }

        auto published = pipeline.publish(event.value(), "websocket");
        if (published.is_error()) {
            spdlog::warn("[WebSocket] event={} rejected: {}", event.value().id, published.error().message);
        }
    };
}

} // namespace orca::api
