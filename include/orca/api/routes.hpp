#pragma once

/**
 * @file routes.hpp
 * @brief HTTP and WebSocket surface of orca-server
 *
 * ROUTES:
 *   POST   /events                        batch of events, 204
 *   GET    /events/in                     WebSocket, one event per text frame
 *   POST   /events/filter                 {filter?, limit?} -> {events, total, next_page}
 *   GET    /events/filter/next            ?page-token=<base64>, 403 when rejected
 *   POST   /events/count-by/:countable    day | time | event | resource
 *   POST   /automations                   201 with the stored automation
 *   GET    /automations
 *   GET    /automations/:id
 *   PUT    /automations/:id
 *   DELETE /automations/:id               204
 *   GET    /health                        liveness and counters
 *
 * Errors are returned as {"detail": message}; see to_response() for the
 * status each error code maps to.
 */

#include "orca/automations/registry.hpp"
#include "orca/core/error.hpp"
#include "orca/events/components.hpp"
#include "orca/network/http_router.hpp"
#include "orca/network/websocket_session.hpp"
#include "orca/service/event_pipeline.hpp"
#include "orca/storage/event_store.hpp"

#include <cstddef>

namespace orca::api {

// Largest page /events/filter serves
constexpr std::size_t kMaxPageSize = 50;

struct ApiContext {
    service::EventPipeline& pipeline;
    storage::EventStore& store;
    automations::AutomationRegistry& registry;
    const events::MetricsComponent* metrics = nullptr;
    std::size_t default_page_size = kMaxPageSize;
};

void register_event_routes(network::HttpRouter& router, ApiContext& context);
void register_automation_routes(network::HttpRouter& router, ApiContext& context);
void register_health_routes(network::HttpRouter& router, ApiContext& context);

// All of the above
void register_routes(network::HttpRouter& router, ApiContext& context);

/**
 * @brief Handler for GET /events/in frames
 *
 * Each frame is decoded and published with source "websocket"; frames
 * that do not decode or validate are logged and skipped.
 */
network::WebSocketMessageHandler event_stream_handler(service::EventPipeline& pipeline);

/**
 * InvalidToken -> 403, InvalidParameters and Configuration -> 422,
 * NotFound -> 404, AlreadyExists -> 409, ParseError and
 * InvalidArgument -> 400, anything else -> 500
 */
network::HttpResponse to_response(const Error& error);

} // namespace orca::api
