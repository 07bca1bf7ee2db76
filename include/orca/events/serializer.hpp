#pragma once

/**
 * @file serializer.hpp
 * @brief JSON encoding for events, resources and event filters
 *
 * WHY THIS FILE EXISTS:
 * Events cross three boundaries as JSON: the HTTP batch endpoint, the
 * WebSocket stream and the query API. Encoding is explicit per entity so
 * that the wire shape is visible in one place.
 *
 * WIRE SHAPE:
 * {
 *   "id": "6f1c...",                          (optional, generated if missing)
 *   "occurred": "2024-05-01T12:30:00.000000Z", (optional, defaults to now)
 *   "event": "prefect.flow-run.Running",
 *   "resource": {"prefect.resource.id": "prefect.flow-run.abc"},
 *   "related": [{"prefect.resource.id": "...", "prefect.resource.role": "flow"}],
 *   "payload": {},
 *   "received": "..."                          (set by the server)
 * }
 *
 * Decoding never throws. Shape errors come back as ErrorCode::ParseError;
 * structural validation of the decoded event is a separate step
 * (events::validate).
 */

#include "orca/core/error.hpp"
#include "orca/core/result.hpp"
#include "orca/events/event.hpp"
#include "orca/events/filter.hpp"
#include "orca/matching/resource_matcher.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace orca::events {

nlohmann::json to_json(const Resource& resource);
nlohmann::json to_json(const Event& event);
nlohmann::json to_json(const std::vector<Event>& events);

Result<Resource, Error> resource_from_json(const nlohmann::json& j);
Result<Event, Error> event_from_json(const nlohmann::json& j);

// Accepts a JSON array of events; fails on the first undecodable entry
Result<std::vector<Event>, Error> events_from_json(const nlohmann::json& j);

nlohmann::json to_json(const matching::ResourceSpecification& spec);

// Each label maps to a string or an array of strings
Result<matching::ResourceSpecification, Error> specification_from_json(const nlohmann::json& j);

nlohmann::json to_json(const EventFilter& filter);
Result<EventFilter, Error> filter_from_json(const nlohmann::json& j);

} // namespace orca::events
