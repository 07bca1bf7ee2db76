#pragma once

/**
 * @file serializer.hpp
 * @brief JSON encoding for automations, firings and triggered actions
 *
 * Durations ("within") are encoded as seconds. Actions are objects with a
 * "type" discriminator plus the fields of that action kind:
 *
 *   {"type": "change-flow-run-state", "state": "CANCELLED", "force": true}
 *   {"type": "run-deployment", "source": "selected",
 *    "deployment_id": "...", "parameters": {}}
 *
 * Decoding reports shape errors as ErrorCode::ParseError and unknown
 * action types as ErrorCode::Configuration; it does not run the
 * authoring-time validation (automations::validate).
 */

#include "orca/actions/action_spec.hpp"
#include "orca/automations/types.hpp"
#include "orca/core/error.hpp"
#include "orca/core/result.hpp"

#include <nlohmann/json.hpp>

namespace orca::automations {

nlohmann::json to_json(const actions::ActionSpec& action);
Result<actions::ActionSpec, Error> action_from_json(const nlohmann::json& j);

nlohmann::json to_json(const EventTrigger& trigger);
Result<EventTrigger, Error> trigger_from_json(const nlohmann::json& j);

nlohmann::json to_json(const Automation& automation);
Result<Automation, Error> automation_from_json(const nlohmann::json& j);

nlohmann::json to_json(const Firing& firing);
Result<Firing, Error> firing_from_json(const nlohmann::json& j);

nlohmann::json to_json(const TriggeredAction& triggered);
Result<TriggeredAction, Error> triggered_action_from_json(const nlohmann::json& j);

} // namespace orca::automations
