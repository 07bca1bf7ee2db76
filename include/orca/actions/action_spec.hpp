#pragma once

/**
 * @file action_spec.hpp
 * @brief Configuration of the actions an automation can perform
 *
 * The set of action kinds is closed. Each kind is one alternative of the
 * ActionSpec variant and one row of the type table below; the JSON
 * "type" discriminator and the executable Action are both derived from
 * that single list.
 *
 * Actions that operate on a flow run or deployment infer their target
 * from the firing (triggering labels first, then the triggering event's
 * resource) unless an explicit id is configured.
 */

#include "orca/orchestration/client.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>

namespace orca::actions {

struct DoNothing {};

// Moves the target flow run to PAUSED with the state name "Suspended"
struct SuspendFlowRun {};

// Moves the target flow run to CANCELLING
struct CancelFlowRun {};

struct ChangeFlowRunState {
    orchestration::StateType state = orchestration::StateType::Running;
    std::optional<std::string> name;
    std::optional<std::string> message;
    bool force = false;
};

struct RunDeployment {
    std::optional<std::string> deployment_id;  // nullopt: inferred from the firing
    nlohmann::json parameters = nlohmann::json::object();
};

struct PauseDeployment {
    std::optional<std::string> deployment_id;
};

struct ResumeDeployment {
    std::optional<std::string> deployment_id;
};

/**
 * @brief Sends a message through the configured notification sink
 *
 * subject and body accept the placeholders {{ automation.id }},
 * {{ automation.name }}, {{ firing.id }}, {{ event.event }} and
 * {{ event.resource.id }}.
 */
struct SendNotification {
    std::string block_document_id;
    std::string subject = "Automation {{ automation.name }} triggered";
    std::string body;
};

using ActionSpec = std::variant<
    DoNothing,
    SuspendFlowRun,
    CancelFlowRun,
    ChangeFlowRunState,
    RunDeployment,
    PauseDeployment,
    ResumeDeployment,
    SendNotification
>;

// JSON discriminator, e.g. "suspend-flow-run"
const char* action_type(const ActionSpec& spec);

// Default-constructed spec for a discriminator; nullopt for unknown types
std::optional<ActionSpec> action_for_type(const std::string& type);

} // namespace orca::actions
