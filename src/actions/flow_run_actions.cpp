#include "orca/actions/flow_run_actions.hpp"

#include <spdlog/spdlog.h>

namespace orca::actions {

using orchestration::State;
using orchestration::StateType;

Result<ActionResult, ActionFailure> FlowRunStateAction::act(const automations::TriggeredAction& triggered) {
    auto resource_id = infer_resource(triggered, orchestration::kFlowRunPrefix);
    if (!resource_id) {
        return Err<ActionResult>(ActionFailure{"No flow run could be inferred from the triggering event or labels"});
    }
    const auto flow_run_id = *orchestration::flow_run_id_from_resource(*resource_id);
    add_related(*resource_id, kTargetRole);

    auto current = context_.orchestration.read_flow_run(flow_run_id);
    if (current.is_error()) {
        return Err<ActionResult>(ActionFailure{
            "Flow run " + flow_run_id + " could not be read: " + current.error().message});
    }

    const State desired = desired_state(triggered);
    if (already_applied(current.value().state, desired)) {
        spdlog::info("[Action] {} flow_run={} already {} ({}), nothing to do",
                     type(), flow_run_id, orchestration::to_string(desired.type), desired.name);
        return Ok(ActionResult{200});
    }

    auto change = context_.orchestration.set_flow_run_state(flow_run_id, desired, force());
    if (change.is_error()) {
        return Err<ActionResult>(ActionFailure{
            "Failed to set state of flow run " + flow_run_id + ": " + change.error().message});
    }
    if (change.value().status_code >= 300) {
        return Err<ActionResult>(ActionFailure{
            "Orchestration rejected state " + std::string(orchestration::to_string(desired.type)) +
            " for flow run " + flow_run_id + " (status " + std::to_string(change.value().status_code) + ")"});
    }

    spdlog::info("[Action] {} flow_run={} -> {} ({}) status={}",
                 type(), flow_run_id, orchestration::to_string(desired.type), desired.name,
                 change.value().status_code);
    return Ok(ActionResult{change.value().status_code});
}

State SuspendFlowRunAction::desired_state(const automations::TriggeredAction& triggered) const {
    State state;
    state.type = StateType::Paused;
    state.name = "Suspended";
    state.message = "Suspended by Automation " + triggered.automation.id;
    return state;
}

State CancelFlowRunAction::desired_state(const automations::TriggeredAction& triggered) const {
    State state;
    state.type = StateType::Cancelling;
    state.name = "Cancelling";
    state.message = "Cancelled by Automation " + triggered.automation.id;
    return state;
}

bool CancelFlowRunAction::already_applied(const State& current, const State&) const {
    return current.type == StateType::Cancelling || current.type == StateType::Cancelled;
}

State ChangeFlowRunStateAction::desired_state(const automations::TriggeredAction& triggered) const {
    State state;
    state.type = spec_.state;
    state.name = spec_.name.value_or(orchestration::display_name(spec_.state));
    state.message = spec_.message.value_or("State changed by Automation " + triggered.automation.id);
    return state;
}

} // namespace orca::actions
