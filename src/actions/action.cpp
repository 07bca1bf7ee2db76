#include "orca/actions/action.hpp"

#include "orca/actions/basic_actions.hpp"
#include "orca/actions/deployment_actions.hpp"
#include "orca/actions/flow_run_actions.hpp"
#include "orca/core/ids.hpp"
#include "orca/core/time.hpp"

namespace orca::actions {
namespace {

bool has_prefix(const std::string& value, const std::string& prefix) {
    return value.size() > prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

void ActionBase::add_related(const std::string& resource_id, const std::string& role) {
    related_.emplace_back(events::Labels{
        {events::kResourceId, resource_id},
        {events::kResourceRole, role}
    });
}

events::Event ActionBase::outcome_event(const automations::TriggeredAction& triggered,
                                        const std::string& outcome,
                                        nlohmann::json payload) const {
    const auto& ns = context_.event_namespace;

    events::Event event;
    event.id = new_uuid();
    event.occurred = now();
    event.event = ns + ".automation.action." + outcome;
    event.resource = events::Resource(events::Labels{
        {events::kResourceId, ns + ".automation." + triggered.automation.id},
        {events::kResourceName, triggered.automation.name}
    });
    event.related = related_;
    event.payload = std::move(payload);
    return event;
}

void ActionBase::succeed(const automations::TriggeredAction& triggered, const ActionResult& result) {
    nlohmann::json payload = {
        {"action_index", triggered.action_index},
        {"action_type", type()},
        {"invocation", triggered.id},
        {"status_code", result.status_code}
    };
    if (context_.emit) {
        context_.emit(outcome_event(triggered, "executed", std::move(payload)));
    }
}

void ActionBase::fail(const automations::TriggeredAction& triggered, const std::string& reason) {
    nlohmann::json payload = {
        {"action_index", triggered.action_index},
        {"action_type", type()},
        {"invocation", triggered.id},
        {"reason", reason}
    };
    if (context_.emit) {
        context_.emit(outcome_event(triggered, "failed", std::move(payload)));
    }
}

std::optional<std::string> infer_resource(const automations::TriggeredAction& triggered,
                                          const std::string& prefix) {
    auto labelled = triggered.triggering_labels.find(events::kResourceId);
    if (labelled != triggered.triggering_labels.end() && has_prefix(labelled->second, prefix)) {
        return labelled->second;
    }

    if (!triggered.triggering_event) {
        return std::nullopt;
    }
    const auto& event = *triggered.triggering_event;
    if (has_prefix(event.resource.id(), prefix)) {
        return event.resource.id();
    }
    for (const auto& related : event.related) {
        if (has_prefix(related.id(), prefix)) {
            return related.id();
        }
    }
    return std::nullopt;
}

namespace {

struct ActionFactory {
    ActionContext& context;

    std::unique_ptr<Action> operator()(const DoNothing&) const {
        return std::make_unique<DoNothingAction>(context);
    }
    std::unique_ptr<Action> operator()(const SuspendFlowRun&) const {
        return std::make_unique<SuspendFlowRunAction>(context);
    }
    std::unique_ptr<Action> operator()(const CancelFlowRun&) const {
        return std::make_unique<CancelFlowRunAction>(context);
    }
    std::unique_ptr<Action> operator()(const ChangeFlowRunState& spec) const {
        return std::make_unique<ChangeFlowRunStateAction>(context, spec);
    }
    std::unique_ptr<Action> operator()(const RunDeployment& spec) const {
        return std::make_unique<RunDeploymentAction>(context, spec);
    }
    std::unique_ptr<Action> operator()(const PauseDeployment& spec) const {
        return std::make_unique<PauseDeploymentAction>(context, spec.deployment_id);
    }
    std::unique_ptr<Action> operator()(const ResumeDeployment& spec) const {
        return std::make_unique<ResumeDeploymentAction>(context, spec.deployment_id);
    }
    std::unique_ptr<Action> operator()(const SendNotification& spec) const {
        return std::make_unique<SendNotificationAction>(context, spec);
    }
};

} // namespace

std::unique_ptr<Action> make_action(const ActionSpec& spec, ActionContext& context) {
    return std::visit(ActionFactory{context}, spec);
}

} // namespace orca::actions
