#include "orca/actions/deployment_actions.hpp"

#include <spdlog/spdlog.h>

namespace orca::actions {
namespace {

Result<ActionResult, ActionFailure> set_paused(ActionContext& context,
                                               const char* type,
                                               const std::string& deployment_id,
                                               bool paused) {
    auto deployment = context.orchestration.read_deployment(deployment_id);
    if (deployment.is_error()) {
        return Err<ActionResult>(ActionFailure{
            "Deployment " + deployment_id + " could not be read: " + deployment.error().message});
    }
    if (deployment.value().paused == paused) {
        spdlog::info("[Action] {} deployment={} already {}", type, deployment_id, paused ? "paused" : "active");
        return Ok(ActionResult{200});
    }

    auto updated = context.orchestration.set_deployment_paused(deployment_id, paused);
    if (updated.is_error()) {
        return Err<ActionResult>(ActionFailure{
            "Failed to update deployment " + deployment_id + ": " + updated.error().message});
    }
    spdlog::info("[Action] {} deployment={} paused={}", type, deployment_id, paused);
    return Ok(ActionResult{201});
}

} // namespace

Result<std::string, ActionFailure> DeploymentAction::target_deployment(const automations::TriggeredAction& triggered) {
    std::string deployment_id;
    if (deployment_id_) {
        deployment_id = *deployment_id_;
    } else {
        auto resource_id = infer_resource(triggered, orchestration::kDeploymentPrefix);
        if (!resource_id) {
            return Err<std::string>(ActionFailure{"No deployment could be inferred from the triggering event or labels"});
        }
        deployment_id = *orchestration::deployment_id_from_resource(*resource_id);
    }
    add_related(orchestration::kDeploymentPrefix + deployment_id, kTargetRole);
    return Ok(deployment_id);
}

Result<ActionResult, ActionFailure> RunDeploymentAction::act(const automations::TriggeredAction& triggered) {
    auto target = target_deployment(triggered);
    if (target.is_error()) {
        return Err<ActionResult>(target.error());
    }
    const auto& deployment_id = target.value();

    // The invocation id doubles as the idempotency key, so a re-invocation
    // whose first outcome was lost finds the run it already scheduled
    auto created = context_.orchestration.create_flow_run(deployment_id, parameters_, triggered.id);
    if (created.is_error()) {
        return Err<ActionResult>(ActionFailure{
            "Failed to create a flow run of deployment " + deployment_id + ": " + created.error().message});
    }

    const auto& creation = created.value();
    add_related(orchestration::kFlowRunPrefix + creation.flow_run.id, "flow-run");
    if (creation.status_code == 200) {
        spdlog::info("[Action] run-deployment deployment={} flow_run={} already scheduled by invocation={}",
                     deployment_id, creation.flow_run.id, triggered.id);
    } else {
        spdlog::info("[Action] run-deployment deployment={} flow_run={}", deployment_id, creation.flow_run.id);
    }
    return Ok(ActionResult{creation.status_code});
}

Result<ActionResult, ActionFailure> PauseDeploymentAction::act(const automations::TriggeredAction& triggered) {
    auto target = target_deployment(triggered);
    if (target.is_error()) {
        return Err<ActionResult>(target.error());
    }
    return set_paused(context_, type(), target.value(), true);
}

Result<ActionResult, ActionFailure> ResumeDeploymentAction::act(const automations::TriggeredAction& triggered) {
    auto target = target_deployment(triggered);
    if (target.is_error()) {
        return Err<ActionResult>(target.error());
    }
    return set_paused(context_, type(), target.value(), false);
}

} // namespace orca::actions
