#pragma once

#include "orca/actions/action.hpp"

#include <optional>
#include <string>

namespace orca::actions {

/**
 * @brief Common base for actions that operate on a deployment
 *
 * The deployment is either the configured one or, when none is
 * configured, the one inferred from the firing.
 */
class DeploymentAction : public ActionBase {
public:
    DeploymentAction(ActionContext& context, std::optional<std::string> deployment_id)
        : ActionBase(context), deployment_id_(std::move(deployment_id)) {}

protected:
    // Deployment id (without the resource prefix); records it as the target
    Result<std::string, ActionFailure> target_deployment(const automations::TriggeredAction& triggered);

private:
    std::optional<std::string> deployment_id_;
};

class RunDeploymentAction : public DeploymentAction {
public:
    RunDeploymentAction(ActionContext& context, RunDeployment spec)
        : DeploymentAction(context, spec.deployment_id), parameters_(std::move(spec.parameters)) {}

    const char* type() const override { return "run-deployment"; }

    Result<ActionResult, ActionFailure> act(const automations::TriggeredAction& triggered) override;

private:
    nlohmann::json parameters_;
};

class PauseDeploymentAction : public DeploymentAction {
public:
    using DeploymentAction::DeploymentAction;

    const char* type() const override { return "pause-deployment"; }

    Result<ActionResult, ActionFailure> act(const automations::TriggeredAction& triggered) override;
};

class ResumeDeploymentAction : public DeploymentAction {
public:
    using DeploymentAction::DeploymentAction;

    const char* type() const override { return "resume-deployment"; }

    Result<ActionResult, ActionFailure> act(const automations::TriggeredAction& triggered) override;
};

} // namespace orca::actions
