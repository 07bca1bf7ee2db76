#pragma once

/**
 * @file flow_run_actions.hpp
 * @brief Actions that move the target flow run to another state
 *
 * The target is inferred from the firing (see infer_resource). The current
 * state is read first; when the run already is in the requested state the
 * action succeeds with status 200 without writing again, so a redelivered
 * invocation has no further effect.
 */

#include "orca/actions/action.hpp"

namespace orca::actions {

class FlowRunStateAction : public ActionBase {
public:
    using ActionBase::ActionBase;

    Result<ActionResult, ActionFailure> act(const automations::TriggeredAction& triggered) override;

protected:
    virtual orchestration::State desired_state(const automations::TriggeredAction& triggered) const = 0;

    virtual bool already_applied(const orchestration::State& current,
                                 const orchestration::State& desired) const {
        return current.type == desired.type && current.name == desired.name;
    }

    virtual bool force() const { return false; }
};

class SuspendFlowRunAction : public FlowRunStateAction {
public:
    using FlowRunStateAction::FlowRunStateAction;

    const char* type() const override { return "suspend-flow-run"; }

protected:
    orchestration::State desired_state(const automations::TriggeredAction& triggered) const override;
};

class CancelFlowRunAction : public FlowRunStateAction {
public:
    using FlowRunStateAction::FlowRunStateAction;

    const char* type() const override { return "cancel-flow-run"; }

protected:
    orchestration::State desired_state(const automations::TriggeredAction& triggered) const override;

    // A run that is already cancelling or cancelled is left alone
    bool already_applied(const orchestration::State& current,
                         const orchestration::State& desired) const override;
};

class ChangeFlowRunStateAction : public FlowRunStateAction {
public:
    ChangeFlowRunStateAction(ActionContext& context, ChangeFlowRunState spec)
        : FlowRunStateAction(context), spec_(std::move(spec)) {}

    const char* type() const override { return "change-flow-run-state"; }

protected:
    orchestration::State desired_state(const automations::TriggeredAction& triggered) const override;

    bool force() const override { return spec_.force; }

private:
    ChangeFlowRunState spec_;
};

} // namespace orca::actions
