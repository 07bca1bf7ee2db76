#pragma once

#include "orca/actions/action.hpp"

#include <string>

namespace orca::actions {

// Succeeds without touching anything; useful to record that a trigger fired
class DoNothingAction : public ActionBase {
public:
    using ActionBase::ActionBase;

    const char* type() const override { return "do-nothing"; }

    Result<ActionResult, ActionFailure> act(const automations::TriggeredAction& triggered) override;
};

class SendNotificationAction : public ActionBase {
public:
    SendNotificationAction(ActionContext& context, SendNotification spec)
        : ActionBase(context), spec_(std::move(spec)) {}

    const char* type() const override { return "send-notification"; }

    Result<ActionResult, ActionFailure> act(const automations::TriggeredAction& triggered) override;

private:
    SendNotification spec_;
};

/**
 * @brief Expands {{ automation.id }}, {{ automation.name }}, {{ firing.id }},
 *        {{ event.event }} and {{ event.resource.id }}
 *
 * Unknown placeholders are left as they are. Event placeholders expand to
 * an empty string when the firing has no triggering event.
 */
std::string render_template(const std::string& text, const automations::TriggeredAction& triggered);

} // namespace orca::actions
