#include "orca/automations/types.hpp"

namespace orca::automations {

const char* to_string(Posture posture) {
    switch (posture) {
        case Posture::Reactive: return "Reactive";
        case Posture::Proactive: return "Proactive";
    }
    return "Unknown";
}

const char* to_string(TriggerState state) {
    switch (state) {
        case TriggerState::Triggered: return "Triggered";
    }
    return "Unknown";
}

Result<void, Error> validate(const EventTrigger& trigger) {
    if (trigger.within < Duration::zero()) {
        return Err<void>(Error::configuration("within must be non-negative"));
    }
    if (trigger.threshold < 0) {
        return Err<void>(Error::configuration("threshold must be non-negative"));
    }
    if (trigger.posture == Posture::Proactive && trigger.within <= Duration::zero()) {
        return Err<void>(Error::configuration("Proactive triggers require a positive within"));
    }
    for (const auto& label : trigger.for_each) {
        if (label.empty()) {
            return Err<void>(Error::configuration(std::string("for_each labels must not be empty")));
        }
    }

    auto checked = matching::validate(trigger.match, "match");
    if (checked.is_error()) {
        return checked;
    }
    checked = matching::validate(trigger.match_related, "match_related");
    if (checked.is_error()) {
        return checked;
    }
    checked = matching::validate_name_patterns(trigger.after, "after");
    if (checked.is_error()) {
        return checked;
    }
    return matching::validate_name_patterns(trigger.expect, "expect");
}

Result<void, Error> validate(const Automation& automation) {
    if (automation.name.empty()) {
        return Err<void>(Error::configuration("Automation name must not be empty"));
    }
    for (const auto& action : automation.actions) {
        if (const auto* notify = std::get_if<actions::SendNotification>(&action)) {
            if (notify->block_document_id.empty()) {
                return Err<void>(Error::configuration("send-notification requires block_document_id"));
            }
        }
        if (const auto* change = std::get_if<actions::ChangeFlowRunState>(&action)) {
            if (change->name && change->name->empty()) {
                return Err<void>(Error::configuration("change-flow-run-state name must not be empty"));
            }
        }
    }
    return validate(automation.trigger);
}

} // namespace orca::automations
