#include "orca/actions/dispatcher.hpp"

#include "orca/core/ids.hpp"
#include "orca/events/signals.hpp"

#include <spdlog/spdlog.h>

namespace orca::actions {

std::string invocation_id(const std::string& firing_id, int action_index) {
    return uuid_from_name("invocation:" + firing_id + "#" + std::to_string(action_index));
}

std::vector<automations::TriggeredAction> ActionDispatcher::build(const automations::Firing& firing,
                                                                  const automations::Automation& automation) {
    std::vector<automations::TriggeredAction> actions;
    actions.reserve(automation.actions.size());

    for (std::size_t i = 0; i < automation.actions.size(); ++i) {
        automations::TriggeredAction triggered;
        triggered.action_index = static_cast<int>(i);
        triggered.id = invocation_id(firing.id, triggered.action_index);
        triggered.automation = automation;
        triggered.firing = firing;
        triggered.triggered = firing.triggered;
        triggered.triggering_labels = firing.triggering_labels;
        triggered.triggering_event = firing.triggering_event;
        triggered.action = automation.actions[i];
        actions.push_back(std::move(triggered));
    }
    return actions;
}

std::vector<automations::TriggeredAction> ActionDispatcher::dispatch(const automations::Firing& firing,
                                                                     const automations::Automation& automation) {
    auto actions = build(firing, automation);
    for (const auto& triggered : actions) {
        if (executor_.submit(triggered)) {
            spdlog::debug("[Dispatcher] queued {} invocation={} firing={}",
                          action_type(triggered.action), triggered.id, firing.id);
            if (bus_) {
                bus_->emit(events::ActionDispatched{triggered});
            }
        }
    }
    return actions;
}

} // namespace orca::actions
