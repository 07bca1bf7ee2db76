#pragma once

/**
 * @file dispatcher.hpp
 * @brief Turns a Firing into one TriggeredAction per configured action
 *
 * Invocation ids are derived from the firing id and the action's position,
 * so rebuilding the same firing yields the same ids and the executor's
 * ledger can recognise a repeat.
 */

#include "orca/actions/executor.hpp"
#include "orca/automations/types.hpp"
#include "orca/events/event_bus.hpp"

#include <string>
#include <vector>

namespace orca::actions {

std::string invocation_id(const std::string& firing_id, int action_index);

class ActionDispatcher {
public:
    explicit ActionDispatcher(ActionExecutor& executor, events::EventBus* bus = nullptr)
        : executor_(executor), bus_(bus) {}

    // Pure: one TriggeredAction per action, in configuration order
    static std::vector<automations::TriggeredAction> build(const automations::Firing& firing,
                                                           const automations::Automation& automation);

    // build() and hand each action to the executor without waiting for it
    std::vector<automations::TriggeredAction> dispatch(const automations::Firing& firing,
                                                       const automations::Automation& automation);

private:
    ActionExecutor& executor_;
    events::EventBus* bus_;
};

} // namespace orca::actions
