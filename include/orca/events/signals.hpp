#pragma once

/**
 * @file signals.hpp
 * @brief Internal signals carried by the EventBus
 *
 * Signals describe what the service itself did. They are not stored and
 * never reach the trigger engine; outcome events that automations can
 * react to go through the EventPublisher.
 */

#include "orca/automations/types.hpp"
#include "orca/events/event.hpp"

#include <cstdint>
#include <string>

namespace orca::events {

struct EventReceived {
    Event event;
    std::string source;  // "http", "websocket", "action"
};

struct EventRejected {
    std::string event_id;
    std::string reason;
};

struct FiringProduced {
    automations::Firing firing;
};

struct ActionDispatched {
    automations::TriggeredAction action;
};

struct ActionSucceeded {
    std::string invocation;
    std::string automation_id;
    std::string action_type;
    int status_code = 0;
};

struct ActionFailed {
    std::string invocation;
    std::string automation_id;
    std::string action_type;
    std::string reason;
};

struct EvaluationFault {
    std::string automation_id;
    std::string event_id;
    std::string message;
};

enum class AutomationChange {
    Created,
    Updated,
    Deleted
};

struct AutomationChanged {
    std::string automation_id;
    AutomationChange change = AutomationChange::Created;
    std::uint64_t generation = 0;
};

struct ServerStarted {
    std::string address;
    uint16_t port = 0;
};

struct ServerShuttingDown {
    std::string reason = "normal";
};

} // namespace orca::events
