#pragma once

/**
 * @file types.hpp
 * @brief Automations, their triggers, and what a trigger produces
 *
 * WHY THIS FILE EXISTS:
 * An Automation is the user's rule: "when these events happen (or fail to
 * happen) for a resource, do these things". The trigger engine consumes
 * Automation/EventTrigger, produces Firing, and the dispatcher turns each
 * Firing into one TriggeredAction per configured action.
 *
 * POSTURES:
 * - Reactive:  fire when at least `threshold` expected events occur within
 *              `within` (after an arming `after` event, if one is set)
 * - Proactive: after an `after` event, fire when fewer than `threshold`
 *              expected events occur before `within` elapses
 *
 * Firings and triggered actions are immutable values once built.
 */

#include "orca/actions/action_spec.hpp"
#include "orca/core/error.hpp"
#include "orca/core/result.hpp"
#include "orca/core/time.hpp"
#include "orca/events/event.hpp"
#include "orca/matching/resource_matcher.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace orca::automations {

enum class Posture {
    Reactive,
    Proactive
};

const char* to_string(Posture posture);

enum class TriggerState {
    Triggered
};

const char* to_string(TriggerState state);

struct EventTrigger {
    matching::ResourceSpecification match;
    matching::ResourceSpecification match_related;
    std::set<std::string> after;
    std::set<std::string> expect;
    std::set<std::string> for_each{events::kResourceId};
    Posture posture = Posture::Reactive;
    int threshold = 1;
    Duration within{0};

    // Number of expected events that completes (Reactive) or resolves (Proactive)
    int required_count() const { return threshold > 1 ? threshold : 1; }
};

struct Automation {
    std::string id;
    std::string name;
    std::string description;
    bool enabled = true;
    EventTrigger trigger;
    std::vector<actions::ActionSpec> actions;
};

struct Firing {
    std::string id;
    std::string automation_id;
    EventTrigger trigger;
    std::set<TriggerState> trigger_states{TriggerState::Triggered};
    TimePoint triggered{};
    events::Labels triggering_labels;
    std::optional<events::Event> triggering_event;
};

struct TriggeredAction {
    std::string id;
    Automation automation;
    Firing firing;
    TimePoint triggered{};
    events::Labels triggering_labels;
    std::optional<events::Event> triggering_event;
    actions::ActionSpec action;
    int action_index = 0;
};

/**
 * @brief Authoring-time checks
 *
 * Rejects negative windows and thresholds, a Proactive trigger without a
 * positive window, an empty for_each label, malformed match patterns and
 * an empty name. Errors carry ErrorCode::Configuration.
 */
Result<void, Error> validate(const EventTrigger& trigger);
Result<void, Error> validate(const Automation& automation);

} // namespace orca::automations
