#include "orca/triggers/trigger_engine.hpp"

#include "orca/core/ids.hpp"
#include "orca/events/signals.hpp"
#include "orca/matching/resource_matcher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace orca::triggers {

using automations::Automation;
using automations::Firing;
using automations::Posture;

namespace {

Firing make_firing(const Automation& automation,
                   const TriggerInstanceKey& key,
                   const std::string& cause,
                   std::optional<events::Event> triggering_event,
                   TimePoint triggered) {
    Firing firing;
    firing.id = firing_id(key, cause);
    firing.automation_id = automation.id;
    firing.trigger = automation.trigger;
    firing.triggered = triggered;
    firing.triggering_labels = key.label_map();
    firing.triggering_event = std::move(triggering_event);
    return firing;
}

void prune_seen(WindowState& state) {
    const TimePoint horizon = *state.high_water - state.within;
    for (auto it = state.seen.begin(); it != state.seen.end();) {
        if (it->second < horizon) {
            it = state.seen.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace

std::string firing_id(const TriggerInstanceKey& key, const std::string& cause) {
    return uuid_from_name("firing:" + key.to_string() + "#" + cause);
}

TriggerEngine::TriggerEngine(const automations::AutomationRegistry& registry,
                             EngineOptions options,
                             events::EventBus* bus)
    : registry_(registry)
    , bus_(bus)
    , tracker_(options.shard_count) {
    if (bus_) {
        subscription_ = bus_->subscribe<events::AutomationChanged>(
            [this](const events::AutomationChanged& change) {
                if (change.change == events::AutomationChange::Created) {
                    return;
                }
                const auto dropped = forget(change.automation_id);
                spdlog::debug("[Engine] automation={} changed, dropped {} windows",
                              change.automation_id, dropped);
            });
    }
}

TriggerEngine::~TriggerEngine() {
    if (bus_ && subscription_) {
        bus_->unsubscribe<events::AutomationChanged>(*subscription_);
    }
}

std::vector<Firing> TriggerEngine::observe(const events::Event& event) {
    std::vector<Firing> firings;
    const auto automations = registry_.snapshot();

    for (const auto& automation : *automations) {
        if (!automation.enabled) {
            continue;
        }
        try {
            if (hook_) {
                hook_(automation, event);
            }
            auto firing = evaluate(automation, event);
            if (firing) {
                firings.push_back(std::move(*firing));
            }
        } catch (const std::exception& e) {
            faults_++;
            spdlog::error("[Engine] evaluation failed automation={} event={} error={}",
                          automation.id, event.id, e.what());
            if (bus_) {
                bus_->emit(events::EvaluationFault{automation.id, event.id, e.what()});
            }
        }
    }

    if (bus_) {
        for (const auto& firing : firings) {
            bus_->emit(events::FiringProduced{firing});
        }
    }
    return firings;
}

std::vector<Firing> TriggerEngine::tick(TimePoint now) {
    std::vector<Firing> firings;
    auto expired = tracker_.sweep(now);
    if (expired.empty()) {
        return firings;
    }

    const auto automations = registry_.snapshot();
    for (auto& window : expired) {
        auto it = std::find_if(automations->begin(), automations->end(),
            [&window](const Automation& a) { return a.id == window.key.automation_id; });
        if (it == automations->end() || !it->enabled) {
            continue;
        }

        std::string cause = "deadline@" + format_timestamp(*window.window.deadline);
        if (window.window.arming_event) {
            cause += "/" + window.window.arming_event->id;
        }
        spdlog::debug("[Engine] deadline elapsed automation={} key={}", it->id, window.key.to_string());
        firings.push_back(make_firing(*it, window.key, cause, std::nullopt, now));
    }

    if (bus_) {
        for (const auto& firing : firings) {
            bus_->emit(events::FiringProduced{firing});
        }
    }
    return firings;
}

std::size_t TriggerEngine::forget(const std::string& automation_id) {
    return tracker_.drop_automation(automation_id);
}

std::optional<Firing> TriggerEngine::evaluate(const Automation& automation, const events::Event& event) {
    const auto& trigger = automation.trigger;
    if (!matching::matches(trigger.match, event.resource) ||
        !matching::matches_related(trigger.match_related, event.related)) {
        return std::nullopt;
    }

    const bool is_after = !trigger.after.empty() && matching::matches_event_name(trigger.after, event.event);
    const bool is_expect = trigger.expect.empty()
        ? !is_after
        : matching::matches_event_name(trigger.expect, event.event);
    if (!is_after && !is_expect) {
        return std::nullopt;
    }

    const auto key = make_key(automation, event);
    return tracker_.update(key, trigger, [&](WindowState& state) -> std::optional<Firing> {
        if (state.seen.count(event.id) > 0) {
            spdlog::debug("[Engine] duplicate event={} for key={}", event.id, key.to_string());
            return std::nullopt;
        }
        if (state.high_water && event.occurred < *state.high_water - state.within) {
            spdlog::debug("[Engine] late event={} occurred={} high_water={} key={}",
                          event.id, format_timestamp(event.occurred),
                          format_timestamp(*state.high_water), key.to_string());
            return std::nullopt;
        }

        state.seen.emplace(event.id, event.occurred);
        if (!state.high_water || event.occurred > *state.high_water) {
            state.high_water = event.occurred;
        }
        prune_seen(state);

        if (state.posture == Posture::Reactive) {
            return evaluate_reactive(automation, key, state, event, is_after, is_expect);
        }
        evaluate_proactive(automation, state, event, is_after, is_expect);
        return std::nullopt;
    });
}

std::optional<Firing> TriggerEngine::evaluate_reactive(const Automation& automation,
                                                       const TriggerInstanceKey& key,
                                                       WindowState& state,
                                                       const events::Event& event,
                                                       bool is_after,
                                                       bool is_expect) {
    const auto& trigger = automation.trigger;
    auto& window = state.reactive;

    if (is_after) {
        window.armed_at = event.occurred;
        window.arming_event_id = event.id;
        window.counted.clear();
        ++window.epoch;
    }
    if (!is_expect) {
        return std::nullopt;
    }

    if (!trigger.after.empty()) {
        if (!window.armed_at || event.occurred < *window.armed_at) {
            return std::nullopt;
        }
        if (event.occurred > *window.armed_at + state.within) {
            window.armed_at.reset();
            window.arming_event_id.clear();
            window.counted.clear();
            return std::nullopt;
        }
    }

    auto pos = std::upper_bound(window.counted.begin(), window.counted.end(), event.occurred,
        [](TimePoint occurred, const CountedEvent& c) { return occurred < c.occurred; });
    window.counted.insert(pos, CountedEvent{event.occurred, event.id});

    const TimePoint horizon = *state.high_water - state.within;
    while (!window.counted.empty() && window.counted.front().occurred < horizon) {
        window.counted.pop_front();
    }

    if (static_cast<int>(window.counted.size()) < trigger.required_count()) {
        return std::nullopt;
    }

    auto firing = make_firing(automation, key, "event:" + event.id, event, now());
    window.counted.clear();
    if (!trigger.after.empty()) {
        window.armed_at.reset();
        window.arming_event_id.clear();
    }
    ++window.epoch;
    return firing;
}

void TriggerEngine::evaluate_proactive(const Automation& automation,
                                       WindowState& state,
                                       const events::Event& event,
                                       bool is_after,
                                       bool is_expect) {
    const auto& trigger = automation.trigger;
    auto& window = state.proactive;

    const bool arms = is_after || (trigger.after.empty() && is_expect);
    if (arms) {
        if (window.arming_event && event.occurred < window.arming_event->occurred) {
            return;
        }
        window.deadline = event.occurred + trigger.within;
        window.arming_event = event;
        window.count = 0;
        return;
    }

    if (!is_expect || !window.deadline || !window.arming_event) {
        return;
    }
    if (event.occurred < window.arming_event->occurred || event.occurred > *window.deadline) {
        return;
    }

    if (++window.count >= trigger.required_count()) {
        spdlog::debug("[Engine] automation={} resolved by event={}", automation.id, event.id);
        window.deadline.reset();
        window.arming_event.reset();
        window.count = 0;
    }
}

} // namespace orca::triggers
