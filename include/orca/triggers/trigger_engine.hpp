#pragma once

/**
 * @file trigger_engine.hpp
 * @brief Evaluates events against every automation's trigger
 *
 * WHY THIS FILE EXISTS:
 * This is where "three failures within ten minutes" or "no Completed
 * within an hour of Running" is decided. observe() is called once per
 * stored event, tick() periodically; both return the Firings produced.
 *
 * HOW IT WORKS (per enabled automation whose match/match_related accept
 * the event):
 * 1. after-event:  Proactive (re)starts the deadline,
 *                  Reactive arms the window at event.occurred
 * 2. expect-event: Reactive counts it (when armed or after is empty),
 *                  Proactive counts it towards resolving the deadline
 * 3. Reactive fires once count >= max(threshold, 1) in the current epoch,
 *    with the completing event as triggering_event, then closes the epoch
 * 4. tick(now) fires every Proactive deadline <= now exactly once
 *
 * An empty `expect` accepts every matched event. With an empty `after`,
 * Proactive triggers behave as a heartbeat: each expected event re-arms
 * the deadline.
 *
 * ORDERING:
 * Per key the engine keeps the highest `occurred` seen. Events older than
 * that mark minus `within` are not counted, Reactive expected events older
 * than the arming time are not counted, and a given event id is counted at
 * most once per window.
 *
 * FAULTS:
 * Each automation is evaluated inside its own try/catch. A fault is logged,
 * emitted as EvaluationFault, and the remaining automations still run.
 */

#include "orca/automations/registry.hpp"
#include "orca/automations/types.hpp"
#include "orca/events/event.hpp"
#include "orca/events/event_bus.hpp"
#include "orca/triggers/window_tracker.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <vector>

namespace orca::triggers {

struct EngineOptions {
    std::size_t shard_count = 16;
};

class TriggerEngine {
public:
    // Called before each automation is evaluated against an event
    using EvaluationHook = std::function<void(const automations::Automation&, const events::Event&)>;

    TriggerEngine(const automations::AutomationRegistry& registry,
                  EngineOptions options = {},
                  events::EventBus* bus = nullptr);
    ~TriggerEngine();

    TriggerEngine(const TriggerEngine&) = delete;
    TriggerEngine& operator=(const TriggerEngine&) = delete;

    std::vector<automations::Firing> observe(const events::Event& event);

    std::vector<automations::Firing> tick(TimePoint now);

    // Drops all window state of one automation
    std::size_t forget(const std::string& automation_id);

    void set_evaluation_hook(EvaluationHook hook) { hook_ = std::move(hook); }

    const WindowTracker& windows() const { return tracker_; }

    std::uint64_t faults() const { return faults_.load(); }

private:
    std::optional<automations::Firing> evaluate(const automations::Automation& automation,
                                                const events::Event& event);

    std::optional<automations::Firing> evaluate_reactive(const automations::Automation& automation,
                                                         const TriggerInstanceKey& key,
                                                         WindowState& state,
                                                         const events::Event& event,
                                                         bool is_after,
                                                         bool is_expect);

    void evaluate_proactive(const automations::Automation& automation,
                            WindowState& state,
                            const events::Event& event,
                            bool is_after,
                            bool is_expect);

    const automations::AutomationRegistry& registry_;
    events::EventBus* bus_;
    WindowTracker tracker_;
    EvaluationHook hook_;
    std::optional<size_t> subscription_;
    std::atomic<std::uint64_t> faults_{0};
};

// Deterministic firing id: the same cause for the same key yields the same id
std::string firing_id(const TriggerInstanceKey& key, const std::string& cause);

} // namespace orca::triggers
