/**
 * @file components.hpp
 * @brief Bus subscribers for logging and metrics
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // both now react to every signal the service emits
 */

#pragma once

#include "orca/events/event_bus.hpp"
#include "orca/events/signals.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace orca::events {

/**
 * @brief Logs firings, action outcomes, faults and lifecycle signals
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        subscriptions_.push_back(bus_.subscribe<EventRejected>([this](const EventRejected& s) {
            on_event_rejected(s);
        }));

        subscriptions_.push_back(bus_.subscribe<FiringProduced>([this](const FiringProduced& s) {
            on_firing(s);
        }));

        subscriptions_.push_back(bus_.subscribe<ActionDispatched>([this](const ActionDispatched& s) {
            on_action_dispatched(s);
        }));

        subscriptions_.push_back(bus_.subscribe<ActionSucceeded>([this](const ActionSucceeded& s) {
            on_action_succeeded(s);
        }));

        subscriptions_.push_back(bus_.subscribe<ActionFailed>([this](const ActionFailed& s) {
            on_action_failed(s);
        }));

        subscriptions_.push_back(bus_.subscribe<EvaluationFault>([this](const EvaluationFault& s) {
            on_evaluation_fault(s);
        }));

        subscriptions_.push_back(bus_.subscribe<AutomationChanged>([this](const AutomationChanged& s) {
            on_automation_changed(s);
        }));

        subscriptions_.push_back(bus_.subscribe<ServerStarted>([this](const ServerStarted& s) {
            on_server_started(s);
        }));

        subscriptions_.push_back(bus_.subscribe<ServerShuttingDown>([this](const ServerShuttingDown& s) {
            on_server_shutdown(s);
        }));
    }

    ~LoggerComponent() {
        bus_.unsubscribe<EventRejected>(subscriptions_[0]);
        bus_.unsubscribe<FiringProduced>(subscriptions_[1]);
        bus_.unsubscribe<ActionDispatched>(subscriptions_[2]);
        bus_.unsubscribe<ActionSucceeded>(subscriptions_[3]);
        bus_.unsubscribe<ActionFailed>(subscriptions_[4]);
        bus_.unsubscribe<EvaluationFault>(subscriptions_[5]);
        bus_.unsubscribe<AutomationChanged>(subscriptions_[6]);
        bus_.unsubscribe<ServerStarted>(subscriptions_[7]);
        bus_.unsubscribe<ServerShuttingDown>(subscriptions_[8]);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_event_rejected(const EventRejected& s) {
        spdlog::warn("[EventRejected] id={} reason={}", s.event_id, s.reason);
    }

    void on_firing(const FiringProduced& s) {
        const auto& f = s.firing;
        spdlog::info("[Firing] id={} automation={} posture={} event={}",
                     f.id, f.automation_id, automations::to_string(f.trigger.posture),
                     f.triggering_event ? f.triggering_event->id : "<deadline>");
    }

    void on_action_dispatched(const ActionDispatched& s) {
        spdlog::debug("[ActionDispatched] invocation={} type={} index={}",
                      s.action.id, actions::action_type(s.action.action), s.action.action_index);
    }

    void on_action_succeeded(const ActionSucceeded& s) {
        spdlog::info("[ActionExecuted] invocation={} automation={} type={} status={}",
                     s.invocation, s.automation_id, s.action_type, s.status_code);
    }

    void on_action_failed(const ActionFailed& s) {
        spdlog::warn("[ActionFailed] invocation={} automation={} type={} reason={}",
                     s.invocation, s.automation_id, s.action_type, s.reason);
    }

    void on_evaluation_fault(const EvaluationFault& s) {
        spdlog::error("[EvaluationFault] automation={} event={} error={}",
                      s.automation_id, s.event_id, s.message);
    }

    void on_automation_changed(const AutomationChanged& s) {
        const char* change = s.change == AutomationChange::Created ? "created"
                           : s.change == AutomationChange::Updated ? "updated" : "deleted";
        spdlog::debug("[AutomationChanged] id={} change={} generation={}", s.automation_id, change, s.generation);
    }

    void on_server_started(const ServerStarted& s) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("orca listening on {}:{}", s.address, s.port);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_server_shutdown(const ServerShuttingDown& s) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Server shutting down: {}", s.reason);
        spdlog::info("════════════════════════════════════════════");
    }

    EventBus& bus_;
    std::vector<size_t> subscriptions_;
};

/**
 * @brief Counters exposed by GET /health
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> events_received{0};
        std::atomic<uint64_t> events_rejected{0};
        std::atomic<uint64_t> firings{0};
        std::atomic<uint64_t> actions_dispatched{0};
        std::atomic<uint64_t> actions_succeeded{0};
        std::atomic<uint64_t> actions_failed{0};
        std::atomic<uint64_t> evaluation_faults{0};
        std::atomic<uint64_t> automation_changes{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<EventReceived>([this](const EventReceived&) { stats_.events_received++; });
        bus_.subscribe<EventRejected>([this](const EventRejected&) { stats_.events_rejected++; });
        bus_.subscribe<FiringProduced>([this](const FiringProduced&) { stats_.firings++; });
        bus_.subscribe<ActionDispatched>([this](const ActionDispatched&) { stats_.actions_dispatched++; });
        bus_.subscribe<ActionSucceeded>([this](const ActionSucceeded&) { stats_.actions_succeeded++; });
        bus_.subscribe<ActionFailed>([this](const ActionFailed&) { stats_.actions_failed++; });
        bus_.subscribe<EvaluationFault>([this](const EvaluationFault&) { stats_.evaluation_faults++; });
        bus_.subscribe<AutomationChanged>([this](const AutomationChanged&) { stats_.automation_changes++; });
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    nlohmann::json to_json() const {
        return {
            {"events_received", stats_.events_received.load()},
            {"events_rejected", stats_.events_rejected.load()},
            {"firings", stats_.firings.load()},
            {"actions_dispatched", stats_.actions_dispatched.load()},
            {"actions_succeeded", stats_.actions_succeeded.load()},
            {"actions_failed", stats_.actions_failed.load()},
            {"evaluation_faults", stats_.evaluation_faults.load()},
            {"automation_changes", stats_.automation_changes.load()}
        };
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Session Statistics:");
        spdlog::info("  Events received:   {}", stats_.events_received.load());
        spdlog::info("  Events rejected:   {}", stats_.events_rejected.load());
        spdlog::info("  Firings:           {}", stats_.firings.load());
        spdlog::info("  Actions succeeded: {}", stats_.actions_succeeded.load());
        spdlog::info("  Actions failed:    {}", stats_.actions_failed.load());
        spdlog::info("  Eval faults:       {}", stats_.evaluation_faults.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace orca::events
