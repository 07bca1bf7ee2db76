#include "orca/actions/executor.hpp"

#include "orca/events/signals.hpp"

#include <spdlog/spdlog.h>

namespace orca::actions {

const char* to_string(OutcomeState state) {
    switch (state) {
        case OutcomeState::Pending: return "Pending";
        case OutcomeState::Acting: return "Acting";
        case OutcomeState::Succeeded: return "Succeeded";
        case OutcomeState::Failed: return "Failed";
    }
    return "Unknown";
}

ActionExecutor::ActionExecutor(orchestration::OrchestrationClient& orchestration,
                               NotificationSink& notifications,
                               OutcomeEmitter emit,
                               ExecutorOptions options,
                               events::EventBus* bus)
    : context_{orchestration, notifications, std::move(emit), options.event_namespace}
    , options_(std::move(options))
    , bus_(bus) {
    if (options_.workers == 0) {
        options_.workers = 1;
    }
}

ActionExecutor::~ActionExecutor() {
    stop();
}

void ActionExecutor::start() {
    if (running_.exchange(true)) {
        return;
    }
    workers_.reserve(options_.workers);
    for (std::size_t i = 0; i < options_.workers; ++i) {
        workers_.emplace_back(&ActionExecutor::worker_loop, this, i);
    }
    spdlog::info("[Executor] started with {} workers", options_.workers);
}

void ActionExecutor::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    queue_.close();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    spdlog::info("[Executor] stopped");
}

bool ActionExecutor::submit(automations::TriggeredAction triggered) {
    if (!running_) {
        spdlog::warn("[Executor] not running, invocation={} dropped", triggered.id);
        return false;
    }

    {
        std::lock_guard lock(ledger_mutex_);
        if (ledger_.count(triggered.id) > 0) {
            spdlog::debug("[Executor] duplicate invocation={} ignored", triggered.id);
            return false;
        }
        ActionOutcome pending;
        pending.invocation = triggered.id;
        pending.automation_id = triggered.automation.id;
        pending.action_type = action_type(triggered.action);
        ledger_.emplace(triggered.id, pending);
        ledger_order_.push_back(triggered.id);
        trim_ledger_locked();
    }

    const std::string invocation = triggered.id;
    in_flight_++;
    if (!queue_.push(std::move(triggered))) {
        std::lock_guard lock(ledger_mutex_);
        auto& entry = ledger_[invocation];
        entry.state = OutcomeState::Failed;
        entry.reason = "executor stopped";
        finish_one();
        return false;
    }
    return true;
}

ActionOutcome ActionExecutor::execute(const automations::TriggeredAction& triggered) {
    ActionOutcome outcome;
    outcome.invocation = triggered.id;
    outcome.automation_id = triggered.automation.id;
    outcome.action_type = action_type(triggered.action);

    {
        std::lock_guard lock(ledger_mutex_);
        auto it = ledger_.find(triggered.id);
        if (it != ledger_.end() && it->second.state != OutcomeState::Pending) {
            spdlog::debug("[Executor] invocation={} already {}", triggered.id, to_string(it->second.state));
            return it->second;
        }
        outcome.state = OutcomeState::Acting;
        ledger_[triggered.id] = outcome;
        if (it == ledger_.end()) {
            ledger_order_.push_back(triggered.id);
            trim_ledger_locked();
        }
    }

    auto action = make_action(triggered.action, context_);
    auto result = [&]() -> Result<ActionResult, ActionFailure> {
        try {
            return action->act(triggered);
        } catch (const std::exception& e) {
            return Err<ActionResult>(ActionFailure{std::string("Unexpected error: ") + e.what()});
        }
    }();

    try {
        if (result.is_ok()) {
            outcome.state = OutcomeState::Succeeded;
            outcome.status_code = result.value().status_code;
            action->succeed(triggered, result.value());
        } else {
            outcome.state = OutcomeState::Failed;
            outcome.reason = result.error().reason;
            action->fail(triggered, outcome.reason);
        }
    } catch (const std::exception& e) {
        spdlog::error("[Executor] could not emit outcome of invocation={}: {}", triggered.id, e.what());
    }

    record(outcome);
    return outcome;
}

std::optional<ActionOutcome> ActionExecutor::outcome(const std::string& invocation) const {
    std::lock_guard lock(ledger_mutex_);
    auto it = ledger_.find(invocation);
    if (it == ledger_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ActionExecutor::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(idle_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return in_flight_.load() == 0; });
}

void ActionExecutor::worker_loop(std::size_t index) {
    spdlog::debug("[Executor] worker {} running", index);
    while (auto triggered = queue_.pop()) {
        execute(*triggered);
        finish_one();
    }
    spdlog::debug("[Executor] worker {} exiting", index);
}

void ActionExecutor::record(const ActionOutcome& outcome) {
    {
        std::lock_guard lock(ledger_mutex_);
        ledger_[outcome.invocation] = outcome;
    }

    if (outcome.state == OutcomeState::Succeeded) {
        spdlog::debug("[Executor] {} succeeded invocation={} automation={} status={}",
                     outcome.action_type, outcome.invocation, outcome.automation_id,
                     outcome.status_code.value_or(0));
        if (bus_) {
            bus_->emit(events::ActionSucceeded{outcome.invocation, outcome.automation_id,
                                               outcome.action_type, outcome.status_code.value_or(0)});
        }
    } else {
        spdlog::debug("[Executor] {} failed invocation={} automation={} reason={}",
                     outcome.action_type, outcome.invocation, outcome.automation_id, outcome.reason);
        if (bus_) {
            bus_->emit(events::ActionFailed{outcome.invocation, outcome.automation_id,
                                            outcome.action_type, outcome.reason});
        }
    }
}

void ActionExecutor::trim_ledger_locked() {
    // Oldest finished outcomes go first; invocations still in progress stay put
    for (auto order = ledger_order_.begin();
         order != ledger_order_.end() && ledger_order_.size() > options_.ledger_capacity;) {
        auto it = ledger_.find(*order);
        if (it != ledger_.end() &&
            (it->second.state == OutcomeState::Pending || it->second.state == OutcomeState::Acting)) {
            ++order;
            continue;
        }
        if (it != ledger_.end()) {
            ledger_.erase(it);
        }
        order = ledger_order_.erase(order);
    }
}

void ActionExecutor::finish_one() {
    {
        std::lock_guard lock(idle_mutex_);
        in_flight_--;
    }
    idle_cv_.notify_all();
}

} // namespace orca::actions
