#pragma once

/**
 * @file executor.hpp
 * @brief Worker pool that runs triggered actions
 *
 * WHY THIS FILE EXISTS:
 * Actions call out to the orchestrated system and may be slow; the
 * trigger engine must never wait for them. The dispatcher hands each
 * TriggeredAction to this executor, which queues it and lets a fixed
 * pool of workers run act() followed by succeed() or fail().
 *
 * IDEMPOTENCY:
 * Every invocation id gets one ledger entry
 * (Pending -> Acting -> Succeeded | Failed). A second submission of an id
 * already in the ledger is ignored, so a redelivered firing does not
 * repeat its actions. Failed actions are not retried.
 *
 * EXAMPLE:
 * ActionExecutor executor(orchestrator, sink, publish, {2, "prefect-cloud"});
 * executor.start();
 * executor.submit(triggered_action);
 */

#include "orca/actions/action.hpp"
#include "orca/automations/types.hpp"
#include "orca/core/work_queue.hpp"
#include "orca/events/event_bus.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace orca::actions {

enum class OutcomeState {
    Pending,
    Acting,
    Succeeded,
    Failed
};

const char* to_string(OutcomeState state);

struct ActionOutcome {
    std::string invocation;
    std::string automation_id;
    std::string action_type;
    OutcomeState state = OutcomeState::Pending;
    std::optional<int> status_code;
    std::string reason;
};

struct ExecutorOptions {
    std::size_t workers = 2;
    std::string event_namespace = "prefect-cloud";
    std::size_t ledger_capacity = 100000;
};

class ActionExecutor {
public:
    ActionExecutor(orchestration::OrchestrationClient& orchestration,
                   NotificationSink& notifications,
                   OutcomeEmitter emit,
                   ExecutorOptions options = {},
                   events::EventBus* bus = nullptr);
    ~ActionExecutor();

    ActionExecutor(const ActionExecutor&) = delete;
    ActionExecutor& operator=(const ActionExecutor&) = delete;

    void start();

    // Lets the workers drain the queue, then joins them
    void stop();

    /**
     * @brief Queue one invocation
     *
     * Returns false when the invocation id is already known or the
     * executor has been stopped.
     */
    bool submit(automations::TriggeredAction triggered);

    /**
     * @brief Run one invocation on the calling thread
     *
     * Records the outcome in the ledger like a worker would; a known
     * invocation id that is not Pending is skipped and its recorded
     * outcome returned.
     */
    ActionOutcome execute(const automations::TriggeredAction& triggered);

    std::optional<ActionOutcome> outcome(const std::string& invocation) const;

    // Blocks until nothing is queued or running; false on timeout
    bool wait_idle(std::chrono::milliseconds timeout);

    std::size_t in_flight() const { return in_flight_.load(); }
    bool running() const { return running_.load(); }

private:
    void worker_loop(std::size_t index);
    void record(const ActionOutcome& outcome);
    void trim_ledger_locked();
    void finish_one();

    ActionContext context_;
    ExecutorOptions options_;
    events::EventBus* bus_;

    WorkQueue<automations::TriggeredAction> queue_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};

    mutable std::mutex ledger_mutex_;
    std::unordered_map<std::string, ActionOutcome> ledger_;
    std::deque<std::string> ledger_order_;

    std::atomic<std::size_t> in_flight_{0};
    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
};

} // namespace orca::actions
