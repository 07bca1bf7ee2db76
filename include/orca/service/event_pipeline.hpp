#pragma once

/**
 * @file event_pipeline.hpp
 * @brief Ingestion path shared by HTTP, WebSocket and action outcomes
 *
 * WHY THIS FILE EXISTS:
 * Every event, whether posted in a batch, streamed over a WebSocket or
 * emitted by an action, goes through publish(): validate, stamp
 * `received`, append to the store, then hand it to the trigger engine.
 * Evaluation happens on a fixed set of worker threads, each with its own
 * queue. The queue is picked by hashing the primary resource id, so
 * events about one resource are evaluated in the order they were
 * published while different resources proceed in parallel.
 *
 * A separate sweep thread calls TriggerEngine::tick() every
 * sweep_interval so Proactive deadlines fire without waiting for traffic.
 *
 * EXAMPLE:
 * EventPipeline pipeline(registry, store, engine, executor, {4, 1s}, &bus);
 * pipeline.start();
 * pipeline.publish(event, "http");
 */

#include "orca/actions/dispatcher.hpp"
#include "orca/actions/executor.hpp"
#include "orca/automations/registry.hpp"
#include "orca/core/error.hpp"
#include "orca/core/result.hpp"
#include "orca/core/time.hpp"
#include "orca/core/work_queue.hpp"
#include "orca/events/event.hpp"
#include "orca/events/event_bus.hpp"
#include "orca/storage/event_store.hpp"
#include "orca/triggers/trigger_engine.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace orca::service {

struct PipelineOptions {
    std::size_t workers = 4;
    Duration sweep_interval = std::chrono::seconds(1);
};

class EventPipeline {
public:
    EventPipeline(const automations::AutomationRegistry& registry,
                  storage::EventStore& store,
                  triggers::TriggerEngine& engine,
                  actions::ActionExecutor& executor,
                  PipelineOptions options = {},
                  events::EventBus* bus = nullptr);
    ~EventPipeline();

    EventPipeline(const EventPipeline&) = delete;
    EventPipeline& operator=(const EventPipeline&) = delete;

    void start();

    // Drains the evaluation queues, then joins workers and the sweeper
    void stop();

    /**
     * @brief Validate, store and queue one event for evaluation
     *
     * Returns true when the event was new, false when its id was already
     * stored (nothing else happens in that case), or the validation error.
     * When the pipeline is not running the event is still stored but not
     * evaluated.
     */
    Result<bool, Error> publish(const events::Event& event, const std::string& source);

    /**
     * @brief Publish a batch in order
     *
     * Every event is validated before any is stored, so a batch with one
     * bad event is rejected as a whole. Returns the number of new events.
     */
    Result<std::size_t, Error> publish_batch(const std::vector<events::Event>& batch,
                                             const std::string& source);

    // One deadline sweep at the given time; the sweep thread calls this
    std::size_t sweep(TimePoint at);

    // Blocks until no event is queued or being evaluated and no action is
    // running; false on timeout
    bool wait_idle(std::chrono::milliseconds timeout);

    std::size_t worker_count() const { return queues_.size(); }
    bool running() const { return running_.load(); }

private:
    void worker_loop(std::size_t index);
    void sweep_loop();
    void dispatch(const std::vector<automations::Firing>& firings);
    std::size_t queue_for(const events::Event& event) const;
    void finish_one();
    bool wait_evaluations(std::chrono::steady_clock::time_point deadline);

    const automations::AutomationRegistry& registry_;
    storage::EventStore& store_;
    triggers::TriggerEngine& engine_;
    actions::ActionExecutor& executor_;
    actions::ActionDispatcher dispatcher_;
    PipelineOptions options_;
    events::EventBus* bus_;

    std::vector<std::unique_ptr<WorkQueue<events::Event>>> queues_;
    std::vector<std::thread> workers_;
    std::thread sweeper_;
    std::atomic<bool> running_{false};

    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;

    std::atomic<std::size_t> in_flight_{0};
    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
};

} // namespace orca::service
