#include "orca/service/event_pipeline.hpp"

#include "orca/events/signals.hpp"

#include <spdlog/spdlog.h>

#include <functional>

namespace orca::service {

EventPipeline::EventPipeline(const automations::AutomationRegistry& registry,
                             storage::EventStore& store,
                             triggers::TriggerEngine& engine,
                             actions::ActionExecutor& executor,
                             PipelineOptions options,
                             events::EventBus* bus)
    : registry_(registry)
    , store_(store)
    , engine_(engine)
    , executor_(executor)
    , dispatcher_(executor, bus)
    , options_(options)
    , bus_(bus) {
    if (options_.workers == 0) {
        options_.workers = 1;
    }
    queues_.reserve(options_.workers);
    for (std::size_t i = 0; i < options_.workers; ++i) {
        queues_.push_back(std::make_unique<WorkQueue<events::Event>>());
    }
}

EventPipeline::~EventPipeline() {
    stop();
}

void EventPipeline::start() {
    if (running_.exchange(true)) {
        return;
    }
    workers_.reserve(queues_.size());
    for (std::size_t i = 0; i < queues_.size(); ++i) {
        workers_.emplace_back(&EventPipeline::worker_loop, this, i);
    }
    sweeper_ = std::thread(&EventPipeline::sweep_loop, this);
    spdlog::info("[Pipeline] started with {} evaluation workers, sweep every {}ms",
                 queues_.size(),
                 std::chrono::duration_cast<std::chrono::milliseconds>(options_.sweep_interval).count());
}

void EventPipeline::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard lock(sweep_mutex_);
    }
    sweep_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
    for (auto& queue : queues_) {
        queue->close();
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    spdlog::info("[Pipeline] stopped");
}

Result<bool, Error> EventPipeline::publish(const events::Event& event, const std::string& source) {
    auto valid = events::validate(event);
    if (valid.is_error()) {
        spdlog::debug("[Pipeline] rejected event={} from {}: {}", event.id, source, valid.error().message);
        if (bus_) {
            bus_->emit(events::EventRejected{event.id, valid.error().message});
        }
        return Err<bool>(valid.error());
    }

    events::Event received = event.receive(now());
    auto appended = store_.append(received);
    if (appended.is_error()) {
        return Err<bool>(appended.error());
    }
    if (!appended.value()) {
        spdlog::debug("[Pipeline] duplicate event={} from {} ignored", event.id, source);
        return Ok(false);
    }

    if (bus_) {
        bus_->emit(events::EventReceived{received, source});
    }

    if (!running_) {
        spdlog::debug("[Pipeline] not running, event={} stored without evaluation", event.id);
        return Ok(true);
    }

    in_flight_++;
    if (!queues_[queue_for(received)]->push(std::move(received))) {
        finish_one();
    }
    return Ok(true);
}

Result<std::size_t, Error> EventPipeline::publish_batch(const std::vector<events::Event>& batch,
                                                        const std::string& source) {
    for (std::size_t i = 0; i < batch.size(); ++i) {
        auto valid = events::validate(batch[i]);
        if (valid.is_error()) {
            return Err<std::size_t>(Error::invalid_argument(
                "event " + std::to_string(i) + ": " + valid.error().message));
        }
    }

    std::size_t added = 0;
    for (const auto& event : batch) {
        auto published = publish(event, source);
        if (published.is_error()) {
            return Err<std::size_t>(published.error());
        }
        if (published.value()) {
            added++;
        }
    }
    return Ok(added);
}

std::size_t EventPipeline::sweep(TimePoint at) {
    auto firings = engine_.tick(at);
    dispatch(firings);
    return firings.size();
}

bool EventPipeline::wait_idle(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    // Outcome events re-enter the pipeline, so settle until both are quiet
    while (true) {
        if (!wait_evaluations(deadline)) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0 || !executor_.wait_idle(remaining)) {
            return false;
        }
        if (in_flight_.load() == 0 && executor_.in_flight() == 0) {
            return true;
        }
    }
}

void EventPipeline::worker_loop(std::size_t index) {
    spdlog::debug("[Pipeline] worker {} running", index);
    while (auto event = queues_[index]->pop()) {
        try {
            dispatch(engine_.observe(*event));
        } catch (const std::exception& e) {
            spdlog::error("[Pipeline] worker {} failed on event={}: {}", index, event->id, e.what());
        }
        finish_one();
    }
    spdlog::debug("[Pipeline] worker {} exiting", index);
}

void EventPipeline::sweep_loop() {
    std::unique_lock lock(sweep_mutex_);
    while (running_) {
        sweep_cv_.wait_for(lock, options_.sweep_interval, [this]() { return !running_.load(); });
        if (!running_) {
            break;
        }
        lock.unlock();
        try {
            const auto fired = sweep(now());
            if (fired > 0) {
                spdlog::debug("[Pipeline] sweep produced {} firings", fired);
            }
        } catch (const std::exception& e) {
            spdlog::error("[Pipeline] deadline sweep failed: {}", e.what());
        }
        lock.lock();
    }
}

void EventPipeline::dispatch(const std::vector<automations::Firing>& firings) {
    for (const auto& firing : firings) {
        auto automation = registry_.get(firing.automation_id);
        if (!automation) {
            spdlog::debug("[Pipeline] firing={} for removed automation={} dropped",
                          firing.id, firing.automation_id);
            continue;
        }
        dispatcher_.dispatch(firing, *automation);
    }
}

std::size_t EventPipeline::queue_for(const events::Event& event) const {
    return std::hash<std::string>{}(event.resource.id()) % queues_.size();
}

void EventPipeline::finish_one() {
    {
        std::lock_guard lock(idle_mutex_);
        in_flight_--;
    }
    idle_cv_.notify_all();
}

bool EventPipeline::wait_evaluations(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock lock(idle_mutex_);
    return idle_cv_.wait_until(lock, deadline, [this]() { return in_flight_.load() == 0; });
}

} // namespace orca::service
