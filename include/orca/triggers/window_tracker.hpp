#pragma once

/**
 * @file window_tracker.hpp
 * @brief Per-trigger-instance window state, sharded by key
 *
 * WHY THIS FILE EXISTS:
 * Every (automation, resource) pair that a trigger follows has its own
 * rolling window: a count of expected events for Reactive triggers, a
 * deadline for Proactive ones. Thousands of such windows are updated
 * concurrently by the evaluation workers, so the map is split into
 * shards, each with its own mutex.
 *
 * CONCURRENCY:
 * - One key is always updated under its shard mutex (serialized)
 * - Keys in different shards update in parallel
 * - update() runs the caller's function under the shard lock; the
 *   function must not call back into the tracker
 *
 * LIFETIME:
 * A window is created by the first matching event for its key and is
 * removed explicitly: by sweep() once it is closed and idle, by erase()
 * after a firing that leaves nothing pending, or by drop_automation()
 * when its automation is edited or deleted.
 */

#include "orca/automations/types.hpp"
#include "orca/core/time.hpp"
#include "orca/events/event.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace orca::triggers {

struct TriggerInstanceKey {
    std::string automation_id;
    std::vector<std::pair<std::string, std::string>> labels;  // for_each order

    bool operator<(const TriggerInstanceKey& other) const {
        return std::tie(automation_id, labels) < std::tie(other.automation_id, other.labels);
    }
    bool operator==(const TriggerInstanceKey& other) const {
        return automation_id == other.automation_id && labels == other.labels;
    }

    // "automation_id|label=value|label=value"
    std::string to_string() const;

    events::Labels label_map() const;
};

// for_each labels resolved against the event's primary resource; missing labels resolve to ""
TriggerInstanceKey make_key(const automations::Automation& automation, const events::Event& event);

struct CountedEvent {
    TimePoint occurred;
    std::string event_id;
};

struct ReactiveWindow {
    std::deque<CountedEvent> counted;  // ordered by occurred
    std::optional<TimePoint> armed_at;
    std::string arming_event_id;
    std::uint64_t epoch = 0;
};

struct ProactiveWindow {
    std::optional<TimePoint> deadline;
    std::optional<events::Event> arming_event;
    int count = 0;
};

struct WindowState {
    automations::Posture posture = automations::Posture::Reactive;
    Duration within{0};
    ReactiveWindow reactive;
    ProactiveWindow proactive;

    // event id -> occurred, for dedup; pruned behind the high-water mark
    std::map<std::string, TimePoint> seen;
    std::optional<TimePoint> high_water;

    bool open() const {
        if (posture == automations::Posture::Proactive) {
            return proactive.deadline.has_value();
        }
        return reactive.armed_at.has_value() || !reactive.counted.empty();
    }
};

struct ExpiredWindow {
    TriggerInstanceKey key;
    ProactiveWindow window;
};

class WindowTracker {
public:
    explicit WindowTracker(std::size_t shard_count = 16);

    WindowTracker(const WindowTracker&) = delete;
    WindowTracker& operator=(const WindowTracker&) = delete;

    /**
     * @brief Run `fn(WindowState&)` on the window for `key`, creating it
     *
     * The new window takes posture and within from `trigger`. Returns
     * whatever `fn` returns.
     */
    template<typename Fn>
    auto update(const TriggerInstanceKey& key, const automations::EventTrigger& trigger, Fn&& fn)
        -> decltype(fn(std::declval<WindowState&>())) {
        Shard& shard = shard_for(key);
        std::lock_guard lock(shard.mutex);
        auto it = shard.windows.find(key);
        if (it == shard.windows.end()) {
            WindowState state;
            state.posture = trigger.posture;
            state.within = trigger.within;
            it = shard.windows.emplace(key, std::move(state)).first;
        }
        return fn(it->second);
    }

    /**
     * @brief Close and return Proactive windows whose deadline is <= now
     *
     * Each returned window is closed before the shard lock is released, so
     * a deadline is reported exactly once. Also removes windows that are
     * closed and have seen nothing newer than `within` before `now`.
     */
    std::vector<ExpiredWindow> sweep(TimePoint now);

    void erase(const TriggerInstanceKey& key);
    std::size_t drop_automation(const std::string& automation_id);

    std::optional<WindowState> peek(const TriggerInstanceKey& key) const;
    std::size_t size() const;
    std::size_t shard_count() const { return shards_.size(); }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::map<TriggerInstanceKey, WindowState> windows;
    };

    Shard& shard_for(const TriggerInstanceKey& key) const;

    std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace orca::triggers
