#pragma once

/**
 * @file registry.hpp
 * @brief Authoritative set of automations
 *
 * WHY THIS FILE EXISTS:
 * Automations are edited through the admin API while the trigger engine
 * evaluates events concurrently. The registry hands the engine an
 * immutable snapshot per event (shared lock, pointer copy) and rebuilds
 * that snapshot on every write (exclusive lock), so an edit is visible to
 * the very next event.
 *
 * Every write bumps the generation counter and emits AutomationChanged on
 * the bus so that window state of edited or deleted automations can be
 * dropped.
 */

#include "orca/automations/types.hpp"
#include "orca/core/error.hpp"
#include "orca/core/result.hpp"
#include "orca/events/event_bus.hpp"
#include "orca/events/signals.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace orca::automations {

using AutomationSnapshot = std::shared_ptr<const std::vector<Automation>>;

class AutomationRegistry {
public:
    explicit AutomationRegistry(events::EventBus* bus = nullptr);

    AutomationRegistry(const AutomationRegistry&) = delete;
    AutomationRegistry& operator=(const AutomationRegistry&) = delete;

    /**
     * @brief Validate and store a new automation
     *
     * An empty id is replaced by a fresh UUID. Fails with Configuration
     * on validation errors and AlreadyExists on a duplicate id.
     */
    Result<Automation, Error> create(Automation automation);

    // Replace an existing automation; its window state is discarded
    Result<Automation, Error> update(const std::string& id, Automation automation);

    Result<void, Error> remove(const std::string& id);

    std::optional<Automation> get(const std::string& id) const;
    std::vector<Automation> list() const;

    // All automations, ordered by id; never null
    AutomationSnapshot snapshot() const;

    std::uint64_t generation() const { return generation_.load(); }
    size_t size() const;

private:
    void rebuild_snapshot_locked();
    void notify(const std::string& id, events::AutomationChange change, std::uint64_t generation);

    events::EventBus* bus_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, Automation> automations_;
    AutomationSnapshot snapshot_;
    std::atomic<std::uint64_t> generation_{0};
};

} // namespace orca::automations
