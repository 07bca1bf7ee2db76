#include "orca/automations/registry.hpp"

#include "orca/core/ids.hpp"

#include <spdlog/spdlog.h>

namespace orca::automations {

AutomationRegistry::AutomationRegistry(events::EventBus* bus)
    : bus_(bus)
    , snapshot_(std::make_shared<const std::vector<Automation>>()) {}

Result<Automation, Error> AutomationRegistry::create(Automation automation) {
    auto valid = validate(automation);
    if (valid.is_error()) {
        return Err<Automation>(valid.error());
    }
    if (automation.id.empty()) {
        automation.id = new_uuid();
    }

    std::uint64_t generation = 0;
    {
        std::unique_lock lock(mutex_);
        if (automations_.count(automation.id) > 0) {
            return Err<Automation>(Error::already_exists("Automation already exists: " + automation.id));
        }
        automations_[automation.id] = automation;
        generation = ++generation_;
        rebuild_snapshot_locked();
    }

    spdlog::info("[Automations] created id={} name=\"{}\" posture={} actions={}",
                 automation.id, automation.name,
                 to_string(automation.trigger.posture), automation.actions.size());
    notify(automation.id, events::AutomationChange::Created, generation);
    return Ok(std::move(automation));
}

Result<Automation, Error> AutomationRegistry::update(const std::string& id, Automation automation) {
    automation.id = id;
    auto valid = validate(automation);
    if (valid.is_error()) {
        return Err<Automation>(valid.error());
    }

    std::uint64_t generation = 0;
    {
        std::unique_lock lock(mutex_);
        auto it = automations_.find(id);
        if (it == automations_.end()) {
            return Err<Automation>(Error::not_found("Automation not found: " + id));
        }
        it->second = automation;
        generation = ++generation_;
        rebuild_snapshot_locked();
    }

    spdlog::info("[Automations] updated id={} name=\"{}\"", id, automation.name);
    notify(id, events::AutomationChange::Updated, generation);
    return Ok(std::move(automation));
}

Result<void, Error> AutomationRegistry::remove(const std::string& id) {
    std::uint64_t generation = 0;
    {
        std::unique_lock lock(mutex_);
        if (automations_.erase(id) == 0) {
            return Err<void>(Error::not_found("Automation not found: " + id));
        }
        generation = ++generation_;
        rebuild_snapshot_locked();
    }

    spdlog::info("[Automations] deleted id={}", id);
    notify(id, events::AutomationChange::Deleted, generation);
    return Ok();
}

std::optional<Automation> AutomationRegistry::get(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = automations_.find(id);
    if (it == automations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Automation> AutomationRegistry::list() const {
    return *snapshot();
}

AutomationSnapshot AutomationRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    return snapshot_;
}

size_t AutomationRegistry::size() const {
    std::shared_lock lock(mutex_);
    return automations_.size();
}

void AutomationRegistry::rebuild_snapshot_locked() {
    auto next = std::make_shared<std::vector<Automation>>();
    next->reserve(automations_.size());
    for (const auto& [id, automation] : automations_) {
        next->push_back(automation);
    }
    snapshot_ = std::move(next);
}

void AutomationRegistry::notify(const std::string& id, events::AutomationChange change, std::uint64_t generation) {
    if (bus_) {
        bus_->emit(events::AutomationChanged{id, change, generation});
    }
}

} // namespace orca::automations
