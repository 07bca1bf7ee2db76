#include "orca/triggers/window_tracker.hpp"

#include <functional>

namespace orca::triggers {

std::string TriggerInstanceKey::to_string() const {
    std::string text = automation_id;
    for (const auto& [label, value] : labels) {
        text += '|';
        text += label;
        text += '=';
        text += value;
    }
    return text;
}

events::Labels TriggerInstanceKey::label_map() const {
    return events::Labels(labels.begin(), labels.end());
}

TriggerInstanceKey make_key(const automations::Automation& automation, const events::Event& event) {
    TriggerInstanceKey key;
    key.automation_id = automation.id;
    for (const auto& label : automation.trigger.for_each) {
        key.labels.emplace_back(label, event.resource.get(label).value_or(""));
    }
    return key;
}

WindowTracker::WindowTracker(std::size_t shard_count) {
    if (shard_count == 0) {
        shard_count = 1;
    }
    shards_.reserve(shard_count);
    for (std::size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

WindowTracker::Shard& WindowTracker::shard_for(const TriggerInstanceKey& key) const {
    const auto hash = std::hash<std::string>{}(key.to_string());
    return *shards_[hash % shards_.size()];
}

std::vector<ExpiredWindow> WindowTracker::sweep(TimePoint now) {
    std::vector<ExpiredWindow> expired;

    for (auto& shard : shards_) {
        std::lock_guard lock(shard->mutex);
        for (auto it = shard->windows.begin(); it != shard->windows.end();) {
            WindowState& state = it->second;

            if (state.posture == automations::Posture::Proactive &&
                state.proactive.deadline && *state.proactive.deadline <= now) {
                expired.push_back(ExpiredWindow{it->first, state.proactive});
                it = shard->windows.erase(it);
                continue;
            }

            if (state.posture == automations::Posture::Reactive && !state.reactive.counted.empty()) {
                auto& counted = state.reactive.counted;
                while (!counted.empty() && counted.front().occurred < now - state.within) {
                    counted.pop_front();
                }
            }
            // A zero within still closes the armed window once now has moved past it
            if (state.posture == automations::Posture::Reactive && state.reactive.armed_at &&
                *state.reactive.armed_at + state.within < now) {
                state.reactive.armed_at.reset();
                state.reactive.counted.clear();
            }

            const bool idle = !state.high_water || *state.high_water + state.within < now;
            if (!state.open() && idle) {
                it = shard->windows.erase(it);
            } else {
                ++it;
            }
        }
    }
    return expired;
}

void WindowTracker::erase(const TriggerInstanceKey& key) {
    Shard& shard = shard_for(key);
    std::lock_guard lock(shard.mutex);
    shard.windows.erase(key);
}

std::size_t WindowTracker::drop_automation(const std::string& automation_id) {
    std::size_t dropped = 0;
    for (auto& shard : shards_) {
        std::lock_guard lock(shard->mutex);
        for (auto it = shard->windows.begin(); it != shard->windows.end();) {
            if (it->first.automation_id == automation_id) {
                it = shard->windows.erase(it);
                ++dropped;
            } else {
                ++it;
            }
        }
    }
    return dropped;
}

std::optional<WindowState> WindowTracker::peek(const TriggerInstanceKey& key) const {
    Shard& shard = shard_for(key);
    std::lock_guard lock(shard.mutex);
    auto it = shard.windows.find(key);
    if (it == shard.windows.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t WindowTracker::size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard lock(shard->mutex);
        total += shard->windows.size();
    }
    return total;
}

} // namespace orca::triggers
