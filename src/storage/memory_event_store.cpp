#include "orca/storage/memory_event_store.hpp"

#include "orca/core/ids.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace orca::storage {

MemoryEventStore::MemoryEventStore(Duration page_token_ttl, ClockFn clock)
    : page_token_ttl_(page_token_ttl)
    , clock_(std::move(clock)) {}

Result<bool, Error> MemoryEventStore::append(const events::Event& event) {
    auto valid = events::validate(event);
    if (valid.is_error()) {
        return Err<bool>(valid.error());
    }

    std::unique_lock lock(mutex_);
    if (!ids_.insert(event.id).second) {
        spdlog::debug("[EventStore] duplicate event id={} ignored", event.id);
        return Ok(false);
    }
    events_.push_back(event);
    return Ok(true);
}

std::vector<events::Event> MemoryEventStore::matching(const events::EventFilter& filter) const {
    std::vector<events::Event> result;
    {
        std::shared_lock lock(mutex_);
        for (const auto& event : events_) {
            if (filter.includes(event)) {
                result.push_back(event);
            }
        }
    }

    const bool ascending = filter.order == events::Order::Ascending;
    std::stable_sort(result.begin(), result.end(),
        [ascending](const events::Event& a, const events::Event& b) {
            if (a.occurred != b.occurred) {
                return ascending ? a.occurred < b.occurred : a.occurred > b.occurred;
            }
            return ascending ? a.id < b.id : a.id > b.id;
        });
    return result;
}

EventPage MemoryEventStore::page_at(const events::EventFilter& filter, std::size_t page_size, std::size_t offset) {
    auto all = matching(filter);

    EventPage page;
    page.total = all.size();
    if (offset < all.size()) {
        const auto end = std::min(all.size(), offset + page_size);
        page.events.assign(std::make_move_iterator(all.begin() + static_cast<std::ptrdiff_t>(offset)),
                           std::make_move_iterator(all.begin() + static_cast<std::ptrdiff_t>(end)));
    }

    const std::size_t next_offset = offset + page_size;
    if (page_size > 0 && next_offset < all.size()) {
        Cursor cursor{filter, page_size, next_offset, clock_() + page_token_ttl_};
        auto token = new_uuid();

        std::lock_guard lock(cursor_mutex_);
        purge_expired_locked(clock_());
        cursors_.emplace(token, std::move(cursor));
        page.next_page_token = std::move(token);
    }
    return page;
}

Result<EventPage, Error> MemoryEventStore::query(const events::EventFilter& filter, std::size_t page_size) {
    return Ok(page_at(filter, page_size, 0));
}

Result<EventPage, Error> MemoryEventStore::query_next(const std::string& page_token) {
    Cursor cursor;
    {
        std::lock_guard lock(cursor_mutex_);
        purge_expired_locked(clock_());
        auto it = cursors_.find(page_token);
        if (it == cursors_.end()) {
            return Err<EventPage>(Error::invalid_token(std::string("Unknown or expired page token")));
        }
        cursor = it->second;
    }
    return Ok(page_at(cursor.filter, cursor.page_size, cursor.offset));
}

Result<std::vector<EventCount>, Error> MemoryEventStore::count(const events::EventFilter& filter,
                                                               Countable countable,
                                                               TimeUnit unit,
                                                               double interval) {
    auto all = matching(filter);

    TimePoint since = filter.since.value_or(TimePoint{});
    TimePoint until = filter.until.value_or(clock_());
    if (!filter.since) {
        since = all.empty() ? until : all.front().occurred;
        for (const auto& event : all) {
            since = std::min(since, event.occurred);
        }
    }
    return count_events(all, countable, since, until, unit, interval);
}

std::size_t MemoryEventStore::size() const {
    std::shared_lock lock(mutex_);
    return events_.size();
}

std::size_t MemoryEventStore::cursor_count() const {
    std::lock_guard lock(cursor_mutex_);
    return cursors_.size();
}

void MemoryEventStore::purge_expired_locked(TimePoint at) {
    for (auto it = cursors_.begin(); it != cursors_.end();) {
        if (it->second.expires <= at) {
            it = cursors_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace orca::storage
