#pragma once

#include "orca/storage/event_store.hpp"

#include <functional>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

namespace orca::storage {

/**
 * @brief In-process event store
 *
 * Events are kept in arrival order behind a shared_mutex: queries take the
 * shared lock, appends the exclusive one. Page cursors live in their own
 * map with a separate mutex so that paging does not block ingestion.
 *
 * The clock is injectable so that cursor expiry can be tested.
 */
class MemoryEventStore : public EventStore {
public:
    using ClockFn = std::function<TimePoint()>;

    explicit MemoryEventStore(Duration page_token_ttl = std::chrono::hours(1),
                              ClockFn clock = &orca::now);

    MemoryEventStore(const MemoryEventStore&) = delete;
    MemoryEventStore& operator=(const MemoryEventStore&) = delete;

    Result<bool, Error> append(const events::Event& event) override;

    Result<EventPage, Error> query(const events::EventFilter& filter, std::size_t page_size) override;

    Result<EventPage, Error> query_next(const std::string& page_token) override;

    Result<std::vector<EventCount>, Error> count(const events::EventFilter& filter,
                                                 Countable countable,
                                                 TimeUnit unit,
                                                 double interval) override;

    std::size_t size() const override;

    std::size_t cursor_count() const;

private:
    struct Cursor {
        events::EventFilter filter;
        std::size_t page_size = 0;
        std::size_t offset = 0;
        TimePoint expires{};
    };

    std::vector<events::Event> matching(const events::EventFilter& filter) const;
    EventPage page_at(const events::EventFilter& filter, std::size_t page_size, std::size_t offset);
    void purge_expired_locked(TimePoint at);

    Duration page_token_ttl_;
    ClockFn clock_;

    mutable std::shared_mutex mutex_;
    std::vector<events::Event> events_;
    std::unordered_set<std::string> ids_;

    mutable std::mutex cursor_mutex_;
    std::unordered_map<std::string, Cursor> cursors_;
};

} // namespace orca::storage
