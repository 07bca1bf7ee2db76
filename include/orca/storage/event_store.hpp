#pragma once

/**
 * @file event_store.hpp
 * @brief Contract with the event storage engine
 *
 * WHY THIS FILE EXISTS:
 * Events are the system of record: everything the trigger engine sees is
 * stored first, and the query API reads from here. The storage engine
 * itself is a collaborator; MemoryEventStore is the in-process reference.
 *
 * GUARANTEES:
 * - append is idempotent by event id (a redelivered event is a no-op)
 * - query returns at most `page_size` events plus the total match count
 *   and, when more remain, an opaque page token
 * - a page token is bound to the original filter and offset and expires
 *   after a TTL; unknown or expired tokens fail with InvalidToken
 */

#include "orca/core/error.hpp"
#include "orca/core/result.hpp"
#include "orca/events/event.hpp"
#include "orca/events/filter.hpp"
#include "orca/storage/counting.hpp"

#include <optional>
#include <string>
#include <vector>

namespace orca::storage {

struct EventPage {
    std::vector<events::Event> events;
    std::size_t total = 0;
    std::optional<std::string> next_page_token;
};

class EventStore {
public:
    virtual ~EventStore() = default;

    // Ok(true) when stored, Ok(false) when the id was already present
    virtual Result<bool, Error> append(const events::Event& event) = 0;

    virtual Result<EventPage, Error> query(const events::EventFilter& filter, std::size_t page_size) = 0;

    virtual Result<EventPage, Error> query_next(const std::string& page_token) = 0;

    virtual Result<std::vector<EventCount>, Error> count(const events::EventFilter& filter,
                                                         Countable countable,
                                                         TimeUnit unit,
                                                         double interval) = 0;

    virtual std::size_t size() const = 0;
};

} // namespace orca::storage
