#pragma once

/**
 * @file counting.hpp
 * @brief Aggregate counts over stored events
 *
 * Countables:
 * - day:      one bucket per calendar day (UTC) across [since, until]
 * - time:     one bucket per `time_interval` x `time_unit` across [since, until]
 * - event:    one bucket per event name
 * - resource: one bucket per primary resource id
 *
 * Time buckets start at `since` truncated to the unit and are reported
 * even when empty. Requests that would produce more than
 * kMaxCountBuckets buckets, or use an interval below kMinTimeInterval,
 * fail with ErrorCode::InvalidParameters.
 */

#include "orca/core/error.hpp"
#include "orca/core/result.hpp"
#include "orca/core/time.hpp"
#include "orca/events/event.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace orca::storage {

constexpr std::size_t kMaxCountBuckets = 1000;
constexpr double kMinTimeInterval = 0.01;

enum class Countable {
    Day,
    Time,
    Event,
    Resource
};

enum class TimeUnit {
    Week,
    Day,
    Hour,
    Minute,
    Second
};

const char* to_string(Countable countable);
const char* to_string(TimeUnit unit);
std::optional<Countable> countable_from_string(const std::string& text);
std::optional<TimeUnit> time_unit_from_string(const std::string& text);

Duration unit_length(TimeUnit unit);

// Truncates to the start of the enclosing unit (weeks start on Monday)
TimePoint truncate(TimePoint tp, TimeUnit unit);

struct EventCount {
    std::string value;
    std::string label;
    std::uint64_t count = 0;
    TimePoint start_time{};
    TimePoint end_time{};
};

nlohmann::json to_json(const EventCount& count);
nlohmann::json to_json(const std::vector<EventCount>& counts);

struct TimeSpan {
    TimePoint start;
    TimePoint end;  // exclusive
};

Result<std::vector<TimeSpan>, Error> time_spans(TimePoint since, TimePoint until,
                                                TimeUnit unit, double interval);

/**
 * @brief Count already-filtered events
 *
 * `events` must all lie within [since, until]. For Countable::Day the
 * unit and interval arguments are ignored.
 */
Result<std::vector<EventCount>, Error> count_events(const std::vector<events::Event>& events,
                                                    Countable countable,
                                                    TimePoint since,
                                                    TimePoint until,
                                                    TimeUnit unit,
                                                    double interval);

} // namespace orca::storage
