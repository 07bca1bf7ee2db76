#include "orca/storage/counting.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <unordered_map>

namespace orca::storage {
namespace {

using std::chrono::duration_cast;
using std::chrono::hours;

constexpr std::int64_t kMicrosPerSecond = 1000000;
constexpr std::int64_t kMicrosPerDay = 86400 * kMicrosPerSecond;

std::int64_t floor_div(std::int64_t value, std::int64_t divisor) {
    std::int64_t q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --q;
    }
    return q;
}

struct Group {
    std::string label;
    std::uint64_t count = 0;
    TimePoint first{};
    TimePoint last{};
};

std::vector<EventCount> count_groups(const std::unordered_map<std::string, Group>& groups) {
    std::vector<EventCount> counts;
    counts.reserve(groups.size());
    for (const auto& [value, group] : groups) {
        counts.push_back(EventCount{value, group.label, group.count, group.first, group.last});
    }
    std::sort(counts.begin(), counts.end(), [](const EventCount& a, const EventCount& b) {
        return a.label != b.label ? a.label < b.label : a.value < b.value;
    });
    return counts;
}

} // namespace

const char* to_string(Countable countable) {
    switch (countable) {
        case Countable::Day: return "day";
        case Countable::Time: return "time";
        case Countable::Event: return "event";
        case Countable::Resource: return "resource";
    }
    return "unknown";
}

const char* to_string(TimeUnit unit) {
    switch (unit) {
        case TimeUnit::Week: return "week";
        case TimeUnit::Day: return "day";
        case TimeUnit::Hour: return "hour";
        case TimeUnit::Minute: return "minute";
        case TimeUnit::Second: return "second";
    }
    return "unknown";
}

std::optional<Countable> countable_from_string(const std::string& text) {
    if (text == "day") return Countable::Day;
    if (text == "time") return Countable::Time;
    if (text == "event") return Countable::Event;
    if (text == "resource") return Countable::Resource;
    return std::nullopt;
}

std::optional<TimeUnit> time_unit_from_string(const std::string& text) {
    if (text == "week") return TimeUnit::Week;
    if (text == "day") return TimeUnit::Day;
    if (text == "hour") return TimeUnit::Hour;
    if (text == "minute") return TimeUnit::Minute;
    if (text == "second") return TimeUnit::Second;
    return std::nullopt;
}

Duration unit_length(TimeUnit unit) {
    switch (unit) {
        case TimeUnit::Week: return duration_cast<Duration>(hours(24 * 7));
        case TimeUnit::Day: return duration_cast<Duration>(hours(24));
        case TimeUnit::Hour: return duration_cast<Duration>(hours(1));
        case TimeUnit::Minute: return duration_cast<Duration>(std::chrono::minutes(1));
        case TimeUnit::Second: return duration_cast<Duration>(std::chrono::seconds(1));
    }
    return duration_cast<Duration>(hours(24));
}

TimePoint truncate(TimePoint tp, TimeUnit unit) {
    const std::int64_t micros = tp.time_since_epoch().count();
    if (unit == TimeUnit::Week) {
        // 1970-01-01 was a Thursday; Monday 1969-12-29 is three days earlier
        const std::int64_t offset = 3 * kMicrosPerDay;
        const std::int64_t week = 7 * kMicrosPerDay;
        return TimePoint(Duration(floor_div(micros + offset, week) * week - offset));
    }
    const std::int64_t step = unit_length(unit).count();
    return TimePoint(Duration(floor_div(micros, step) * step));
}

nlohmann::json to_json(const EventCount& count) {
    return {
        {"value", count.value},
        {"label", count.label},
        {"count", count.count},
        {"start_time", format_timestamp(count.start_time)},
        {"end_time", format_timestamp(count.end_time)}
    };
}

nlohmann::json to_json(const std::vector<EventCount>& counts) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& c : counts) {
        array.push_back(to_json(c));
    }
    return array;
}

Result<std::vector<TimeSpan>, Error> time_spans(TimePoint since, TimePoint until,
                                                TimeUnit unit, double interval) {
    if (!(interval >= kMinTimeInterval)) {
        return Err<std::vector<TimeSpan>>(Error::invalid_parameters(
            std::string("time_interval must be at least 0.01")));
    }
    if (until < since) {
        return Err<std::vector<TimeSpan>>(Error::invalid_parameters(
            std::string("occurred.until must not be before occurred.since")));
    }

    const auto step = Duration(static_cast<std::int64_t>(
        std::llround(static_cast<double>(unit_length(unit).count()) * interval)));
    if (step <= Duration::zero()) {
        return Err<std::vector<TimeSpan>>(Error::invalid_parameters(std::string("time_interval is too small")));
    }

    const TimePoint start = truncate(since, unit);
    const std::int64_t range = (until - start).count();
    const std::int64_t buckets = std::max<std::int64_t>(1, floor_div(range, step.count()) + 1);
    if (static_cast<std::uint64_t>(buckets) > kMaxCountBuckets) {
        return Err<std::vector<TimeSpan>>(Error::invalid_parameters(
            "The given interval would create " + std::to_string(buckets) +
            " buckets, which is too many. Please increase the interval or reduce the time range to produce " +
            std::to_string(kMaxCountBuckets) + " buckets or fewer."));
    }

    std::vector<TimeSpan> spans;
    spans.reserve(static_cast<std::size_t>(buckets));
    for (std::int64_t i = 0; i < buckets; ++i) {
        const TimePoint bucket_start = start + step * i;
        spans.push_back(TimeSpan{bucket_start, bucket_start + step});
    }
    return Ok(std::move(spans));
}

Result<std::vector<EventCount>, Error> count_events(const std::vector<events::Event>& events,
                                                    Countable countable,
                                                    TimePoint since,
                                                    TimePoint until,
                                                    TimeUnit unit,
                                                    double interval) {
    if (countable == Countable::Day || countable == Countable::Time) {
        if (countable == Countable::Day) {
            unit = TimeUnit::Day;
            interval = 1.0;
        }
        auto spans = time_spans(since, until, unit, interval);
        if (spans.is_error()) {
            return Err<std::vector<EventCount>>(spans.error());
        }

        std::vector<EventCount> counts;
        counts.reserve(spans.value().size());
        for (const auto& span : spans.value()) {
            const auto stamp = format_timestamp(span.start);
            counts.push_back(EventCount{stamp, stamp, 0, span.start, span.end});
        }

        const TimePoint first = spans.value().front().start;
        const auto step = spans.value().front().end - first;
        for (const auto& event : events) {
            if (event.occurred < first) {
                continue;
            }
            const auto index = static_cast<std::size_t>((event.occurred - first) / step);
            if (index < counts.size()) {
                ++counts[index].count;
            }
        }
        return Ok(std::move(counts));
    }

    if (!(interval >= kMinTimeInterval)) {
        return Err<std::vector<EventCount>>(Error::invalid_parameters(
            std::string("time_interval must be at least 0.01")));
    }

    std::unordered_map<std::string, Group> groups;
    for (const auto& event : events) {
        std::string value;
        std::string label;
        if (countable == Countable::Event) {
            value = event.event;
            label = event.event;
        } else {
            value = event.resource.id();
            label = event.resource.get(events::kResourceName).value_or(value);
        }

        auto [it, inserted] = groups.try_emplace(value);
        Group& group = it->second;
        if (inserted) {
            group.label = label;
            group.first = event.occurred;
            group.last = event.occurred;
        }
        ++group.count;
        group.first = std::min(group.first, event.occurred);
        group.last = std::max(group.last, event.occurred);
    }
    return Ok(count_groups(groups));
}

} // namespace orca::storage
