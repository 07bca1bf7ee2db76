#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace orca {

/*
  Time utilities. Event timestamps are UTC with microsecond precision.
*/

using Clock     = std::chrono::system_clock;
using Duration  = std::chrono::microseconds;
using TimePoint = std::chrono::time_point<Clock, Duration>;

TimePoint now();

// 2024-05-01T12:30:00.000000Z
std::string format_timestamp(TimePoint tp);

// Accepts "YYYY-MM-DDTHH:MM:SS[.ffffff](Z|+HH:MM|-HH:MM)"; a space may replace 'T'.
std::optional<TimePoint> parse_timestamp(const std::string& text);

double to_seconds(Duration d);
Duration from_seconds(double seconds);

} // namespace orca
