#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace refinery::util {

/*
  Time utilities: single place to control clock source later.

  The issue store keeps timestamps as RFC 3339 strings; config carries
  Go-style duration strings ("500ms", "30s", "1h30m").
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration  = std::chrono::nanoseconds;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
int64_t  ToUnixNanos(TimePoint tp);

// "2026-02-10T12:00:00Z", always UTC, second precision.
std::string FormatRfc3339(TimePoint tp);

// Accepts "Z" or "+hh:mm"/"-hh:mm" offsets and optional fractional seconds.
std::optional<TimePoint> ParseRfc3339(std::string_view value);

// Throws util::InvalidArgument on malformed input.
Duration ParseDuration(std::string_view value);

std::string FormatDuration(Duration d);

} // namespace refinery::util
