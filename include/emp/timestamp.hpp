#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace emp {

// Wall-clock instant, UTC, microsecond resolution
using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

Timestamp now_timestamp();

// ISO-8601 in UTC, eg: 2024-05-01T09:30:00Z or 2024-05-01T09:30:00.250Z
// The fraction is printed only when it is non-zero.
std::string format_timestamp(Timestamp ts);

// Accepts YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM).
// Digits beyond microseconds are truncated.
std::optional<Timestamp> parse_timestamp(std::string_view text);

} // namespace emp
