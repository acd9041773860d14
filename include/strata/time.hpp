#pragma once
#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>

namespace strata::timeutil {

// Minutes east of UTC (e.g., +180 = +0300). Uses the local timezone at `t`.
auto local_utc_offset_minutes(std::time_t time) -> int;

// Format ±HHMM from minutes (e.g., +180 -> "+0300", -420 -> "-0700")
auto tz_offset_string(int minutes) -> std::string;

// "2024-04-29 17:45:12 +0300" in local time
auto format_time(std::int64_t unix_seconds) -> std::string;

// "90s", "15m", "12h", "30d", "2w" (bare numbers are seconds). Throws Error.
auto parse_duration_seconds(std::string_view text) -> std::int64_t;

} // namespace strata::timeutil
