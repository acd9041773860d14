#include "strata/time.hpp"

#include "strata/error.hpp"

#include <charconv>
#include <cstdio>

namespace strata::timeutil {

int local_utc_offset_minutes(std::time_t t) {
  std::tm lt{}, gt{};
  localtime_r(&t, &lt);
  gmtime_r(&t, &gt);
  // Convert both back to epoch and subtract: local - UTC
  lt.tm_isdst = 0;
  gt.tm_isdst = 0;
  const std::time_t local_epoch = timegm(&lt);
  const std::time_t utc_epoch = timegm(&gt);
  return static_cast<int>((local_epoch - utc_epoch) / 60);
}

std::string tz_offset_string(int minutes) {
  char buf[8];
  char sign = minutes >= 0 ? '+' : '-';
  int m = minutes >= 0 ? minutes : -minutes;
  std::snprintf(buf, sizeof(buf), "%c%02d%02d", sign, m / 60, m % 60);
  return std::string(buf);
}

std::string format_time(std::int64_t unix_seconds) {
  const auto t = static_cast<std::time_t>(unix_seconds);
  std::tm lt{};
  localtime_r(&t, &lt);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &lt);
  return std::string(buf) + " " + tz_offset_string(local_utc_offset_minutes(t));
}

std::int64_t parse_duration_seconds(std::string_view text) {
  if (text.empty()) {
    throw Error("empty duration");
  }
  std::int64_t scale = 1;
  switch (text.back()) {
  case 's':
    text.remove_suffix(1);
    break;
  case 'm':
    scale = 60;
    text.remove_suffix(1);
    break;
  case 'h':
    scale = 3600;
    text.remove_suffix(1);
    break;
  case 'd':
    scale = 86400;
    text.remove_suffix(1);
    break;
  case 'w':
    scale = 7 * 86400;
    text.remove_suffix(1);
    break;
  default:
    break;
  }
  std::int64_t n = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || n < 0) {
    throw Error("bad duration '" + std::string(text) + "'");
  }
  return n * scale;
}

} // namespace strata::timeutil
