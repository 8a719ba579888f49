#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sigtrader {

constexpr std::int64_t kMillisPerMinute = 60 * 1000;
constexpr std::int64_t kMinutesPerDay = 24 * 60;

// Minute of the day [0, 1440) of `epoch_ms`, shifted by `utc_offset_minutes`.
inline int minuteOfDay(std::int64_t epoch_ms, int utc_offset_minutes = 0) {
  std::int64_t minutes = epoch_ms / kMillisPerMinute + utc_offset_minutes;
  minutes %= kMinutesPerDay;
  if (minutes < 0) {
    minutes += kMinutesPerDay;
  }
  return static_cast<int>(minutes);
}

// Parses "HH:MM" (00:00 - 23:59). Returns std::nullopt on malformed input.
std::optional<int> parseClockMinutes(const std::string& hhmm);

// True when `minute` falls in [start, end). A window with start > end wraps
// past midnight; start == end means "always open".
inline bool withinDailyWindow(int minute, int start, int end) {
  if (start == end) {
    return true;
  }
  if (start < end) {
    return minute >= start && minute < end;
  }
  return minute >= start || minute < end;
}

}  // namespace sigtrader
