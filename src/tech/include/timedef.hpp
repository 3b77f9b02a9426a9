#pragma once

#include <chrono>
#include <cstdint>

namespace fxt {

/// Alias some types to make it easier to use
/// The main clock is system_clock as it is the only one guaranteed to provide conversions to Unix epoch time.
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

static constexpr auto kUndefinedDuration = Duration::min();

using seconds = std::chrono::seconds;
using milliseconds = std::chrono::milliseconds;
using microseconds = std::chrono::microseconds;

template <class T>
constexpr T GetTimeDiff(TimePoint tp1, TimePoint tp2) {
  return std::chrono::duration_cast<T>(tp2 - tp1);
}

template <class T>
constexpr T GetTimeFrom(TimePoint tp) {
  return GetTimeDiff<T>(tp, Clock::now());
}

constexpr int64_t TimestampToSecondsSinceEpoch(TimePoint tp) {
  return std::chrono::duration_cast<seconds>(tp.time_since_epoch()).count();
}

constexpr int64_t TimestampToMillisecondsSinceEpoch(TimePoint tp) {
  return std::chrono::duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

constexpr TimePoint TimePointFromSecondsSinceEpoch(int64_t secondsSinceEpoch) {
  return TimePoint(seconds(secondsSinceEpoch));
}

/// Returns the beginning of the UTC day containing given time point.
constexpr TimePoint StartOfUtcDay(TimePoint tp) { return TimePoint(std::chrono::floor<std::chrono::days>(tp)); }

}  // namespace fxt
