#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sparkscope::util {

/*
  Time utilities.

  Event logs carry wall-clock timestamps as unix epoch milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Millis    = std::chrono::milliseconds;

// Largest epoch millisecond count a TimePoint can hold.
inline constexpr std::int64_t kMaxUnixMillis = std::chrono::duration_cast<Millis>(Clock::duration::max()).count();

// ms must not exceed kMaxUnixMillis.
TimePoint FromUnixMillis(std::int64_t ms);
std::int64_t ToUnixMillis(TimePoint tp);

// Milliseconds between two optional instants; nullopt unless both are known
// and end is not before start.
std::optional<std::uint64_t> ElapsedMillis(const std::optional<TimePoint>& start, const std::optional<TimePoint>& end);

// "YYYY-MM-DD HH:MM:SS" in UTC, "N/A" when absent.
std::string FormatTimestamp(const std::optional<TimePoint>& tp);

} // namespace sparkscope::util
