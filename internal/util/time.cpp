#include "time.hpp"

#include <ctime>

namespace sparkscope::util {

TimePoint FromUnixMillis(std::int64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(Millis(ms));
}

std::int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<Millis>(tp.time_since_epoch()).count();
}

std::optional<std::uint64_t> ElapsedMillis(const std::optional<TimePoint>& start, const std::optional<TimePoint>& end) {
  if (!start || !end || *end < *start) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(std::chrono::duration_cast<Millis>(*end - *start).count());
}

std::string FormatTimestamp(const std::optional<TimePoint>& tp) {
  if (!tp) {
    return "N/A";
  }

  const std::time_t secs = Clock::to_time_t(*tp);
  std::tm           utc{};
  gmtime_r(&secs, &utc);

  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &utc) == 0) {
    return "N/A";
  }
  return buf;
}

} // namespace sparkscope::util
