#include "format.hpp"

#include <array>
#include <cstdio>

namespace sparkscope::util {

namespace {

std::string OneDecimal(double value, const char* unit) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%.1f %s", value, unit);
  return buf;
}

} // namespace

std::string FormatDuration(std::uint64_t ms) {
  if (ms < 1000) {
    return std::to_string(ms) + " ms";
  }
  const double secs = static_cast<double>(ms) / 1000.0;
  if (secs < 60.0) {
    return OneDecimal(secs, "s");
  }
  const double mins = secs / 60.0;
  if (mins < 60.0) {
    return OneDecimal(mins, "min");
  }
  return OneDecimal(mins / 60.0, "h");
}

std::string FormatDuration(const std::optional<std::uint64_t>& ms, const std::string& absent) {
  return ms ? FormatDuration(*ms) : absent;
}

std::string FormatBytes(std::uint64_t bytes) {
  static constexpr std::array<const char*, 6> kUnits = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};

  if (bytes < 1024) {
    return std::to_string(bytes) + " B";
  }

  double      value = static_cast<double>(bytes);
  std::size_t unit  = 0;
  while (value >= 1024.0 && unit + 1 < kUnits.size()) {
    value /= 1024.0;
    ++unit;
  }
  return OneDecimal(value, kUnits[unit]);
}

} // namespace sparkscope::util
