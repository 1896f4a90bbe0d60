#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sparkscope::util {

// "350 ms", "1.2 s", "2.5 min", "1.1 h"
std::string FormatDuration(std::uint64_t ms);
std::string FormatDuration(const std::optional<std::uint64_t>& ms, const std::string& absent = "-");

// "0 B", "512 B", "1.5 KiB", "3.0 GiB"
std::string FormatBytes(std::uint64_t bytes);

} // namespace sparkscope::util
