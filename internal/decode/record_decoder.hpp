#pragma once

#include <cstddef>
#include <string_view>

#include "internal/decode/decode_result.hpp"

namespace sparkscope::decode {

/*
  Decodes one event log line into a typed event.

  Stateless and never throws: every failure is reported through the result.
*/
class RecordDecoder {
 public:
  // max_line_bytes == 0 disables the length check.
  explicit RecordDecoder(std::size_t max_line_bytes = 0);

  DecodeResult Decode(std::string_view line) const;

 private:
  std::size_t max_line_bytes_;
};

} // namespace sparkscope::decode
