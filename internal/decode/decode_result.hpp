#pragma once

#include <optional>
#include <string>
#include <utility>

#include "internal/decode/event.hpp"

namespace sparkscope::decode {

/*
  Outcome of decoding one line.

  Only kOk carries an event the correlator applies. The other codes are
  tallied by the loader and never stop the load.
*/

enum class DecodeStatus {
  kOk = 0,
  kBlank,
  kUnrecognized,
  kMalformed,
};

struct DecodeResult {
  DecodeStatus         status = DecodeStatus::kOk;
  std::optional<Event> event;
  std::string          message;

  static DecodeResult Ok(Event event) {
    return {DecodeStatus::kOk, std::move(event), {}};
  }

  static DecodeResult Blank() {
    return {DecodeStatus::kBlank, std::nullopt, {}};
  }

  static DecodeResult Unrecognized(std::string kind) {
    std::string msg = "unrecognized event kind: " + kind;
    return {DecodeStatus::kUnrecognized, decode::Unrecognized{std::move(kind)}, std::move(msg)};
  }

  static DecodeResult Malformed(std::string msg) {
    return {DecodeStatus::kMalformed, std::nullopt, std::move(msg)};
  }

  explicit operator bool() const {
    return status == DecodeStatus::kOk;
  }
};

} // namespace sparkscope::decode
