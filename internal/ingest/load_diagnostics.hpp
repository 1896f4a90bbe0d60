#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sparkscope::ingest {

enum class LoadStatus {
  kLoading = 0,
  kComplete,
  kCancelled,
};

constexpr std::string_view ToString(LoadStatus status) {
  switch (status) {
    case LoadStatus::kLoading:
      return "LOADING";
    case LoadStatus::kComplete:
      return "COMPLETE";
    case LoadStatus::kCancelled:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

/*
  Tallies of one load.

  lines_read counts every line pulled from the source. Each read line lands
  in exactly one of applied, blank, malformed or unrecognized. Anomalies are
  counted per applied line that produced them and do not un-apply it.
*/
class LoadDiagnostics {
 public:
  explicit LoadDiagnostics(std::size_t sample_limit = 20);

  void RecordApplied();
  void RecordBlank();
  void RecordMalformed(std::uint64_t line_number, std::string_view message);
  void RecordUnrecognized(std::uint64_t line_number, std::string_view message);
  void RecordAnomaly(std::uint64_t line_number, std::string_view message);

  void set_status(LoadStatus status) {
    status_ = status;
  }

  LoadStatus status() const {
    return status_;
  }
  std::uint64_t lines_read() const {
    return lines_applied_ + lines_blank_ + lines_malformed_ + lines_unrecognized_;
  }
  std::uint64_t lines_applied() const {
    return lines_applied_;
  }
  std::uint64_t lines_blank() const {
    return lines_blank_;
  }
  std::uint64_t lines_malformed() const {
    return lines_malformed_;
  }
  std::uint64_t lines_unrecognized() const {
    return lines_unrecognized_;
  }
  std::uint64_t lines_skipped() const {
    return lines_blank_ + lines_malformed_ + lines_unrecognized_;
  }
  std::uint64_t anomalies() const {
    return anomalies_;
  }

  // First sample_limit messages, "line N: ..." each.
  const std::vector<std::string>& samples() const {
    return samples_;
  }

 private:
  void Sample(std::uint64_t line_number, std::string_view message);

  LoadStatus               status_ = LoadStatus::kLoading;
  std::uint64_t            lines_applied_      = 0;
  std::uint64_t            lines_blank_        = 0;
  std::uint64_t            lines_malformed_    = 0;
  std::uint64_t            lines_unrecognized_ = 0;
  std::uint64_t            anomalies_          = 0;
  std::size_t              sample_limit_;
  std::vector<std::string> samples_;
};

} // namespace sparkscope::ingest
