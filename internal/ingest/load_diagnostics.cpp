#include "load_diagnostics.hpp"

namespace sparkscope::ingest {

LoadDiagnostics::LoadDiagnostics(std::size_t sample_limit) : sample_limit_(sample_limit) {
}

void LoadDiagnostics::RecordApplied() {
  ++lines_applied_;
}

void LoadDiagnostics::RecordBlank() {
  ++lines_blank_;
}

void LoadDiagnostics::RecordMalformed(std::uint64_t line_number, std::string_view message) {
  ++lines_malformed_;
  Sample(line_number, message);
}

void LoadDiagnostics::RecordUnrecognized(std::uint64_t line_number, std::string_view message) {
  ++lines_unrecognized_;
  Sample(line_number, message);
}

void LoadDiagnostics::RecordAnomaly(std::uint64_t line_number, std::string_view message) {
  ++anomalies_;
  Sample(line_number, message);
}

void LoadDiagnostics::Sample(std::uint64_t line_number, std::string_view message) {
  if (samples_.size() >= sample_limit_) return;
  samples_.push_back("line " + std::to_string(line_number) + ": " + std::string(message));
}

} // namespace sparkscope::ingest
