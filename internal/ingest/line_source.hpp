#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <string>

namespace sparkscope::ingest {

/*
  Sequence of raw event log lines.

  Open() fails with util::SourceUnavailable before any line is produced when
  the log cannot be opened. A read error part way through is reported the
  same way; running out of lines is not an error.
*/
class LineSource {
 public:
  static LineSource Open(const std::string& path);
  static LineSource FromString(std::string text, std::string name = "<memory>");

  LineSource(LineSource&&) noexcept            = default;
  LineSource& operator=(LineSource&&) noexcept = default;

  // Returns false once exhausted. A trailing '\r' is stripped.
  bool Next(std::string& line);

  const std::string& name() const {
    return name_;
  }
  std::uint64_t line_number() const {
    return line_number_;
  }

 private:
  LineSource(std::unique_ptr<std::istream> in, std::string name);

  std::unique_ptr<std::istream> in_;
  std::string                   name_;
  std::uint64_t                 line_number_ = 0;
};

} // namespace sparkscope::ingest
