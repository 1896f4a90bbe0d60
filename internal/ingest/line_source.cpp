#include "line_source.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include "internal/util/errors.hpp"

namespace sparkscope::ingest {

LineSource::LineSource(std::unique_ptr<std::istream> in, std::string name) : in_(std::move(in)), name_(std::move(name)) {
}

LineSource LineSource::Open(const std::string& path) {
  auto file = std::make_unique<std::ifstream>(path, std::ios::in | std::ios::binary);
  if (!file->is_open()) {
    throw util::SourceUnavailable("cannot open event log " + path + ": " + std::strerror(errno));
  }
  return LineSource(std::move(file), path);
}

LineSource LineSource::FromString(std::string text, std::string name) {
  return LineSource(std::make_unique<std::istringstream>(std::move(text)), std::move(name));
}

bool LineSource::Next(std::string& line) {
  if (!std::getline(*in_, line)) {
    if (in_->bad()) {
      throw util::SourceUnavailable("read failed on " + name_ + " after line " + std::to_string(line_number_));
    }
    return false;
  }

  ++line_number_;
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return true;
}

} // namespace sparkscope::ingest
