#pragma once

#include <stdexcept>
#include <string>

namespace sparkscope::util {

/*
  Error types for API misuse and fatal I/O.

  Problems inside the event log content are never thrown: they are counted
  per line by the loader. The gRPC layer maps each type below to a status
  code (see grpc/grpc_error.hpp).
*/

// Unknown stage attempt, job or executor in a lookup.
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Explicit insert of an entity the store already holds.
class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Bad request or bad configuration.
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The event log or config file cannot be opened or read.
class SourceUnavailable : public std::runtime_error {
 public:
  explicit SourceUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace sparkscope::util
