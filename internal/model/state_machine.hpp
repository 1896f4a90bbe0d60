#pragma once

#include <cstdint>
#include <string_view>

namespace sparkscope::model {

enum class ApplicationStatus : std::uint8_t {
  kRunning  = 0,
  kFinished = 1,
};

enum class JobStatus : std::uint8_t {
  kRunning   = 0,
  kSucceeded = 1,
  kFailed    = 2,
};

enum class StageStatus : std::uint8_t {
  kPending  = 0,
  kActive   = 1,
  kComplete = 2,
  kFailed   = 3,
  kSkipped  = 4,
};

enum class TaskStatus : std::uint8_t {
  kRunning = 0,
  kSuccess = 1,
  kFailed  = 2,
  kKilled  = 3,
};

enum class ExecutorStatus : std::uint8_t {
  kActive  = 0,
  kRemoved = 1,
};

// SKIPPED is not terminal: a late completion event still lands.
constexpr bool IsTerminal(StageStatus status) {
  return status == StageStatus::kComplete || status == StageStatus::kFailed;
}

constexpr bool CanTransition(StageStatus from, StageStatus to) {
  if (from == to) {
    return true;
  }
  switch (to) {
    case StageStatus::kPending:
      return false;
    case StageStatus::kActive:
      return from == StageStatus::kPending;
    case StageStatus::kSkipped:
      return !IsTerminal(from);
    case StageStatus::kComplete:
    case StageStatus::kFailed:
      return true;
  }
  return false;
}

constexpr std::string_view ToString(ApplicationStatus status) {
  switch (status) {
    case ApplicationStatus::kRunning:
      return "RUNNING";
    case ApplicationStatus::kFinished:
      return "FINISHED";
  }
  return "UNKNOWN";
}

constexpr std::string_view ToString(JobStatus status) {
  switch (status) {
    case JobStatus::kRunning:
      return "RUNNING";
    case JobStatus::kSucceeded:
      return "SUCCEEDED";
    case JobStatus::kFailed:
      return "FAILED";
  }
  return "UNKNOWN";
}

constexpr std::string_view ToString(StageStatus status) {
  switch (status) {
    case StageStatus::kPending:
      return "PENDING";
    case StageStatus::kActive:
      return "ACTIVE";
    case StageStatus::kComplete:
      return "COMPLETE";
    case StageStatus::kFailed:
      return "FAILED";
    case StageStatus::kSkipped:
      return "SKIPPED";
  }
  return "UNKNOWN";
}

constexpr std::string_view ToString(TaskStatus status) {
  switch (status) {
    case TaskStatus::kRunning:
      return "RUNNING";
    case TaskStatus::kSuccess:
      return "SUCCESS";
    case TaskStatus::kFailed:
      return "FAILED";
    case TaskStatus::kKilled:
      return "KILLED";
  }
  return "UNKNOWN";
}

constexpr std::string_view ToString(ExecutorStatus status) {
  switch (status) {
    case ExecutorStatus::kActive:
      return "ACTIVE";
    case ExecutorStatus::kRemoved:
      return "REMOVED";
  }
  return "UNKNOWN";
}

} // namespace sparkscope::model
