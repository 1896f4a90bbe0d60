#include "task_classifier.hpp"

#include <utility>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace sparkscope::correlate {

using model::TaskStatus;

TaskClassifier::TaskClassifier() : rules_(DefaultRules()) {
}

TaskClassifier::TaskClassifier(std::vector<Rule> rules) : rules_(std::move(rules)) {
}

std::vector<TaskClassifier::Rule> TaskClassifier::DefaultRules() {
  // Memory exhaustion is checked before the kind rules so that an executor
  // lost to a container memory limit is reported as OutOfMemory.
  return {
      {Field::kReasonKind, "Success", TaskStatus::kSuccess, ""},
      {Field::kReasonKind, "TaskKilled", TaskStatus::kKilled, "Killed"},
      {Field::kReasonText, "OutOfMemoryError", TaskStatus::kFailed, "OutOfMemory"},
      {Field::kReasonText, "exceeding memory limits", TaskStatus::kFailed, "OutOfMemory"},
      {Field::kReasonKind, "FetchFailed", TaskStatus::kFailed, "FetchFailed"},
      {Field::kReasonKind, "ExecutorLostFailure", TaskStatus::kFailed, "ExecutorLost"},
      {Field::kReasonKind, "TaskResultLost", TaskStatus::kFailed, "ResultLost"},
      {Field::kReasonKind, "TaskCommitDenied", TaskStatus::kFailed, "CommitDenied"},
      {Field::kReasonKind, "ExceptionFailure", TaskStatus::kFailed, "Exception"},
  };
}

TaskClassifier TaskClassifier::FromConfig(const sparkscope::runtime::config::ClassificationConfig& config) {
  namespace cfg = sparkscope::runtime::config;

  std::vector<Rule> rules;
  rules.reserve(static_cast<std::size_t>(config.rules_size()));

  for (const auto& rule : config.rules()) {
    if (rule.contains().empty()) {
      throw util::InvalidArgument("classification rule needs a non-empty 'contains'");
    }

    Rule out;
    out.field    = rule.field() == cfg::MATCH_FIELD_REASON_TEXT ? Field::kReasonText : Field::kReasonKind;
    out.contains = rule.contains();
    out.category = rule.category();

    switch (rule.outcome()) {
      case cfg::TASK_OUTCOME_SUCCESS:
        out.outcome = TaskStatus::kSuccess;
        break;
      case cfg::TASK_OUTCOME_KILLED:
        out.outcome = TaskStatus::kKilled;
        break;
      case cfg::TASK_OUTCOME_FAILED:
        out.outcome = TaskStatus::kFailed;
        break;
      default:
        throw util::InvalidArgument("classification rule for '" + rule.contains() + "' has no outcome");
    }
    rules.push_back(std::move(out));
  }

  if (!config.replace_defaults()) {
    auto defaults = DefaultRules();
    rules.insert(rules.end(), defaults.begin(), defaults.end());
  }
  return TaskClassifier(std::move(rules));
}

TaskClassifier::Classification TaskClassifier::Classify(const decode::TaskEndReason& reason, bool killed_flag) const {
  for (const auto& rule : rules_) {
    const auto& haystack = rule.field == Field::kReasonKind ? reason.kind : reason.text;
    if (haystack.find(rule.contains) == std::string::npos) {
      continue;
    }
    if (killed_flag && rule.outcome == TaskStatus::kFailed) {
      return {TaskStatus::kKilled, "Killed"};
    }
    return {rule.outcome, rule.category};
  }

  if (killed_flag) {
    return {TaskStatus::kKilled, "Killed"};
  }
  return {TaskStatus::kFailed, "Other"};
}

} // namespace sparkscope::correlate
