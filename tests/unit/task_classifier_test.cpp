#include "internal/correlate/task_classifier.hpp"

#include <cassert>
#include <iostream>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace {

using sparkscope::correlate::TaskClassifier;
using sparkscope::decode::TaskEndReason;
using sparkscope::model::TaskStatus;
namespace cfg = sparkscope::runtime::config;

TaskEndReason Reason(std::string kind, std::string text = {}) {
  TaskEndReason reason;
  reason.kind = std::move(kind);
  reason.text = text.empty() ? reason.kind : std::move(text);
  return reason;
}

void TestDefaultCategories() {
  TaskClassifier classifier;

  auto ok = classifier.Classify(Reason("Success"), false);
  assert(ok.status == TaskStatus::kSuccess);

  auto killed = classifier.Classify(Reason("TaskKilled", "TaskKilled: another attempt succeeded"), false);
  assert(killed.status == TaskStatus::kKilled && killed.category == "Killed");

  auto oom = classifier.Classify(Reason("ExceptionFailure", "ExceptionFailure: java.lang.OutOfMemoryError: Java heap space"), false);
  assert(oom.status == TaskStatus::kFailed && oom.category == "OutOfMemory");

  auto yarn_oom = classifier.Classify(
      Reason("ExecutorLostFailure", "ExecutorLostFailure: Container killed by YARN for exceeding memory limits"), false);
  assert(yarn_oom.category == "OutOfMemory");

  assert(classifier.Classify(Reason("FetchFailed"), false).category == "FetchFailed");
  assert(classifier.Classify(Reason("ExecutorLostFailure"), false).category == "ExecutorLost");
  assert(classifier.Classify(Reason("TaskResultLost"), false).category == "ResultLost");
  assert(classifier.Classify(Reason("TaskCommitDenied"), false).category == "CommitDenied");
  assert(classifier.Classify(Reason("ExceptionFailure", "ExceptionFailure: java.io.IOException"), false).category == "Exception");

  auto other = classifier.Classify(Reason("UnknownReason"), false);
  assert(other.status == TaskStatus::kFailed && other.category == "Other");
}

void TestKilledFlagOverridesFailuresButNotSuccess() {
  TaskClassifier classifier;

  auto failed = classifier.Classify(Reason("ExceptionFailure"), true);
  assert(failed.status == TaskStatus::kKilled && failed.category == "Killed");

  auto unknown = classifier.Classify(Reason("UnknownReason"), true);
  assert(unknown.status == TaskStatus::kKilled);

  auto success = classifier.Classify(Reason("Success"), true);
  assert(success.status == TaskStatus::kSuccess);
}

void TestConfiguredRulesRunBeforeDefaults() {
  cfg::ClassificationConfig config;
  auto*                     rule = config.add_rules();
  rule->set_field(cfg::MATCH_FIELD_REASON_TEXT);
  rule->set_contains("No space left on device");
  rule->set_outcome(cfg::TASK_OUTCOME_FAILED);
  rule->set_category("DiskFull");

  auto classifier = TaskClassifier::FromConfig(config);
  assert(classifier.rules().size() == TaskClassifier::DefaultRules().size() + 1);

  auto disk = classifier.Classify(Reason("ExceptionFailure", "ExceptionFailure: java.io.IOException: No space left on device"), false);
  assert(disk.category == "DiskFull");

  // Defaults still apply after the configured rules.
  assert(classifier.Classify(Reason("FetchFailed"), false).category == "FetchFailed");
}

void TestReplaceDefaults() {
  cfg::ClassificationConfig config;
  config.set_replace_defaults(true);
  auto* rule = config.add_rules();
  rule->set_field(cfg::MATCH_FIELD_REASON_KIND);
  rule->set_contains("Success");
  rule->set_outcome(cfg::TASK_OUTCOME_SUCCESS);

  auto classifier = TaskClassifier::FromConfig(config);
  assert(classifier.rules().size() == 1);
  assert(classifier.Classify(Reason("FetchFailed"), false).category == "Other");
}

void TestInvalidRulesAreRejected() {
  cfg::ClassificationConfig empty_needle;
  empty_needle.add_rules()->set_outcome(cfg::TASK_OUTCOME_FAILED);

  bool threw = false;
  try {
    (void)TaskClassifier::FromConfig(empty_needle);
  } catch (const sparkscope::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  cfg::ClassificationConfig no_outcome;
  no_outcome.add_rules()->set_contains("x");

  threw = false;
  try {
    (void)TaskClassifier::FromConfig(no_outcome);
  } catch (const sparkscope::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDefaultCategories();
  TestKilledFlagOverridesFailuresButNotSuccess();
  TestConfiguredRulesRunBeforeDefaults();
  TestReplaceDefaults();
  TestInvalidRulesAreRejected();

  std::cout << "sparkscope_unit_task_classifier: pass\n";
  return 0;
}
