#pragma once

#include <string>
#include <vector>

#include "internal/decode/event.hpp"
#include "internal/model/state_machine.hpp"

namespace sparkscope::runtime::config {
class ClassificationConfig;
}

namespace sparkscope::correlate {

/*
  Maps a task-end reason to a terminal task status and a display category.

  Rules are evaluated in order and the first match wins. A rule matches when
  its needle occurs in the selected field (the reason kind or the full reason
  text). Unmatched reasons are FAILED/"Other".
*/
class TaskClassifier {
 public:
  enum class Field {
    kReasonKind,
    kReasonText,
  };

  struct Rule {
    Field             field = Field::kReasonKind;
    std::string       contains;
    model::TaskStatus outcome = model::TaskStatus::kFailed;
    std::string       category;
  };

  struct Classification {
    model::TaskStatus status = model::TaskStatus::kFailed;
    std::string       category;
  };

  TaskClassifier();
  explicit TaskClassifier(std::vector<Rule> rules);

  static TaskClassifier FromConfig(const sparkscope::runtime::config::ClassificationConfig& config);
  static std::vector<Rule> DefaultRules();

  Classification Classify(const decode::TaskEndReason& reason, bool killed_flag) const;

  const std::vector<Rule>& rules() const {
    return rules_;
  }

 private:
  std::vector<Rule> rules_;
};

} // namespace sparkscope::correlate
