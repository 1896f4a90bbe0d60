#include "record_decoder.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/decode/json_fields.hpp"

namespace sparkscope::decode {

namespace {

using json::Object;

// Raised when a recognized record lacks an identifier it cannot do without,
// or carries one that does not fit its type.
class FieldError : public std::runtime_error {
 public:
  explicit FieldError(const std::string& msg) : std::runtime_error(msg) {
  }
};

[[noreturn]] void ThrowMissing(std::string_view key) {
  throw FieldError("missing required field: " + std::string(key));
}

std::uint64_t RequireUInt(const Object& obj, std::string_view key) {
  auto value = json::GetUInt(obj, key);
  if (!value) ThrowMissing(key);
  return *value;
}

std::string RequireString(const Object& obj, std::string_view key) {
  auto value = json::GetString(obj, key);
  if (!value) ThrowMissing(key);
  return *value;
}

const Object& RequireObject(const Object& obj, std::string_view key) {
  const auto* value = json::FindObject(obj, key);
  if (!value) ThrowMissing(key);
  return *value;
}

std::optional<std::uint32_t> GetUInt32(const Object& obj, std::string_view key) {
  auto value = json::GetUInt(obj, key);
  if (!value || *value > std::numeric_limits<std::uint32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(*value);
}

// Absent means attempt 0; a value that does not fit would alias another attempt.
std::uint32_t Attempt(const Object& obj, std::string_view key) {
  auto value = json::GetUInt(obj, key);
  if (!value) return 0;
  if (*value > std::numeric_limits<std::uint32_t>::max()) {
    throw FieldError("field out of range: " + std::string(key));
  }
  return static_cast<std::uint32_t>(*value);
}

bool IsBlank(std::string_view line) {
  return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

// ------------------------------------------------------------
// Nested records
// ------------------------------------------------------------

StageInfo ParseStageInfo(const Object& info) {
  StageInfo stage;
  stage.key.stage_id     = RequireUInt(info, "Stage ID");
  stage.key.attempt      = Attempt(info, "Stage Attempt ID");
  stage.name             = json::GetString(info, "Stage Name");
  stage.num_tasks        = json::GetUInt(info, "Number of Tasks");
  stage.parent_ids       = json::GetUIntList(info, "Parent IDs");
  stage.rdd_count        = static_cast<std::uint32_t>(json::ArraySize(info, "RDD Info"));
  stage.submission_time  = json::GetTimestamp(info, "Submission Time");
  stage.completion_time  = json::GetTimestamp(info, "Completion Time");
  stage.failure_reason   = json::GetString(info, "Failure Reason");
  return stage;
}

TaskInfo ParseTaskInfo(const Object& info) {
  TaskInfo task;
  task.key.task_id  = RequireUInt(info, "Task ID");
  task.key.attempt  = Attempt(info, "Attempt");
  task.index        = json::GetUIntAny(info, {"Index", "Partition ID"});
  task.executor_id  = RequireString(info, "Executor ID");
  task.host         = json::GetString(info, "Host");
  task.launch_time  = json::GetTimestamp(info, "Launch Time");
  task.finish_time  = json::GetTimestamp(info, "Finish Time");
  task.speculative  = json::GetBool(info, "Speculative").value_or(false);
  task.failed       = json::GetBool(info, "Failed").value_or(false);
  task.killed       = json::GetBool(info, "Killed").value_or(false);
  return task;
}

// Task-start carries the stage at top level; some writers only put it in Task Info.
model::StageKey TaskStage(const Object& root, const Object& info) {
  model::StageKey key;
  if (auto id = json::GetUInt(root, "Stage ID")) {
    key.stage_id = *id;
    key.attempt  = Attempt(root, "Stage Attempt ID");
    return key;
  }
  key.stage_id = RequireUInt(info, "Stage ID");
  key.attempt  = Attempt(info, "Stage Attempt ID");
  return key;
}

TaskEndReason ParseEndReason(const Object& root, const TaskInfo& info) {
  TaskEndReason reason;

  const auto* record = json::FindObject(root, "Task End Reason");
  if (!record) {
    if (info.killed) {
      reason.kind = "TaskKilled";
    } else if (info.failed) {
      reason.kind = "UnknownReason";
    } else {
      reason.kind = "Success";
    }
    reason.text = reason.kind;
    return reason;
  }

  reason.kind = json::GetString(*record, "Reason").value_or("UnknownReason");
  reason.text = reason.kind;

  static constexpr std::array<std::string_view, 6> kDetailFields = {"Class Name", "Description", "Kill Reason", "Loss Reason", "Message",
                                                                    "Causing Exception"};
  for (const auto field : kDetailFields) {
    if (auto detail = json::GetString(*record, field); detail && !detail->empty()) {
      reason.text += ": " + *detail;
    }
  }
  return reason;
}

model::TaskMetrics ParseMetrics(const Object& metrics) {
  model::TaskMetrics out;
  out.executor_run_time_ms          = json::GetUInt(metrics, "Executor Run Time");
  out.executor_cpu_time_ns          = json::GetUInt(metrics, "Executor CPU Time");
  out.deserialize_time_ms           = json::GetUInt(metrics, "Executor Deserialize Time");
  out.result_size_bytes             = json::GetUInt(metrics, "Result Size");
  out.result_serialization_time_ms  = json::GetUInt(metrics, "Result Serialization Time");
  out.gc_time_ms                    = json::GetUInt(metrics, "JVM GC Time");
  out.memory_bytes_spilled          = json::GetUInt(metrics, "Memory Bytes Spilled");
  out.disk_bytes_spilled            = json::GetUInt(metrics, "Disk Bytes Spilled");
  out.peak_execution_memory         = json::GetUInt(metrics, "Peak Execution Memory");

  if (const auto* read = json::FindObject(metrics, "Shuffle Read Metrics")) {
    out.shuffle_remote_bytes_read     = json::GetUInt(*read, "Remote Bytes Read");
    out.shuffle_local_bytes_read      = json::GetUInt(*read, "Local Bytes Read");
    out.shuffle_remote_blocks_fetched = json::GetUInt(*read, "Remote Blocks Fetched");
    out.shuffle_local_blocks_fetched  = json::GetUInt(*read, "Local Blocks Fetched");
    out.shuffle_records_read          = json::GetUIntAny(*read, {"Total Records Read", "Records Read"});
    out.shuffle_fetch_wait_time_ms    = json::GetUInt(*read, "Fetch Wait Time");
  }

  if (const auto* write = json::FindObject(metrics, "Shuffle Write Metrics")) {
    out.shuffle_bytes_written   = json::GetUIntAny(*write, {"Shuffle Bytes Written", "Bytes Written"});
    out.shuffle_write_time_ns   = json::GetUIntAny(*write, {"Shuffle Write Time", "Write Time"});
    out.shuffle_records_written = json::GetUIntAny(*write, {"Shuffle Records Written", "Records Written"});
  }

  if (const auto* input = json::FindObject(metrics, "Input Metrics")) {
    out.input_bytes_read   = json::GetUInt(*input, "Bytes Read");
    out.input_records_read = json::GetUInt(*input, "Records Read");
  }

  if (const auto* output = json::FindObject(metrics, "Output Metrics")) {
    out.output_bytes_written   = json::GetUInt(*output, "Bytes Written");
    out.output_records_written = json::GetUInt(*output, "Records Written");
  }
  return out;
}

// Older writers emit a category as [[key, value], ...] instead of an object.
std::optional<model::PropertyList> ParseProperties(const Object& root, std::string_view key) {
  const auto* value = json::Find(root, key);
  if (!value) {
    return std::nullopt;
  }

  model::PropertyList props;
  if (value->kind_case() == json::Value::kStructValue) {
    for (const auto& [k, v] : value->struct_value().fields()) {
      if (v.kind_case() == json::Value::kStringValue) {
        props.emplace_back(k, v.string_value());
      }
    }
  } else if (value->kind_case() == json::Value::kListValue) {
    for (const auto& pair : value->list_value().values()) {
      if (pair.kind_case() != json::Value::kListValue || pair.list_value().values_size() != 2) continue;
      const auto& k = pair.list_value().values(0);
      const auto& v = pair.list_value().values(1);
      if (k.kind_case() == json::Value::kStringValue && v.kind_case() == json::Value::kStringValue) {
        props.emplace_back(k.string_value(), v.string_value());
      }
    }
  } else {
    return std::nullopt;
  }

  // Map iteration order is unspecified; present categories sorted by key.
  std::sort(props.begin(), props.end());
  return props;
}

// ------------------------------------------------------------
// Top-level records
// ------------------------------------------------------------

Event ParseApplicationStart(const Object& root) {
  ApplicationStart ev;
  ev.app_id     = json::GetString(root, "App ID").value_or("");
  ev.name       = json::GetString(root, "App Name").value_or("");
  ev.attempt_id = json::GetString(root, "App Attempt ID");
  ev.user       = json::GetString(root, "User");
  ev.timestamp  = json::GetTimestamp(root, "Timestamp");
  return ev;
}

Event ParseApplicationEnd(const Object& root) {
  return ApplicationEnd{json::GetTimestamp(root, "Timestamp")};
}

Event ParseLogStart(const Object& root) {
  return LogStart{json::GetString(root, "Spark Version")};
}

Event ParseJobStart(const Object& root) {
  JobStart ev;
  ev.job_id          = RequireUInt(root, "Job ID");
  ev.submission_time = json::GetTimestamp(root, "Submission Time");
  ev.stage_ids       = json::GetUIntList(root, "Stage IDs");

  if (const auto* infos = json::Find(root, "Stage Infos"); infos && infos->kind_case() == json::Value::kListValue) {
    for (const auto& item : infos->list_value().values()) {
      if (item.kind_case() != json::Value::kStructValue) continue;
      if (!json::GetUInt(item.struct_value(), "Stage ID")) continue;
      ev.stage_infos.push_back(ParseStageInfo(item.struct_value()));
    }
  }

  if (const auto* props = json::FindObject(root, "Properties")) {
    ev.description = json::GetString(*props, "spark.job.description");
    ev.job_group   = json::GetString(*props, "spark.jobGroup.id");
  }
  return ev;
}

Event ParseJobEnd(const Object& root) {
  JobEnd ev;
  ev.job_id          = RequireUInt(root, "Job ID");
  ev.completion_time = json::GetTimestamp(root, "Completion Time");

  const auto* result = json::FindObject(root, "Job Result");
  if (result) {
    ev.result = json::GetString(*result, "Result").value_or("");
    if (const auto* exception = json::FindObject(*result, "Exception")) {
      ev.message = json::GetString(*exception, "Message");
    }
  }
  return ev;
}

Event ParseStageSubmitted(const Object& root) {
  StageSubmitted ev;
  ev.stage  = ParseStageInfo(RequireObject(root, "Stage Info"));
  ev.job_id = json::GetUInt(root, "Job ID");
  return ev;
}

Event ParseStageCompleted(const Object& root) {
  return StageCompleted{ParseStageInfo(RequireObject(root, "Stage Info"))};
}

Event ParseTaskStart(const Object& root) {
  const auto& info = RequireObject(root, "Task Info");
  TaskStart   ev;
  ev.info  = ParseTaskInfo(info);
  ev.stage = TaskStage(root, info);
  return ev;
}

Event ParseTaskEnd(const Object& root) {
  const auto& info = RequireObject(root, "Task Info");
  TaskEnd     ev;
  ev.info   = ParseTaskInfo(info);
  ev.stage  = TaskStage(root, info);
  ev.reason = ParseEndReason(root, ev.info);
  if (const auto* metrics = json::FindObject(root, "Task Metrics")) {
    ev.metrics = ParseMetrics(*metrics);
  }
  return ev;
}

Event ParseExecutorAdded(const Object& root) {
  ExecutorAdded ev;
  ev.executor_id = RequireString(root, "Executor ID");
  ev.timestamp   = json::GetTimestamp(root, "Timestamp");
  if (const auto* info = json::FindObject(root, "Executor Info")) {
    ev.host = json::GetString(*info, "Host");
    ev.total_cores = GetUInt32(*info, "Total Cores");
  }
  return ev;
}

Event ParseExecutorRemoved(const Object& root) {
  ExecutorRemoved ev;
  ev.executor_id = RequireString(root, "Executor ID");
  ev.timestamp   = json::GetTimestamp(root, "Timestamp");
  ev.reason      = json::GetString(root, "Removed Reason");
  return ev;
}

Event ParseBlockManagerAdded(const Object& root) {
  const auto&       id = RequireObject(root, "Block Manager ID");
  BlockManagerAdded ev;
  ev.executor_id = RequireString(id, "Executor ID");
  ev.host        = json::GetString(id, "Host");
  ev.max_memory  = json::GetUInt(root, "Maximum Memory");
  return ev;
}

Event ParseEnvironmentUpdate(const Object& root) {
  static constexpr std::array<model::EnvironmentCategory, model::kEnvironmentCategoryCount> kCategories = {
      model::EnvironmentCategory::kSparkProperties, model::EnvironmentCategory::kSystemProperties, model::EnvironmentCategory::kClasspath,
      model::EnvironmentCategory::kHadoopProperties};

  EnvironmentUpdate ev;
  for (const auto category : kCategories) {
    if (auto props = ParseProperties(root, model::ToString(category))) {
      ev.categories[category] = std::move(*props);
    }
  }
  return ev;
}

using Parser = Event (*)(const Object&);

struct KindEntry {
  std::string_view kind;
  Parser           parse;
};

constexpr std::array<KindEntry, 13> kKinds = {{
    {"SparkListenerApplicationStart", &ParseApplicationStart},
    {"SparkListenerApplicationEnd", &ParseApplicationEnd},
    {"SparkListenerLogStart", &ParseLogStart},
    {"SparkListenerJobStart", &ParseJobStart},
    {"SparkListenerJobEnd", &ParseJobEnd},
    {"SparkListenerStageSubmitted", &ParseStageSubmitted},
    {"SparkListenerStageCompleted", &ParseStageCompleted},
    {"SparkListenerTaskStart", &ParseTaskStart},
    {"SparkListenerTaskEnd", &ParseTaskEnd},
    {"SparkListenerExecutorAdded", &ParseExecutorAdded},
    {"SparkListenerExecutorRemoved", &ParseExecutorRemoved},
    {"SparkListenerBlockManagerAdded", &ParseBlockManagerAdded},
    {"SparkListenerEnvironmentUpdate", &ParseEnvironmentUpdate},
}};

} // namespace

RecordDecoder::RecordDecoder(std::size_t max_line_bytes) : max_line_bytes_(max_line_bytes) {
}

DecodeResult RecordDecoder::Decode(std::string_view line) const {
  if (IsBlank(line)) {
    return DecodeResult::Blank();
  }
  if (max_line_bytes_ != 0 && line.size() > max_line_bytes_) {
    return DecodeResult::Malformed("line exceeds " + std::to_string(max_line_bytes_) + " bytes");
  }

  Object root;
  auto   status = google::protobuf::util::JsonStringToMessage(std::string(line), &root);
  if (!status.ok()) {
    return DecodeResult::Malformed("invalid JSON: " + std::string(status.message()));
  }

  auto kind = json::GetString(root, "Event");
  if (!kind) {
    return DecodeResult::Malformed("missing required field: Event");
  }

  const auto entry = std::find_if(kKinds.begin(), kKinds.end(), [&](const KindEntry& e) { return e.kind == *kind; });
  if (entry == kKinds.end()) {
    return DecodeResult::Unrecognized(*kind);
  }

  try {
    return DecodeResult::Ok(entry->parse(root));
  } catch (const FieldError& e) {
    return DecodeResult::Malformed(*kind + ": " + e.what());
  }
}

} // namespace sparkscope::decode
