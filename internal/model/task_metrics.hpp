#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace sparkscope::model {

/*
  Per-task metrics as reported on task-end.

  Every field is optional: absent means the producer did not report it,
  which is distinct from a reported zero.
*/
struct TaskMetrics {
  using Value = std::optional<std::uint64_t>;

  Value executor_run_time_ms;
  Value executor_cpu_time_ns;
  Value deserialize_time_ms;
  Value result_size_bytes;
  Value result_serialization_time_ms;
  Value gc_time_ms;
  Value memory_bytes_spilled;
  Value disk_bytes_spilled;
  Value peak_execution_memory;

  Value shuffle_remote_bytes_read;
  Value shuffle_local_bytes_read;
  Value shuffle_remote_blocks_fetched;
  Value shuffle_local_blocks_fetched;
  Value shuffle_records_read;
  Value shuffle_fetch_wait_time_ms;

  Value shuffle_bytes_written;
  Value shuffle_write_time_ns;
  Value shuffle_records_written;

  Value input_bytes_read;
  Value input_records_read;
  Value output_bytes_written;
  Value output_records_written;

  // Remote plus local, nullopt when neither was reported.
  Value ShuffleBytesRead() const {
    if (!shuffle_remote_bytes_read && !shuffle_local_bytes_read) {
      return std::nullopt;
    }
    return shuffle_remote_bytes_read.value_or(0) + shuffle_local_bytes_read.value_or(0);
  }

  bool operator==(const TaskMetrics& o) const;
};

struct MetricDescriptor {
  std::string_view           name;
  TaskMetrics::Value TaskMetrics::*field;
};

inline constexpr std::array<MetricDescriptor, 22> kTaskMetricFields = {{
    {"executor_run_time_ms", &TaskMetrics::executor_run_time_ms},
    {"executor_cpu_time_ns", &TaskMetrics::executor_cpu_time_ns},
    {"deserialize_time_ms", &TaskMetrics::deserialize_time_ms},
    {"result_size_bytes", &TaskMetrics::result_size_bytes},
    {"result_serialization_time_ms", &TaskMetrics::result_serialization_time_ms},
    {"gc_time_ms", &TaskMetrics::gc_time_ms},
    {"memory_bytes_spilled", &TaskMetrics::memory_bytes_spilled},
    {"disk_bytes_spilled", &TaskMetrics::disk_bytes_spilled},
    {"peak_execution_memory", &TaskMetrics::peak_execution_memory},
    {"shuffle_remote_bytes_read", &TaskMetrics::shuffle_remote_bytes_read},
    {"shuffle_local_bytes_read", &TaskMetrics::shuffle_local_bytes_read},
    {"shuffle_remote_blocks_fetched", &TaskMetrics::shuffle_remote_blocks_fetched},
    {"shuffle_local_blocks_fetched", &TaskMetrics::shuffle_local_blocks_fetched},
    {"shuffle_records_read", &TaskMetrics::shuffle_records_read},
    {"shuffle_fetch_wait_time_ms", &TaskMetrics::shuffle_fetch_wait_time_ms},
    {"shuffle_bytes_written", &TaskMetrics::shuffle_bytes_written},
    {"shuffle_write_time_ns", &TaskMetrics::shuffle_write_time_ns},
    {"shuffle_records_written", &TaskMetrics::shuffle_records_written},
    {"input_bytes_read", &TaskMetrics::input_bytes_read},
    {"input_records_read", &TaskMetrics::input_records_read},
    {"output_bytes_written", &TaskMetrics::output_bytes_written},
    {"output_records_written", &TaskMetrics::output_records_written},
}};

inline bool TaskMetrics::operator==(const TaskMetrics& o) const {
  for (const auto& metric : kTaskMetricFields) {
    if (this->*metric.field != o.*metric.field) {
      return false;
    }
  }
  return true;
}

} // namespace sparkscope::model
