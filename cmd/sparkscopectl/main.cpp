#include <grpcpp/grpcpp.h>

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "api/sparkscope/history/v1.hpp"

using namespace sparkscope::history::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  sparkscopectl <addr> app\n"
            << "  sparkscopectl <addr> jobs\n"
            << "  sparkscopectl <addr> stages\n"
            << "  sparkscopectl <addr> executors\n"
            << "  sparkscopectl <addr> environment\n"
            << "  sparkscopectl <addr> tasks <stage_id> [attempt]\n"
            << "  sparkscopectl <addr> stage <stage_id> [attempt]\n"
            << "  sparkscopectl <addr> diagnostics\n";
}

static std::optional<std::uint64_t> ParseUInt(const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

static std::optional<StageAttemptRef> ParseStageRef(int argc, char** argv) {
  if (argc < 4) return std::nullopt;
  auto stage_id = ParseUInt(argv[3]);
  auto attempt  = argc >= 5 ? ParseUInt(argv[4]) : std::optional<std::uint64_t>(0);
  if (!stage_id || !attempt) return std::nullopt;

  StageAttemptRef ref;
  ref.set_stage_id(*stage_id);
  ref.set_attempt(static_cast<std::uint32_t>(*attempt));
  return ref;
}

/*
  Minimal fixed-width table: column widths fit the widest cell.
*/
class Table {
 public:
  explicit Table(std::vector<std::string> header) {
    rows_.push_back(std::move(header));
  }

  void Add(std::vector<std::string> row) {
    rows_.push_back(std::move(row));
  }

  void Print(std::ostream& out) const {
    std::vector<std::size_t> widths;
    for (const auto& row : rows_) {
      if (widths.size() < row.size()) widths.resize(row.size(), 0);
      for (std::size_t i = 0; i < row.size(); ++i) widths[i] = std::max(widths[i], row[i].size());
    }
    for (const auto& row : rows_) {
      for (std::size_t i = 0; i < row.size(); ++i) {
        out << std::left << std::setw(static_cast<int>(widths[i]) + 2) << row[i];
      }
      out << "\n";
    }
  }

 private:
  std::vector<std::vector<std::string>> rows_;
};

static std::string Percent(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << value << "%";
  return out.str();
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static void PrintApplication(const ApplicationView& app) {
  if (!app.known()) {
    std::cout << "application not yet known\n";
    return;
  }
  std::cout << "id=" << app.app_id() << "\n";
  std::cout << "name=" << app.name() << "\n";
  if (!app.attempt_id().empty()) std::cout << "attempt=" << app.attempt_id() << "\n";
  std::cout << "user=" << app.user() << "\n";
  std::cout << "version=" << app.version() << "\n";
  std::cout << "status=" << app.status() << "\n";
  std::cout << "start=" << app.start_time() << "\n";
  std::cout << "end=" << app.end_time() << "\n";
  std::cout << "duration=" << app.duration() << "\n";
}

static void PrintJobs(const JobsView& view) {
  Table table({"JOB", "NAME", "STATUS", "SUBMITTED", "DURATION", "STAGES", "TASKS"});
  for (const auto& row : view.rows()) {
    const auto stages = std::to_string(row.stages_complete()) + "/" + std::to_string(row.stage_ids_size()) +
                        (row.stages_failed() ? " (" + std::to_string(row.stages_failed()) + " failed)" : "") +
                        (row.stages_skipped() ? " (" + std::to_string(row.stages_skipped()) + " skipped)" : "");
    const auto tasks = std::to_string(row.tasks_succeeded()) + "/" + std::to_string(row.tasks_total()) +
                       (row.tasks_failed() ? " (" + std::to_string(row.tasks_failed()) + " failed)" : "");
    table.Add({std::to_string(row.job_id()), row.name(), row.status(), row.submission_time(), row.duration(), stages, tasks});
  }
  table.Print(std::cout);
  std::cout << "running=" << view.running() << " succeeded=" << view.succeeded() << " failed=" << view.failed() << "\n";
}

static void PrintStages(const StagesView& view) {
  Table table({"STAGE", "NAME", "STATUS", "TASKS", "DONE", "DURATION", "INPUT", "OUTPUT", "SHUFFLE READ", "SHUFFLE WRITE"});
  for (const auto& row : view.rows()) {
    table.Add({std::to_string(row.stage_id()) + "." + std::to_string(row.attempt()), row.name(), row.status(),
               std::to_string(row.tasks_succeeded()) + "/" + std::to_string(row.tasks_expected()), Percent(row.percent_complete()), row.duration(),
               row.input(), row.output(), row.shuffle_read(), row.shuffle_write()});
  }
  table.Print(std::cout);
  std::cout << "pending=" << view.pending() << " active=" << view.active() << " complete=" << view.complete() << " failed=" << view.failed()
            << " skipped=" << view.skipped() << "\n";
}

static void PrintExecutors(const ExecutorsView& view) {
  Table table({"EXECUTOR", "HOST", "STATUS", "CORES", "MEMORY", "ACTIVE", "DONE", "FAILED", "TASK TIME", "GC TIME", "INPUT", "SHUFFLE READ"});
  for (const auto& row : view.rows()) {
    table.Add({row.executor_id(), row.host(), row.status(), row.cores(), row.max_memory(), std::to_string(row.active_tasks()),
               std::to_string(row.tasks_complete()), std::to_string(row.tasks_failed()), row.task_time(), row.gc_time(), row.input(),
               row.shuffle_read()});
  }
  table.Print(std::cout);
  std::cout << "active=" << view.active() << " removed=" << view.removed() << " cores=" << view.total_cores() << " memory=" << view.total_memory()
            << "\n";
}

static void PrintEnvironment(const EnvironmentView& view) {
  for (const auto& category : view.categories()) {
    std::cout << "[" << category.name() << "]\n";
    for (const auto& prop : category.properties()) {
      std::cout << "  " << prop.key() << "=" << prop.value() << "\n";
    }
  }
}

static void PrintTasks(const TasksView& view) {
  Table table({"TASK", "INDEX", "EXECUTOR", "HOST", "STATUS", "LAUNCHED", "DURATION", "GC", "SPILL (MEM)", "SPILL (DISK)", "REASON"});
  for (const auto& row : view.rows()) {
    table.Add({std::to_string(row.task_id()) + "." + std::to_string(row.attempt()) + (row.speculative() ? "*" : ""), std::to_string(row.index()),
               row.executor_id(), row.host(), row.status(), row.launch_time(), row.duration(), row.gc_time(), row.memory_spilled(),
               row.disk_spilled(), row.category()});
  }
  table.Print(std::cout);
}

static void PrintStageDetail(const StageDetail& detail) {
  const auto& stage = detail.stage();
  std::cout << "stage=" << stage.stage_id() << "." << stage.attempt() << " " << stage.name() << "\n";
  std::cout << "status=" << stage.status() << " complete=" << Percent(stage.percent_complete()) << "\n";
  if (!stage.failure_reason().empty()) std::cout << "reason=" << stage.failure_reason() << "\n";
  std::cout << "task duration min=" << detail.min_duration() << " median=" << detail.median_duration() << " max=" << detail.max_duration() << "\n";

  Table table({"METRIC", "SUM", "MAX"});
  for (const auto& metric : detail.metrics()) {
    table.Add({metric.name(), std::to_string(metric.sum()), std::to_string(metric.max())});
  }
  table.Print(std::cout);
}

static void PrintDiagnostics(const Diagnostics& diag) {
  std::cout << "status=" << LoadStatus_Name(diag.status()) << "\n";
  std::cout << "read=" << diag.lines_read() << " applied=" << diag.lines_applied() << " skipped=" << diag.lines_skipped() << " blank=" << diag.lines_blank()
            << " malformed=" << diag.lines_malformed() << " unrecognized=" << diag.lines_unrecognized() << " anomalies=" << diag.anomalies() << "\n";
  for (const auto& sample : diag.samples()) {
    std::cout << "  " << sample << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = SparkHistoryService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "app" || cmd == "jobs" || cmd == "stages" || cmd == "executors" || cmd == "environment") {
    GetSnapshotRequest req;
    Snapshot           resp;

    auto status = stub->GetSnapshot(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (cmd == "app") PrintApplication(resp.application());
    if (cmd == "jobs") PrintJobs(resp.jobs());
    if (cmd == "stages") PrintStages(resp.stages());
    if (cmd == "executors") PrintExecutors(resp.executors());
    if (cmd == "environment") PrintEnvironment(resp.environment());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "tasks") {
    auto ref = ParseStageRef(argc, argv);
    if (!ref) {
      Usage();
      return 1;
    }

    ListTasksRequest req;
    *req.mutable_stage() = *ref;
    TasksView resp;

    auto status = stub->ListTasks(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintTasks(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stage") {
    auto ref = ParseStageRef(argc, argv);
    if (!ref) {
      Usage();
      return 1;
    }

    GetStageDetailRequest req;
    *req.mutable_stage() = *ref;
    StageDetail resp;

    auto status = stub->GetStageDetail(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintStageDetail(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "diagnostics") {
    GetDiagnosticsRequest req;
    Diagnostics           resp;

    auto status = stub->GetDiagnostics(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintDiagnostics(resp);
    return 0;
  }

  Usage();
  return 1;
}
