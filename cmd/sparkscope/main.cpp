#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/core/history_session.hpp"
#include "internal/factory.hpp"
#include "internal/ingest/event_log_loader.hpp"
#include "internal/ingest/line_source.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using sparkscope::runtime::Server;

static std::atomic<bool> g_stop{false};

void HandleSignal(int) {
  g_stop.store(true);
}

namespace {

struct Options {
  std::optional<std::string> config_path;
  std::string                log_path;
  bool                       summary = false;
};

void Usage() {
  std::cerr << "Usage: sparkscope [--config <config.yaml>] [--summary] <event_log>" << std::endl;
}

std::optional<Options> ParseArgs(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) return std::nullopt;
      options.config_path = argv[++i];
    } else if (arg == "--summary") {
      options.summary = true;
    } else if (!arg.empty() && arg[0] == '-') {
      return std::nullopt;
    } else if (options.log_path.empty()) {
      options.log_path = arg;
    } else {
      return std::nullopt;
    }
  }
  if (options.log_path.empty()) return std::nullopt;
  return options;
}

void PrintSummary(const sparkscope::core::HistorySession& session) {
  const auto snapshot = session.Snapshot();
  const auto summary  = session.Summary();
  const auto& app     = snapshot.application();
  const auto& diag    = snapshot.diagnostics();

  if (app.known()) {
    std::cout << "Application: " << app.name() << " (" << app.app_id() << ")\n";
    std::cout << "Status:      " << app.status() << "\n";
    std::cout << "Duration:    " << app.duration() << "\n";
  } else {
    std::cout << "Application: unknown\n";
  }
  std::cout << "Jobs:        " << summary.jobs << " (" << snapshot.jobs().succeeded() << " succeeded, " << snapshot.jobs().failed() << " failed, "
            << snapshot.jobs().running() << " running)\n";
  std::cout << "Stages:      " << summary.stages << " (" << snapshot.stages().complete() << " complete, " << snapshot.stages().failed()
            << " failed, " << snapshot.stages().skipped() << " skipped)\n";
  std::cout << "Tasks:       " << summary.tasks << "\n";
  std::cout << "Executors:   " << summary.executors << " (" << snapshot.executors().total_cores() << " cores, "
            << snapshot.executors().total_memory() << ")\n";
  std::cout << "Lines:       " << diag.lines_read() << " read, " << diag.lines_applied() << " applied, " << diag.lines_malformed()
            << " malformed, " << diag.lines_unrecognized() << " unrecognized, " << diag.lines_blank() << " blank\n";
  if (diag.anomalies() > 0) {
    std::cout << "Anomalies:   " << diag.anomalies() << "\n";
  }
  for (const auto& sample : diag.samples()) {
    std::cout << "  " << sample << "\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  auto options = ParseArgs(argc, argv);
  if (!options) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = options->config_path ? sparkscope::config::ConfigLoader::LoadFromYaml(*options->config_path)
                                       : sparkscope::config::ConfigLoader::Defaults();

    sparkscope::observability::InitializeLogging(config);

    // An unreadable log is fatal before anything is reconstructed.
    auto source = sparkscope::ingest::LineSource::Open(options->log_path);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = sparkscope::factory::Build(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (options->summary) {
      const auto result = sparkscope::ingest::EventLogLoader::Load(source, *app.session, &g_stop);
      PrintSummary(*app.session);
      sparkscope::observability::ShutdownLogging();
      return result.status == sparkscope::ingest::LoadStatus::kComplete ? 0 : 3;
    }

    // ------------------------------------------------------------
    // Start server, then load in the background
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));
    server.Start();

    std::thread loader([&source, session = app.session] {
      try {
        sparkscope::ingest::EventLogLoader::Load(source, *session, &g_stop);
      } catch (const std::exception& e) {
        SPARKSCOPE_LOG_ERROR("Load aborted", {sparkscope::observability::StringField("error", e.what())});
      }
    });

    while (!g_stop.load()) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    SPARKSCOPE_LOG_INFO("Shutting down sparkscope");

    loader.join();
    server.Stop();
    sparkscope::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    SPARKSCOPE_LOG_ERROR("Fatal error", {sparkscope::observability::StringField("error", e.what())});
    sparkscope::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
