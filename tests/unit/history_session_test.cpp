#include "internal/core/history_session.hpp"

#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/ingest/event_log_loader.hpp"
#include "internal/ingest/line_source.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace sparkscope;
using core::HistorySession;
using decode::DecodeStatus;
using ingest::EventLogLoader;
using ingest::LineSource;
using ingest::LoadStatus;
namespace v1 = sparkscope::history::v1;

const std::string kLog = std::string(R"({"Event":"SparkListenerApplicationStart","App Name":"etl","App ID":"app-1","Timestamp":1000})") + "\n" +
                         R"({"Event":"SparkListenerJobStart","Job ID":0,"Submission Time":1200,"Stage Infos":[{"Stage ID":0,"Stage Attempt ID":0,"Number of Tasks":1}],"Stage IDs":[0]})" +
                         "\n" + R"({"Event":"SparkListenerStageSubmitted","Stage Info":{"Stage ID":0,"Stage Attempt ID":0,"Number of Tasks":1,"Submission Time":1300}})" + "\n" +
                         R"({"Event":"SparkListenerTaskEnd","Stage ID":0,"Stage Attempt ID":0,"Task End Reason":{"Reason":"Success"},"Task Info":{"Task ID":0,"Attempt":0,"Launch Time":1400,"Executor ID":"1","Finish Time":1900},"Task Metrics":{"Memory Bytes Spilled":64}})" +
                         "\n" + R"({"Event":"SparkListenerJobEnd","Job ID":0,"Completion Time":2200,"Job Result":{"Result":"JobSucceeded"}})" + "\n" +
                         R"({"Event":"SparkListenerApplicationEnd","Timestamp":3000})" + "\n";

HistorySession MakeSession(std::size_t sample_limit = 20) {
  return HistorySession(correlate::TaskClassifier(), 0, sample_limit);
}

// Snapshot with the diagnostics removed, for comparing reconstructed state.
std::string StateOf(const HistorySession& session) {
  auto snapshot = session.Snapshot();
  snapshot.clear_diagnostics();
  return snapshot.SerializeAsString();
}

void TestApplyLineClassifiesEveryLine() {
  auto session = MakeSession();

  assert(session.ApplyLine(1, "") == DecodeStatus::kBlank);
  assert(session.ApplyLine(2, "   ") == DecodeStatus::kBlank);
  assert(session.ApplyLine(3, "{not json") == DecodeStatus::kMalformed);
  assert(session.ApplyLine(4, R"({"Event":"SparkListenerSomethingNew"})") == DecodeStatus::kUnrecognized);
  assert(session.ApplyLine(5, R"({"Event":"SparkListenerApplicationStart","App Name":"a","App ID":"app-1","Timestamp":1})") == DecodeStatus::kOk);
  assert(session.ApplyLine(6, R"({"Event":"SparkListenerApplicationStart","App Name":"b","App ID":"app-2","Timestamp":2})") == DecodeStatus::kOk);

  const auto diagnostics = session.Diagnostics();
  assert(diagnostics.status() == v1::LOAD_STATUS_LOADING);
  assert(diagnostics.lines_read() == 6);
  assert(diagnostics.lines_blank() == 2);
  assert(diagnostics.lines_malformed() == 1);
  assert(diagnostics.lines_unrecognized() == 1);
  assert(diagnostics.lines_applied() == 2);
  assert(diagnostics.lines_skipped() == 4);
  assert(diagnostics.lines_applied() + diagnostics.lines_skipped() == diagnostics.lines_read());
  assert(diagnostics.anomalies() == 1);

  assert(diagnostics.samples_size() == 3);
  assert(diagnostics.samples(0).rfind("line 3: ", 0) == 0);
  assert(diagnostics.samples(2).rfind("line 6: ", 0) == 0);
}

void TestSamplesAreBounded() {
  auto session = MakeSession(2);
  for (std::uint64_t line = 1; line <= 10; ++line) {
    session.ApplyLine(line, "garbage");
  }

  const auto diagnostics = session.Diagnostics();
  assert(diagnostics.lines_malformed() == 10);
  assert(diagnostics.samples_size() == 2);

  // A limit of 0 counts lines but keeps no messages.
  auto silent = MakeSession(0);
  silent.ApplyLine(1, "garbage");
  assert(silent.Diagnostics().lines_malformed() == 1);
  assert(silent.Diagnostics().samples_size() == 0);
}

void TestOverlongLinesAreMalformed() {
  HistorySession session(correlate::TaskClassifier(), 16, 20);
  assert(session.ApplyLine(1, R"({"Event":"SparkListenerApplicationEnd","Timestamp":1})") == DecodeStatus::kMalformed);
  assert(session.Read([](const store::EntityStore& store, const ingest::LoadDiagnostics&) { return store.FindApplication() == nullptr; }));
}

void TestMalformedLinesDoNotChangeState() {
  auto clean = MakeSession();
  auto src   = LineSource::FromString(kLog);
  EventLogLoader::Load(src, clean);

  std::string noisy_log;
  {
    auto        lines = LineSource::FromString(kLog);
    std::string line;
    while (lines.Next(line)) {
      noisy_log += "{\"Event\":\n";
      noisy_log += line + "\n";
      noisy_log += "\n";
    }
  }

  auto noisy     = MakeSession();
  auto noisy_src = LineSource::FromString(noisy_log);
  EventLogLoader::Load(noisy_src, noisy);

  assert(StateOf(clean) == StateOf(noisy));
  assert(noisy.Diagnostics().lines_malformed() == 6);
  assert(noisy.Diagnostics().lines_blank() == 6);
}

void TestLoaderCompletes() {
  auto session = MakeSession();
  auto source  = LineSource::FromString(kLog);

  const auto result = EventLogLoader::Load(source, session);
  assert(result.status == LoadStatus::kComplete);
  assert(result.lines == 6);
  assert(session.load_status() == LoadStatus::kComplete);

  const auto snapshot = session.Snapshot();
  assert(snapshot.diagnostics().status() == v1::LOAD_STATUS_COMPLETE);
  assert(snapshot.application().status() == "FINISHED");
  assert(snapshot.jobs().succeeded() == 1);
  assert(snapshot.stages().rows(0).memory_spilled() == "64 B");

  const auto summary = session.Summary();
  assert(summary.duration_ms == std::optional<std::uint64_t>(2000));
  assert(summary.tasks == 1);

  assert(session.Tasks(model::StageKey{0, 0}).rows_size() == 1);
  assert(session.StageDetail(model::StageKey{0, 0}).stage().tasks_succeeded() == 1);
}

void TestLoaderHonoursCancellation() {
  auto              session = MakeSession();
  auto              source  = LineSource::FromString(kLog);
  std::atomic<bool> cancel{true};

  const auto result = EventLogLoader::Load(source, session, &cancel);
  assert(result.status == LoadStatus::kCancelled);
  assert(result.lines == 0);
  assert(session.Diagnostics().status() == v1::LOAD_STATUS_CANCELLED);
  assert(!session.Snapshot().application().known());
}

void TestUnknownStageViewsThrowNotFound() {
  auto session = MakeSession();
  bool threw   = false;
  try {
    session.Tasks(model::StageKey{3, 0});
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestLineSourceStripsCarriageReturns() {
  auto        source = LineSource::FromString("a\r\nb\n\r\nc", "crlf");
  std::string line;

  assert(source.name() == "crlf");
  assert(source.Next(line) && line == "a");
  assert(source.Next(line) && line == "b");
  assert(source.Next(line) && line.empty());
  assert(source.Next(line) && line == "c");
  assert(source.line_number() == 4);
  assert(!source.Next(line));
}

void TestLineSourceOpen() {
  bool threw = false;
  try {
    LineSource::Open("/nonexistent/sparkscope/eventlog");
  } catch (const util::SourceUnavailable& e) {
    threw = std::string(e.what()).find("/nonexistent/sparkscope/eventlog") != std::string::npos;
  }
  assert(threw);

  const auto path = std::filesystem::temp_directory_path() / "sparkscope_history_session_test.log";
  {
    std::ofstream out(path);
    out << kLog;
  }

  auto session = MakeSession();
  auto source  = LineSource::Open(path.string());
  assert(EventLogLoader::Load(source, session).status == LoadStatus::kComplete);
  assert(session.Diagnostics().lines_applied() == 6);
  std::filesystem::remove(path);
}

} // namespace

int main() {
  TestApplyLineClassifiesEveryLine();
  TestSamplesAreBounded();
  TestOverlongLinesAreMalformed();
  TestMalformedLinesDoNotChangeState();
  TestLoaderCompletes();
  TestLoaderHonoursCancellation();
  TestUnknownStageViewsThrowNotFound();
  TestLineSourceStripsCarriageReturns();
  TestLineSourceOpen();

  std::cout << "sparkscope_unit_history_session: pass\n";
  return 0;
}
