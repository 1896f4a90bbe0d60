#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/correlate/task_classifier.hpp"
#include "internal/util/errors.hpp"

namespace {

using sparkscope::config::ConfigLoader;
namespace cfg = sparkscope::runtime::config;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "sparkscope_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestDefaultsWithoutFile() {
  const auto config = ConfigLoader::Defaults();
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.logging().level() == "info");
  assert(config.ingest().diagnostic_sample_limit() == 20);
  assert(config.ingest().max_line_bytes() == 0);
  assert(config.classification().rules_size() == 0);
}

void TestEmptyFileTakesDefaults() {
  const auto config = ConfigLoader::LoadFromYaml(WriteYaml("empty", "").string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.ingest().diagnostic_sample_limit() == 20);
}

void TestFullConfiguration() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:7077"
logging:
  level: debug
  pattern: "%v"
ingest:
  max_line_bytes: 1048576
  diagnostic_sample_limit: 5
classification:
  replace_defaults: false
  rules:
    - field: MATCH_FIELD_REASON_TEXT
      contains: "Container killed by YARN"
      outcome: TASK_OUTCOME_FAILED
      category: "YarnMemoryLimit"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7077");
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "%v");
  assert(config.ingest().max_line_bytes() == 1048576);
  assert(config.ingest().diagnostic_sample_limit() == 5);

  assert(config.classification().rules_size() == 1);
  const auto& rule = config.classification().rules(0);
  assert(rule.field() == cfg::MATCH_FIELD_REASON_TEXT);
  assert(rule.outcome() == cfg::TASK_OUTCOME_FAILED);
  assert(rule.category() == "YarnMemoryLimit");

  // The loaded rules build a working classifier.
  (void)sparkscope::correlate::TaskClassifier::FromConfig(config.classification());
}

void TestZeroSampleLimitIsKept() {
  const auto config = ConfigLoader::LoadFromYaml(WriteYaml("no_samples",
                                                           R"(ingest:
  diagnostic_sample_limit: 0
)")
                                                     .string());
  assert(config.ingest().has_diagnostic_sample_limit());
  assert(config.ingest().diagnostic_sample_limit() == 0);

  // Setting only the line cap still takes the default sample limit.
  const auto capped = ConfigLoader::LoadFromYaml(WriteYaml("line_cap_only",
                                                           R"(ingest:
  max_line_bytes: 4096
)")
                                                     .string());
  assert(capped.ingest().diagnostic_sample_limit() == 20);
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(logging:
  pattern: "12345"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().pattern() == "12345");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const sparkscope::util::InvalidArgument&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestNonMappingRootIsRejected() {
  const auto yaml_path = WriteYaml("sequence_root", "- a\n- b\n");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const sparkscope::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileIsUnavailable() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/sparkscope/config.yaml");
  } catch (const sparkscope::util::SourceUnavailable&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDefaultsWithoutFile();
  TestEmptyFileTakesDefaults();
  TestFullConfiguration();
  TestZeroSampleLimitIsKept();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestNonMappingRootIsRejected();
  TestMissingFileIsUnavailable();

  std::cout << "sparkscope_unit_config_loader: pass\n";
  return 0;
}
