#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "jobmeter_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadThrows(const std::string& yaml) {
  try {
    (void)jobmeter::config::ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  sqlite:
    path: "/var/lib/jobmeter/jobs.db"
    wal_mode: true
storage:
  root_path: "/var/lib/jobmeter/storage"
worker:
  threads: 2
retention:
  interval: "15m"
  max_age: "24h"
  history_limit: 20
quota:
  token_window: "7d"
  default_group: "free"
modules:
  - key: reviewer
    estimated_tokens_per_unit: 180000
    model: "gpt-4o"
    stages:
      - name: reviews
        attempt_cap: 4
        success_threshold: "at_least:5"
  - key: grader
    disabled: true
logging:
  level: "debug"
)");

  auto config = jobmeter::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/jobmeter/jobs.db");
  assert(config.storage().root_path() == "/var/lib/jobmeter/storage");
  assert(config.worker().threads() == 2);
  assert(config.retention().history_limit() == 20);
  assert(config.quota().default_group() == "free");
  assert(config.modules_size() == 2);
  assert(config.modules(0).stages(0).attempt_cap() == 4);
  assert(config.modules(0).estimated_tokens_per_unit() == 180000);
  assert(config.modules(1).disabled());
  assert(config.logging().level() == "debug");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = jobmeter::config::ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\jobmeter\\\"quoted\"\\db.sqlite"
)");
  assert(config.database().sqlite().path() == "C:\\jobmeter\\\"quoted\"\\db.sqlite");
}

void TestEmptyDocumentGivesDefaults() {
  auto config = jobmeter::config::ConfigLoader::LoadFromYamlString("{}");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
  assert(config.modules_size() == 0);
}

void TestUnknownFieldsAreRejected() {
  assert(LoadThrows("unknown_field: 123\n") && "ConfigLoader must reject unknown fields.");
}

void TestMalformedDurationsAreRejected() {
  assert(LoadThrows("retention:\n  max_age: \"24 hours\"\n"));
  assert(LoadThrows("quota:\n  token_window: \"7w\"\n"));
  assert(LoadThrows("modules:\n  - key: summarizer\n    stages:\n      - name: documents\n        retry_delay: \"soon\"\n"));
}

void TestModuleWithoutKeyIsRejected() {
  assert(LoadThrows("modules:\n  - disabled: true\n"));
}

void TestMissingFileThrows() {
  bool threw = false;
  try {
    (void)jobmeter::config::ConfigLoader::LoadFromYaml("/nonexistent/jobmeter/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") == 0;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigLoads();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestEmptyDocumentGivesDefaults();
  TestUnknownFieldsAreRejected();
  TestMalformedDurationsAreRejected();
  TestModuleWithoutKeyIsRejected();
  TestMissingFileThrows();

  std::cout << "jobmeter_unit_config_loader: pass\n";
  return 0;
}
