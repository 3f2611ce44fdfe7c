#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using liveviewer::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "liveviewer_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
database:
  sqlite:
    path: "/var/lib/liveviewer/viewers.db"
    pool_size: 8
ingestion:
  queue_capacity: 64
  batch_size: 10
  pause_every_pages: 2
  page_pause_ms: 100
  run_timeout_sec: 30
rewards:
  operator_id: "20240101"
platform:
  replay_dir: /srv/captures/s1
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/liveviewer/viewers.db");
  assert(config.database().sqlite().pool_size() == 8);
  assert(config.ingestion().queue_capacity() == 64);
  assert(config.ingestion().batch_size() == 10);
  assert(config.ingestion().pause_every_pages() == 2);
  assert(config.ingestion().page_pause_ms() == 100);
  assert(config.ingestion().run_timeout_sec() == 30);
  // quoted digits stay a string
  assert(config.rewards().operator_id() == "20240101");
  assert(config.platform().replay_dir() == "/srv/captures/s1");
}

void TestDefaultsFillZeroValues() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(rewards:
  operator_id: ops
database:
  sqlite:
    path: /tmp/x.db
)");

  assert(config.ingestion().queue_capacity() == liveviewer::config::kDefaultQueueCapacity);
  assert(config.ingestion().batch_size() == liveviewer::config::kDefaultBatchSize);
  assert(config.ingestion().pause_every_pages() == liveviewer::config::kDefaultPauseEveryPages);
  assert(config.ingestion().page_pause_ms() == liveviewer::config::kDefaultPagePauseMs);
  assert(config.ingestion().run_timeout_sec() == 0);
  assert(config.rewards().consistency_samples_per_session() == liveviewer::config::kDefaultConsistencySample);
  assert(config.database().sqlite().pool_size() == liveviewer::config::kDefaultSqlitePoolSize);
}

void TestEmptyDocumentSelectsMemoryStore() {
  const auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.database().has_memory());
  assert(config.ingestion().batch_size() == liveviewer::config::kDefaultBatchSize);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\viewers\\\"quoted\"\\db.sqlite"
)");
  assert(config.database().sqlite().path() == "C:\\viewers\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(ingestion:
  batch_size: 10
  worker_threads: 4
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/liveviewer.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestDefaultsFillZeroValues();
  TestEmptyDocumentSelectsMemoryStore();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "liveviewer_unit_config_loader: pass\n";
  return 0;
}
