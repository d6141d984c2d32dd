#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using outbox::runtime::config::RuntimeConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "outbox_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)outbox::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: "debug"
storage:
  kind: STORAGE_KIND_MEMORY
  root_path: "/data/outbox"
  fsync: false
queue:
  max_items: 16
delivery:
  workers: 4
  tick_interval_ms: 5000
  min_backoff_ms: 250
  max_backoff_ms: 8000
  max_retries: 10
resources:
  - errors
)");

  auto config = outbox::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.storage().kind() == outbox::runtime::config::STORAGE_KIND_MEMORY);
  assert(config.storage().root_path() == "/data/outbox");
  assert(config.storage().has_fsync() && !config.storage().fsync());
  assert(config.queue().max_items() == 16);
  assert(config.delivery().workers() == 4);
  assert(config.delivery().tick_interval_ms() == 5000);
  assert(config.delivery().min_backoff_ms() == 250);
  assert(config.delivery().max_backoff_ms() == 8000);
  assert(config.delivery().max_retries() == 10);
  assert(config.resources_size() == 1 && config.resources(0) == "errors");
}

void TestDefaultsFillMissingSections() {
  const auto yaml_path = WriteYaml("minimal", R"(storage:
  root_path: "C:\\outbox\\\"quoted\""
)");

  auto config = outbox::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.storage().root_path() == "C:\\outbox\\\"quoted\"");
  assert(config.storage().kind() == outbox::runtime::config::STORAGE_KIND_DISK);
  assert(config.storage().fsync());
  assert(config.queue().max_items() == 64);
  assert(config.delivery().workers() == 2);
  assert(config.delivery().tick_interval_ms() == 30000);
  assert(config.delivery().min_backoff_ms() == 1000);
  assert(config.delivery().max_backoff_ms() == 60000);
  assert(config.delivery().max_retries() == 0);
  assert(config.resources_size() == 2);
}

void TestWithDefaultsKeepsExplicitValues() {
  RuntimeConfig config;
  config.mutable_queue()->set_max_items(3);
  config.mutable_storage()->set_fsync(false);

  auto filled = outbox::config::WithDefaults(config);
  assert(filled.queue().max_items() == 3);
  assert(!filled.storage().fsync());
  assert(filled.storage().root_path() == "/tmp/outbox");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("unknown_field", R"(queue:
  max_items: 10
unknown_field: 123
)") && "ConfigLoader must reject unknown fields.");
}

void TestUnknownResourceIsRejected() {
  assert(Rejects("unknown_resource", R"(resources:
  - errors
  - crashes
)"));
}

void TestInvertedBackoffIsRejected() {
  assert(Rejects("inverted_backoff", R"(delivery:
  min_backoff_ms: 5000
  max_backoff_ms: 100
)"));
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)outbox::config::ConfigLoader::LoadFromYaml("/nonexistent/outbox.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfig();
  TestDefaultsFillMissingSections();
  TestWithDefaultsKeepsExplicitValues();
  TestUnknownFieldsAreRejected();
  TestUnknownResourceIsRejected();
  TestInvertedBackoffIsRejected();
  TestMissingFileIsRejected();

  std::cout << "outbox_unit_config_loader: pass\n";
  return 0;
}
