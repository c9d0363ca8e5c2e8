#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/catalog/memory_catalog.hpp"
#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "snapshot_manager_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfiguration() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "%v"
supervisor:
  start_camera_workers: true
  max_restarts: 3
  max_seconds: 10
  restart_backoff_ms: 250
event_handlers:
  - broadcast
  - storage
catalog:
  sqlite:
    path: "/var/lib/snapshot/cameras.db"
)");

  auto config = snapshot::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "%v");
  assert(config.supervisor().start_camera_workers());
  assert(config.supervisor().max_restarts() == 3);
  assert(config.supervisor().max_seconds() == 10);
  assert(config.supervisor().restart_backoff_ms() == 250);
  assert(config.event_handlers_size() == 2);
  assert(config.event_handlers(0) == "broadcast");
  assert(config.event_handlers(1) == "storage");
  assert(config.catalog().has_sqlite());
  assert(config.catalog().sqlite().path() == "/var/lib/snapshot/cameras.db");
}

void TestDefaultsForEmptyDocument() {
  auto config = snapshot::config::ConfigLoader::LoadFromString("");

  assert(!config.supervisor().start_camera_workers());
  assert(config.supervisor().max_restarts() == 1'000'000);
  assert(config.supervisor().max_seconds() == 5);
  assert(config.supervisor().restart_backoff_ms() == 0);
  assert(config.event_handlers_size() == 4);
  assert(config.event_handlers(0) == "broadcast");
  assert(config.event_handlers(1) == "persistence");
  assert(config.event_handlers(2) == "poll_control");
  assert(config.event_handlers(3) == "storage");
  assert(!config.catalog().has_sqlite() && !config.catalog().has_memory());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(supervisor:
  max_restarts: 3
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)snapshot::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const snapshot::util::InvalidConfig&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)snapshot::config::ConfigLoader::LoadFromYaml("/nonexistent/snapshot-manager.yaml");
  } catch (const snapshot::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

void TestNonMappingRootIsRejected() {
  bool threw = false;
  try {
    (void)snapshot::config::ConfigLoader::LoadFromString("- just\n- a list\n");
  } catch (const snapshot::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

void TestMemorySeedsKeepQuotedScalarsAsStrings() {
  auto config = snapshot::config::ConfigLoader::LoadFromString(R"(catalog:
  memory:
    cameras:
      - id: 7
        exid: "gate-cam"
        name: Gate
        vendor:
          exid: hikvision
          name: Hikvision
        model_snapshot_path: "ISAPI/Streaming/channels/101/picture"
        external_host: "10.0.0.1"
        external_http_port: 8080
        username: admin
        password: "12345"
        cloud_recording:
          status: on-scheduled
          frequency: 5
          storage_duration: 7
          schedule:
            Monday:
              ranges: ["08:00-18:00"]
)");

  assert(config.catalog().has_memory());
  auto cameras = snapshot::catalog::MemoryCatalog::CamerasFromConfig(config.catalog().memory());
  assert(cameras.size() == 1);

  const auto& camera = cameras.front();
  assert(camera.id == 7);
  assert(camera.exid == "gate-cam");
  assert(camera.password == "12345");
  assert(camera.external_host == "10.0.0.1");
  assert(camera.external_http_port == 8080);
  assert(camera.timezone == "Etc/UTC");
  assert(camera.VendorExid() == "hikvision");
  assert(camera.cloud_recording);
  assert(camera.cloud_recording->status == "on-scheduled");
  assert(camera.cloud_recording->frequency == 5);
  assert(camera.cloud_recording->schedule.at("Monday") == std::vector<std::string>{"08:00-18:00"});
}

void TestEnvironmentOverridesBootstrapFlag() {
  ::setenv("SNAPSHOT_START_CAMERA_WORKERS", "true", 1);
  auto enabled = snapshot::config::ConfigLoader::LoadFromString("supervisor:\n  start_camera_workers: false\n");
  assert(enabled.supervisor().start_camera_workers());

  ::setenv("SNAPSHOT_START_CAMERA_WORKERS", "0", 1);
  auto disabled = snapshot::config::ConfigLoader::LoadFromString("supervisor:\n  start_camera_workers: true\n");
  assert(!disabled.supervisor().start_camera_workers());

  ::setenv("SNAPSHOT_START_CAMERA_WORKERS", "yes please", 1);
  bool threw = false;
  try {
    (void)snapshot::config::ConfigLoader::LoadFromString("");
  } catch (const snapshot::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);

  ::unsetenv("SNAPSHOT_START_CAMERA_WORKERS");
}

} // namespace

int main() {
  ::unsetenv("SNAPSHOT_START_CAMERA_WORKERS");

  TestFullConfiguration();
  TestDefaultsForEmptyDocument();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();
  TestNonMappingRootIsRejected();
  TestMemorySeedsKeepQuotedScalarsAsStrings();
  TestEnvironmentOverridesBootstrapFlag();

  std::cout << "snapshot_manager_unit_config_loader: pass\n";
  return 0;
}
