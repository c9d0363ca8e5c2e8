#include "internal/catalog/sqlite/sqlite_catalog.hpp"

#include <cassert>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using snapshot::catalog::sqlite::SqliteCatalog;
using snapshot::catalog::sqlite::SqliteDB;
using snapshot::model::Camera;

std::filesystem::path FreshDatabase(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "snapshot_manager_sqlite_catalog_tests";
  std::filesystem::create_directories(dir);

  const auto path = dir / (name + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path;
}

Camera MakeCamera(std::int64_t id, const std::string& exid) {
  Camera camera;
  camera.id                  = id;
  camera.exid                = exid;
  camera.name                = "Camera " + exid;
  camera.vendor              = snapshot::model::Vendor{"axis", "Axis"};
  camera.model_snapshot_path = "axis-cgi/jpg/image.cgi";
  camera.external_host       = "cam.example.org";
  camera.external_http_port  = 8080;
  camera.username            = "root";
  camera.password            = "pass";
  camera.timezone            = "Europe/Dublin";
  return camera;
}

void TestRoundTripsCamerasInIdOrder() {
  auto db = std::make_shared<SqliteDB>(FreshDatabase("round_trip").string());
  SqliteCatalog catalog(db);
  catalog.EnsureSchema();

  assert(catalog.ListAll().empty());

  auto recorded = MakeCamera(2, "cam-b");
  recorded.cloud_recording = snapshot::model::CloudRecording{"on-scheduled", 10, 30, {{"Monday", {"08:00-12:00", "13:00-18:00"}}}};
  catalog.Upsert(recorded);

  auto bare   = MakeCamera(1, "cam-a");
  bare.vendor = std::nullopt;
  catalog.Upsert(bare);

  auto cameras = catalog.ListAll();
  assert(cameras.size() == 2);
  assert(cameras[0].exid == "cam-a");
  assert(cameras[1].exid == "cam-b");

  assert(!cameras[0].vendor);
  assert(!cameras[0].cloud_recording);
  assert(cameras[0].external_http_port == 8080);
  assert(cameras[0].timezone == "Europe/Dublin");

  const auto& b = cameras[1];
  assert(b.VendorExid() == "axis");
  assert(b.SnapshotUrl() == "http://cam.example.org:8080/axis-cgi/jpg/image.cgi");
  assert(b.Auth() == "root:pass");
  assert(b.cloud_recording);
  assert(b.cloud_recording->status == "on-scheduled");
  assert(b.cloud_recording->frequency == 10);
  assert(b.cloud_recording->storage_duration == 30);
  assert(b.cloud_recording->schedule.at("Monday") == (std::vector<std::string>{"08:00-12:00", "13:00-18:00"}));
}

void TestGetAndUpsertReplaceByExid() {
  auto db = std::make_shared<SqliteDB>(FreshDatabase("upsert").string());
  SqliteCatalog catalog(db);
  catalog.EnsureSchema();

  assert(!catalog.Get("cam-a"));

  catalog.Upsert(MakeCamera(1, "cam-a"));
  auto changed          = MakeCamera(1, "cam-a");
  changed.external_host = "10.1.1.1";
  changed.timezone      = "";
  catalog.Upsert(changed);

  auto camera = catalog.Get("cam-a");
  assert(camera);
  assert(camera->external_host == "10.1.1.1");
  assert(camera->timezone == "Etc/UTC");
  assert(catalog.ListAll().size() == 1);
}

void TestMalformedScheduleSkipsOnlyThatCamera() {
  auto db = std::make_shared<SqliteDB>(FreshDatabase("malformed").string());
  SqliteCatalog catalog(db);
  catalog.EnsureSchema();

  auto good            = MakeCamera(1, "good");
  good.cloud_recording = snapshot::model::CloudRecording{"on", 1, 0, {}};
  catalog.Upsert(good);

  auto bad            = MakeCamera(2, "bad");
  bad.cloud_recording = snapshot::model::CloudRecording{"on-scheduled", 1, 0, {}};
  catalog.Upsert(bad);
  db->Exec("UPDATE cameras SET cloud_recording_schedule='{not json' WHERE exid='bad';");

  auto cameras = catalog.ListAll();
  assert(cameras.size() == 1);
  assert(cameras.front().exid == "good");

  assert(!catalog.Get("bad"));
  assert(catalog.Get("good"));
}

void TestMissingTableIsReportedAsUnavailable() {
  auto db = std::make_shared<SqliteDB>(FreshDatabase("no_schema").string());
  SqliteCatalog catalog(db);

  bool threw = false;
  try {
    (void)catalog.ListAll();
  } catch (const snapshot::util::CatalogUnavailable&) {
    threw = true;
  }
  assert(threw);
}

void TestUnopenableDatabaseIsReportedAsUnavailable() {
  bool threw = false;
  try {
    SqliteDB db("/nonexistent-directory/snapshot/cameras.db");
  } catch (const snapshot::util::CatalogUnavailable&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRoundTripsCamerasInIdOrder();
  TestGetAndUpsertReplaceByExid();
  TestMalformedScheduleSkipsOnlyThatCamera();
  TestMissingTableIsReportedAsUnavailable();
  TestUnopenableDatabaseIsReportedAsUnavailable();

  std::cout << "snapshot_manager_unit_sqlite_catalog: pass\n";
  return 0;
}
