#include "sqlite_catalog.hpp"

#include <cstdint>
#include <optional>
#include <utility>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace snapshot::catalog::sqlite {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id,exid,name,vendor_exid,vendor_name,model_snapshot_path,external_host,external_http_port,"
    "username,password,timezone,cloud_recording_status,cloud_recording_frequency,"
    "cloud_recording_storage_duration,cloud_recording_schedule FROM cameras";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

bool ColIsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

model::Schedule ParseSchedule(const std::string& exid, const std::string& json) {
  model::Schedule schedule;
  if (json.empty()) return schedule;

  google::protobuf::Struct parsed;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &parsed);
  if (!status.ok()) {
    throw util::InvalidConfig("camera " + exid + " has a malformed schedule: " + std::string(status.message()));
  }

  for (const auto& [day, value] : parsed.fields()) {
    auto& ranges = schedule[day];
    for (const auto& range : value.list_value().values()) {
      ranges.push_back(range.string_value());
    }
  }
  return schedule;
}

std::string SerializeSchedule(const model::Schedule& schedule) {
  google::protobuf::Struct out;
  for (const auto& [day, ranges] : schedule) {
    auto* list = (*out.mutable_fields())[day].mutable_list_value();
    for (const auto& range : ranges) {
      list->add_values()->set_string_value(range);
    }
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(out, &json);
  if (!status.ok()) {
    throw util::InvalidState("cannot serialize schedule: " + std::string(status.message()));
  }
  return json;
}

// Throws util::InvalidConfig for a row that cannot be turned into a camera.
model::Camera ReadRow(sqlite3_stmt* st) {
  model::Camera camera;
  camera.id   = sqlite3_column_int64(st, 0);
  camera.exid = ColText(st, 1);
  camera.name = ColText(st, 2);

  if (!ColIsNull(st, 3)) {
    camera.vendor = model::Vendor{ColText(st, 3), ColText(st, 4)};
  }

  camera.model_snapshot_path = ColText(st, 5);
  camera.external_host       = ColText(st, 6);
  camera.external_http_port  = static_cast<std::uint32_t>(sqlite3_column_int(st, 7));
  camera.username            = ColText(st, 8);
  camera.password            = ColText(st, 9);
  if (!ColIsNull(st, 10)) {
    camera.timezone = ColText(st, 10);
  }

  if (!ColIsNull(st, 11)) {
    model::CloudRecording recording;
    recording.status           = ColText(st, 11);
    recording.frequency        = sqlite3_column_int(st, 12);
    recording.storage_duration = sqlite3_column_int(st, 13);
    recording.schedule         = ParseSchedule(camera.exid, ColText(st, 14));
    camera.cloud_recording     = std::move(recording);
  }

  return camera;
}

// A malformed row is one bad camera, not an unavailable catalog.
std::optional<model::Camera> ReadRowOrSkip(sqlite3_stmt* st) {
  try {
    return ReadRow(st);
  } catch (const util::InvalidConfig& e) {
    SNAPSHOT_LOG_WARN("Skipping malformed catalog record", {observability::CameraField(ColText(st, 1)), observability::StringField("error", e.what())});
    return std::nullopt;
  }
}

} // namespace

SqliteCatalog::SqliteCatalog(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteCatalog::EnsureSchema() {
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS cameras ("
      "id INTEGER PRIMARY KEY, exid TEXT NOT NULL UNIQUE, name TEXT NOT NULL DEFAULT '', "
      "vendor_exid TEXT, vendor_name TEXT, model_snapshot_path TEXT NOT NULL DEFAULT '', "
      "external_host TEXT NOT NULL DEFAULT '', external_http_port INTEGER NOT NULL DEFAULT 0, "
      "username TEXT NOT NULL DEFAULT '', password TEXT NOT NULL DEFAULT '', timezone TEXT, "
      "cloud_recording_status TEXT, cloud_recording_frequency INTEGER, "
      "cloud_recording_storage_duration INTEGER, cloud_recording_schedule TEXT);");
}

std::vector<model::Camera> SqliteCatalog::ListAll() {
  sqlite3_stmt* st = db_->Prepare(std::string(kSelectColumns) + " ORDER BY id;");

  std::vector<model::Camera> cameras;
  int                        rc = SQLITE_OK;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    if (auto camera = ReadRowOrSkip(st)) {
      cameras.push_back(std::move(*camera));
    }
  }
  sqlite3_finalize(st);

  if (rc != SQLITE_DONE) {
    throw util::CatalogUnavailable(std::string("listing cameras failed: ") + sqlite3_errmsg(db_->Handle()));
  }
  return cameras;
}

std::optional<model::Camera> SqliteCatalog::Get(const std::string& exid) {
  sqlite3_stmt* st = db_->Prepare(std::string(kSelectColumns) + " WHERE exid=?;");
  BindText(st, 1, exid);

  std::optional<model::Camera> camera;
  int                          rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) camera = ReadRowOrSkip(st);
  sqlite3_finalize(st);

  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw util::CatalogUnavailable("reading camera " + exid + " failed: " + sqlite3_errmsg(db_->Handle()));
  }
  return camera;
}

void SqliteCatalog::Upsert(const model::Camera& camera) {
  sqlite3_stmt* st = db_->Prepare(
      "INSERT INTO cameras(id,exid,name,vendor_exid,vendor_name,model_snapshot_path,external_host,external_http_port,"
      "username,password,timezone,cloud_recording_status,cloud_recording_frequency,cloud_recording_storage_duration,"
      "cloud_recording_schedule) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
      "ON CONFLICT(exid) DO UPDATE SET id=excluded.id,name=excluded.name,vendor_exid=excluded.vendor_exid,"
      "vendor_name=excluded.vendor_name,model_snapshot_path=excluded.model_snapshot_path,"
      "external_host=excluded.external_host,external_http_port=excluded.external_http_port,"
      "username=excluded.username,password=excluded.password,timezone=excluded.timezone,"
      "cloud_recording_status=excluded.cloud_recording_status,cloud_recording_frequency=excluded.cloud_recording_frequency,"
      "cloud_recording_storage_duration=excluded.cloud_recording_storage_duration,"
      "cloud_recording_schedule=excluded.cloud_recording_schedule;");

  sqlite3_bind_int64(st, 1, camera.id);
  BindText(st, 2, camera.exid);
  BindText(st, 3, camera.name);
  if (camera.vendor) {
    BindText(st, 4, camera.vendor->exid);
    BindText(st, 5, camera.vendor->name);
  } else {
    sqlite3_bind_null(st, 4);
    sqlite3_bind_null(st, 5);
  }
  BindText(st, 6, camera.model_snapshot_path);
  BindText(st, 7, camera.external_host);
  sqlite3_bind_int(st, 8, static_cast<int>(camera.external_http_port));
  BindText(st, 9, camera.username);
  BindText(st, 10, camera.password);
  BindOptionalText(st, 11, camera.timezone);

  std::string schedule_json;
  if (camera.cloud_recording) {
    try {
      schedule_json = SerializeSchedule(camera.cloud_recording->schedule);
    } catch (const util::InvalidState&) {
      sqlite3_finalize(st);
      throw;
    }
    BindText(st, 12, camera.cloud_recording->status);
    sqlite3_bind_int(st, 13, camera.cloud_recording->frequency);
    sqlite3_bind_int(st, 14, camera.cloud_recording->storage_duration);
    BindText(st, 15, schedule_json);
  } else {
    for (int idx = 12; idx <= 15; ++idx) sqlite3_bind_null(st, idx);
  }

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) {
    throw util::CatalogUnavailable("storing camera " + camera.exid + " failed: " + sqlite3_errmsg(db_->Handle()));
  }
}

} // namespace snapshot::catalog::sqlite
